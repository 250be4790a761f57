#include "search/CorpusIndex.hpp"
#include "search/Errors.hpp"
#include <iostream>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace clausefind {

CorpusIndex::CorpusIndex(BuildKey,
                         std::vector<Clause> clauses,
                         std::unique_ptr<Vectorizer> vectorizer,
                         CorpusVectors vectors)
    : m_clauses(std::move(clauses)),
      m_vectorizer(std::move(vectorizer)),
      m_similarity(std::move(vectors)) {
    m_pos.reserve(m_clauses.size());
    for (size_t i = 0; i < m_clauses.size(); ++i) m_pos.emplace(m_clauses[i].id, i);
}

const Clause* CorpusIndex::find(uint32_t clause_id) const {
    auto it = m_pos.find(clause_id);
    return it == m_pos.end() ? nullptr : &m_clauses[it->second];
}

std::shared_ptr<const CorpusIndex> CorpusIndex::build(std::vector<Clause> clauses,
                                                      const VectorizerProvider& provider) {
    std::unordered_set<uint32_t> ids;
    ids.reserve(clauses.size());
    for (const auto& c : clauses) {
        if (!ids.insert(c.id).second) {
            throw std::invalid_argument("duplicate clause id: " + std::to_string(c.id));
        }
    }

    std::unique_ptr<Vectorizer> vec = provider.make_preferred();
    CorpusVectors vectors;

    try {
        vectors = vec->vectorize_corpus(clauses);
    } catch (const BackendUnavailable& e) {
        std::cerr << "CorpusIndex: " << backend_name(vec->backend()) << " backend failed ("
                  << e.what() << "), rebuilding with tf-idf\n";
        vec = provider.make_sparse();
        vectors = vec->vectorize_corpus(clauses);
    }

    return std::make_shared<CorpusIndex>(BuildKey{}, std::move(clauses), std::move(vec),
                                         std::move(vectors));
}

}  // namespace clausefind
