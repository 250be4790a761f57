#pragma once
#include "clauses/Clause.hpp"
#include "search/SimilarityIndex.hpp"
#include "search/Vectorizer.hpp"
#include "search/VectorizerProvider.hpp"
#include <memory>
#include <unordered_map>
#include <vector>

namespace clausefind {

// Clauses of one document, the vectorizer fitted to them and their vectors.
// Built once, never mutated; shared by reference between readers.
class CorpusIndex {
    // only build() can name this, so only build() can construct
    struct BuildKey { explicit BuildKey() {} };

public:
    // Tries the provider's preferred backend and falls back to tf-idf if the
    // dense one fails. An empty clause list gives an empty (but valid) index.
    // Throws std::invalid_argument on duplicate clause ids.
    static std::shared_ptr<const CorpusIndex> build(std::vector<Clause> clauses,
                                                    const VectorizerProvider& provider);

    Backend backend() const { return m_vectorizer->backend(); }

    const std::vector<Clause>& clauses() const { return m_clauses; }
    const Clause* find(uint32_t clause_id) const;

    size_t size() const { return m_clauses.size(); }
    bool empty() const { return m_clauses.empty(); }

    const Vectorizer& vectorizer() const { return *m_vectorizer; }
    const SimilarityIndex& similarity() const { return m_similarity; }

    CorpusIndex(BuildKey,
                std::vector<Clause> clauses,
                std::unique_ptr<Vectorizer> vectorizer,
                CorpusVectors vectors);

private:

    std::vector<Clause> m_clauses;
    std::unordered_map<uint32_t, size_t> m_pos;  // clause id -> position in m_clauses
    std::unique_ptr<Vectorizer> m_vectorizer;
    SimilarityIndex m_similarity;
};

using IndexHandle = std::shared_ptr<const CorpusIndex>;

}  // namespace clausefind
