#include "search/DenseVectorizer.hpp"
#include "search/Errors.hpp"
#include <utility>

namespace clausefind {

DenseVectorizer::DenseVectorizer(std::shared_ptr<const MiniLmEmbedder> embedder)
    : m_embedder(std::move(embedder)) {}

CorpusVectors DenseVectorizer::vectorize_corpus(const std::vector<Clause>& clauses) {
    if (!m_embedder || !m_embedder->ready()) {
        throw BackendUnavailable("embedder not initialized");
    }

    CorpusVectors out;
    m_dim = 0;

    for (const auto& c : clauses) {
        FeatureVector fv;
        fv.dense = m_embedder->embed(clause_text(c));
        if (fv.dense.empty()) {
            throw BackendUnavailable("failed to embed clause " + std::to_string(c.id));
        }

        if (m_dim == 0) m_dim = fv.dense.size();
        if (fv.dense.size() != m_dim) {
            throw BackendUnavailable("embedding dimension changed at clause " + std::to_string(c.id));
        }

        out.emplace(c.id, std::move(fv));
    }
    return out;
}

FeatureVector DenseVectorizer::vectorize_query(const std::string& text) const {
    FeatureVector fv;
    if (!m_embedder) return fv;

    fv.dense = m_embedder->embed(text);
    if (m_dim != 0 && fv.dense.size() != m_dim) fv.dense.clear();
    return fv;
}

}  // namespace clausefind
