#pragma once
#include "emb/MiniLmEmbedder.hpp"
#include "search/Vectorizer.hpp"
#include <memory>

namespace clausefind {

class DenseVectorizer final : public Vectorizer {
public:
    explicit DenseVectorizer(std::shared_ptr<const MiniLmEmbedder> embedder);

    Backend backend() const override { return Backend::Dense; }

    // throws BackendUnavailable if any clause cannot be embedded
    CorpusVectors vectorize_corpus(const std::vector<Clause>& clauses) override;

    // empty (zero) vector if the query cannot be embedded
    FeatureVector vectorize_query(const std::string& text) const override;

    size_t dim() const { return m_dim; }

private:
    std::shared_ptr<const MiniLmEmbedder> m_embedder;
    size_t m_dim = 0;
};

}  // namespace clausefind
