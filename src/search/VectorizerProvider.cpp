#include "search/VectorizerProvider.hpp"
#include "search/DenseVectorizer.hpp"
#include <iostream>

namespace clausefind {

VectorizerProvider::VectorizerProvider(TfidfConfig tfidf) : m_tfidf(tfidf) {}

bool VectorizerProvider::load_dense(const EmbedderConfig& cfg) {
    auto emb = std::make_shared<MiniLmEmbedder>();
    if (!emb->init(cfg)) {
        std::cerr << "VectorizerProvider: dense backend unavailable, using tf-idf\n";
        m_embedder.reset();
        return false;
    }
    m_embedder = std::move(emb);
    return true;
}

std::unique_ptr<Vectorizer> VectorizerProvider::make_preferred() const {
    if (m_embedder) return std::make_unique<DenseVectorizer>(m_embedder);
    return make_sparse();
}

std::unique_ptr<Vectorizer> VectorizerProvider::make_sparse() const {
    return std::make_unique<TfidfVectorizer>(m_tfidf);
}

}  // namespace clausefind
