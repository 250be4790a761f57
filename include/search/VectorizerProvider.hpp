#pragma once
#include "emb/MiniLmEmbedder.hpp"
#include "search/TfidfVectorizer.hpp"
#include "search/Vectorizer.hpp"
#include <memory>

namespace clausefind {

// Hands out a fresh vectorizer per index build. The embedding model is loaded
// once and shared by every dense vectorizer it creates. make_preferred() and
// make_sparse() may be overridden to plug in another backend.
class VectorizerProvider {
public:
    explicit VectorizerProvider(TfidfConfig tfidf = TfidfConfig{});
    virtual ~VectorizerProvider() = default;

    // Loads the dense backend; on failure the provider stays sparse-only.
    bool load_dense(const EmbedderConfig& cfg);

    bool dense_available() const { return m_embedder != nullptr; }

    // dense when available, tf-idf otherwise
    virtual std::unique_ptr<Vectorizer> make_preferred() const;
    virtual std::unique_ptr<Vectorizer> make_sparse() const;

    const TfidfConfig& tfidf_config() const { return m_tfidf; }

private:
    TfidfConfig m_tfidf;
    std::shared_ptr<const MiniLmEmbedder> m_embedder;
};

}  // namespace clausefind
