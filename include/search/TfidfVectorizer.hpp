#pragma once
#include "search/Vectorizer.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace clausefind {

struct TfidfConfig {
    size_t max_features = 1000;   // 0 = unlimited
    bool bigrams = true;
    bool drop_stop_words = true;
};

// Sparse fallback. The vocabulary is built from the corpus passed to
// vectorize_corpus(); query terms outside it are ignored.
class TfidfVectorizer final : public Vectorizer {
public:
    explicit TfidfVectorizer(TfidfConfig cfg = TfidfConfig{});

    Backend backend() const override { return Backend::Sparse; }

    CorpusVectors vectorize_corpus(const std::vector<Clause>& clauses) override;
    FeatureVector vectorize_query(const std::string& text) const override;

    size_t vocabulary_size() const { return m_terms.size(); }
    bool has_term(const std::string& term) const { return m_term_to_id.count(term) != 0; }

    // unigrams (+ "a b" bigrams) after normalization
    std::vector<std::string> terms_of(const std::string& text) const;

private:
    TfidfConfig m_cfg;

    // vocab
    std::vector<std::string> m_terms;             // term_id -> term
    std::vector<double> m_idf;                    // term_id -> idf
    std::unordered_map<std::string, uint32_t> m_term_to_id;

    FeatureVector weigh(const std::vector<std::string>& terms) const;
};

}  // namespace clausefind
