#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <vector>

#include "search/TfidfVectorizer.hpp"

using namespace clausefind;

static std::vector<Clause> sample_clauses() {
    return {
        Clause{0, "1. Coverage", "Hospitalisation expenses are covered up to the sum insured.", 1},
        Clause{1, "2. Exclusions", "Pre-existing diseases are excluded for the first 48 months.", 1},
        Clause{2, "3. Ambulance", "Emergency ambulance charges are covered up to Rs 2000 per hospitalisation.", 2},
    };
}

TEST(TfidfVectorizer, TermsIncludeFoldedUnigramsAndBigrams) {
    TfidfVectorizer v;
    auto terms = v.terms_of("Pre-existing diseases are excluded");
    auto has = [&](const std::string& t) { return std::find(terms.begin(), terms.end(), t) != terms.end(); };

    EXPECT_TRUE(has("preexisting"));
    EXPECT_TRUE(has("diseases"));
    EXPECT_TRUE(has("excluded"));
    EXPECT_TRUE(has("preexisting diseases"));
    EXPECT_TRUE(has("diseases excluded"));
    EXPECT_FALSE(has("are"));
}

TEST(TfidfVectorizer, BigramsCanBeDisabled) {
    TfidfConfig cfg;
    cfg.bigrams = false;
    TfidfVectorizer v(cfg);
    auto terms = v.terms_of("Pre-existing diseases are excluded");
    std::vector<std::string> expected = {"preexisting", "diseases", "excluded"};
    EXPECT_EQ(terms, expected);
}

TEST(TfidfVectorizer, BuildsOneVectorPerClause) {
    TfidfVectorizer v;
    auto vecs = v.vectorize_corpus(sample_clauses());

    ASSERT_EQ(vecs.size(), 3u);
    for (const auto& kv : vecs) {
        EXPECT_FALSE(kv.second.sparse.empty());
        EXPECT_TRUE(kv.second.dense.empty());
        // sorted, unique term ids
        for (size_t i = 1; i < kv.second.sparse.size(); ++i) {
            EXPECT_LT(kv.second.sparse[i - 1].first, kv.second.sparse[i].first);
        }
    }
    EXPECT_TRUE(v.has_term("hospitalization"));
    EXPECT_FALSE(v.has_term("hospitalisation"));
    EXPECT_FALSE(v.has_term("the"));
    EXPECT_EQ(v.backend(), Backend::Sparse);
}

TEST(TfidfVectorizer, UnknownQueryTermsHaveNoWeight) {
    TfidfVectorizer v;
    v.vectorize_corpus(sample_clauses());

    EXPECT_TRUE(v.vectorize_query("zebra unicorn").is_zero());
    EXPECT_FALSE(v.vectorize_query("ambulance zebra").is_zero());
    EXPECT_EQ(v.vectorize_query("ambulance zebra").sparse.size(), 1u);
}

TEST(TfidfVectorizer, RareTermsWeighMore) {
    TfidfVectorizer v;
    v.vectorize_corpus(sample_clauses());

    // "covered" is in two clauses, "ambulance" in one
    auto common = v.vectorize_query("covered");
    auto rare = v.vectorize_query("ambulance");
    ASSERT_EQ(common.sparse.size(), 1u);
    ASSERT_EQ(rare.sparse.size(), 1u);
    EXPECT_GT(rare.sparse[0].second, common.sparse[0].second);
}

TEST(TfidfVectorizer, FeatureCapKeepsMostFrequentTerms) {
    TfidfConfig cfg;
    cfg.max_features = 3;
    TfidfVectorizer v(cfg);
    v.vectorize_corpus(sample_clauses());

    EXPECT_EQ(v.vocabulary_size(), 3u);
    // appears three times across the corpus
    EXPECT_TRUE(v.has_term("covered") || v.has_term("hospitalization"));
}

TEST(TfidfVectorizer, EmptyCorpusGivesEmptyVocabulary) {
    TfidfVectorizer v;
    auto vecs = v.vectorize_corpus({});
    EXPECT_TRUE(vecs.empty());
    EXPECT_EQ(v.vocabulary_size(), 0u);
    EXPECT_TRUE(v.vectorize_query("anything").is_zero());
}

TEST(TfidfVectorizer, RebuildIsDeterministic) {
    TfidfVectorizer a, b;
    auto va = a.vectorize_corpus(sample_clauses());
    auto vb = b.vectorize_corpus(sample_clauses());

    ASSERT_EQ(va.size(), vb.size());
    for (const auto& kv : va) {
        EXPECT_EQ(kv.second.sparse, vb.at(kv.first).sparse);
    }
    EXPECT_EQ(a.vectorize_query("ambulance charges").sparse, b.vectorize_query("ambulance charges").sparse);
}
