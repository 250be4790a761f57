#pragma once
#include "clauses/Clause.hpp"
#include "search/FeatureVector.hpp"
#include <map>
#include <string>
#include <vector>

namespace clausefind {

using CorpusVectors = std::map<uint32_t, FeatureVector>;  // clause id -> vector

// Turns clauses and queries into comparable vectors. A vectorizer is fitted
// once by vectorize_corpus() and then only used for queries; query vectors
// from one instance are only comparable to that instance's corpus vectors.
class Vectorizer {
public:
    virtual ~Vectorizer() = default;

    virtual Backend backend() const = 0;

    virtual CorpusVectors vectorize_corpus(const std::vector<Clause>& clauses) = 0;
    virtual FeatureVector vectorize_query(const std::string& text) const = 0;

    // what gets vectorized for a clause
    static std::string clause_text(const Clause& c) {
        if (c.title.empty()) return c.body;
        if (c.body.empty()) return c.title;
        return c.title + " " + c.body;
    }
};

}  // namespace clausefind
