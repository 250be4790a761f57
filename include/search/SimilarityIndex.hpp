#pragma once
#include "search/FeatureVector.hpp"
#include "search/Vectorizer.hpp"
#include <cstdint>
#include <vector>

namespace clausefind {

struct ScoredClause {
    uint32_t clause_id;
    double score;
};

// Exact cosine search over a few hundred vectors. Immutable after construction.
class SimilarityIndex {
public:
    SimilarityIndex() = default;
    explicit SimilarityIndex(CorpusVectors vectors);

    // every stored vector, by descending score then ascending clause id
    std::vector<ScoredClause> search(const FeatureVector& query) const;

    // first k of search()
    std::vector<ScoredClause> topk(const FeatureVector& query, size_t k) const;

    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }
    bool contains(uint32_t clause_id) const;

private:
    struct Entry {
        uint32_t clause_id;
        FeatureVector vec;
        double norm;
    };
    std::vector<Entry> m_entries;  // ascending clause id

    static bool ranks_before(const ScoredClause& a, const ScoredClause& b);
};

}  // namespace clausefind
