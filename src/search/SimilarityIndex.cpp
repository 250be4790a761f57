#include "search/SimilarityIndex.hpp"
#include <algorithm>
#include <utility>

namespace clausefind {

SimilarityIndex::SimilarityIndex(CorpusVectors vectors) {
    m_entries.reserve(vectors.size());
    for (auto& kv : vectors) {
        double n = magnitude(kv.second);
        m_entries.push_back({kv.first, std::move(kv.second), n});
    }
}

bool SimilarityIndex::ranks_before(const ScoredClause& a, const ScoredClause& b) {
    if (a.score != b.score) return a.score > b.score;
    return a.clause_id < b.clause_id;
}

bool SimilarityIndex::contains(uint32_t clause_id) const {
    auto it = std::lower_bound(m_entries.begin(), m_entries.end(), clause_id,
                               [](const Entry& e, uint32_t id) { return e.clause_id < id; });
    return it != m_entries.end() && it->clause_id == clause_id;
}

std::vector<ScoredClause> SimilarityIndex::search(const FeatureVector& query) const {
    std::vector<ScoredClause> hits;
    hits.reserve(m_entries.size());

    const double qn = magnitude(query);
    for (const auto& e : m_entries) {
        double s = 0.0;
        if (qn != 0.0 && e.norm != 0.0) s = cosine(query, e.vec);
        hits.push_back({e.clause_id, s});
    }

    std::sort(hits.begin(), hits.end(), &SimilarityIndex::ranks_before);
    return hits;
}

std::vector<ScoredClause> SimilarityIndex::topk(const FeatureVector& query, size_t k) const {
    auto hits = search(query);
    if (hits.size() > k) hits.resize(k);
    return hits;
}

}  // namespace clausefind
