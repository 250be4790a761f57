#pragma once
#include "search/CorpusIndex.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace clausefind {

struct RetrievalResult {
    uint32_t clause_id = 0;
    double score = 0.0;   // higher = more relevant
    size_t rank = 0;      // 0-based
};

// Top-k retrieval against one built index. Stateless apart from the index
// it holds, so one engine can serve concurrent queries.
class RetrievalEngine {
public:
    explicit RetrievalEngine(IndexHandle index);

    // min(k, corpus size) results, non-increasing score, ties by clause id.
    // Blank queries and k == 0 give no results.
    std::vector<RetrievalResult> retrieve(const std::string& query, size_t k) const;

    const IndexHandle& index() const { return m_index; }

private:
    IndexHandle m_index;
};

}  // namespace clausefind
