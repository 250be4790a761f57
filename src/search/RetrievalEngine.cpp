#include "search/RetrievalEngine.hpp"
#include "text/TextUtil.hpp"
#include <utility>

namespace clausefind {

RetrievalEngine::RetrievalEngine(IndexHandle index) : m_index(std::move(index)) {}

std::vector<RetrievalResult> RetrievalEngine::retrieve(const std::string& query, size_t k) const {
    std::vector<RetrievalResult> out;
    if (!m_index || m_index->empty() || k == 0) return out;

    const std::string q = textutil::trim(query);
    if (q.empty()) return out;

    FeatureVector qv = m_index->vectorizer().vectorize_query(q);
    auto hits = m_index->similarity().topk(qv, k);

    out.reserve(hits.size());
    for (size_t i = 0; i < hits.size(); ++i) {
        out.push_back({hits[i].clause_id, hits[i].score, i});
    }
    return out;
}

}  // namespace clausefind
