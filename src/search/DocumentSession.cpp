#include "search/DocumentSession.hpp"
#include "search/Errors.hpp"
#include "search/Pipeline.hpp"
#include <atomic>
#include <stdexcept>
#include <utility>

namespace clausefind {

DocumentSession::DocumentSession(SegmenterConfig seg_cfg, std::shared_ptr<const VectorizerProvider> provider)
    : m_seg_cfg(std::move(seg_cfg)), m_provider(std::move(provider)) {
    if (!m_provider) throw std::invalid_argument("DocumentSession: null vectorizer provider");
}

IndexHandle DocumentSession::ingest(const std::vector<PageText>& pages) {
    std::vector<Clause> clauses = process_document(pages, m_seg_cfg);
    if (clauses.empty()) throw InputError("no extractable text");

    IndexHandle next = build_index(std::move(clauses), *m_provider);
    std::atomic_store(&m_current, next);
    return next;
}

std::future<IndexHandle> DocumentSession::ingest_async(std::vector<PageText> pages) {
    return std::async(std::launch::async, [this, pages = std::move(pages)]() {
        return ingest(pages);
    });
}

IndexHandle DocumentSession::snapshot() const {
    return std::atomic_load(&m_current);
}

Retrieval DocumentSession::retrieve(const std::string& query, size_t k) const {
    Retrieval r;
    r.index = snapshot();
    r.results = RetrievalEngine(r.index).retrieve(query, k);
    return r;
}

void DocumentSession::clear() {
    std::atomic_store(&m_current, IndexHandle{});
}

}  // namespace clausefind
