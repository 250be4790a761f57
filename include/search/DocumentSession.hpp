#pragma once
#include "clauses/SectionSegmenter.hpp"
#include "search/CorpusIndex.hpp"
#include "search/RetrievalEngine.hpp"
#include "search/VectorizerProvider.hpp"
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace clausefind {

// Results together with the snapshot they were computed on, so clause ids
// stay resolvable after a newer document has been swapped in.
struct Retrieval {
    IndexHandle index;
    std::vector<RetrievalResult> results;

    const Clause* clause(const RetrievalResult& r) const { return index ? index->find(r.clause_id) : nullptr; }
};

// The "currently loaded document" of one user session. A new document is
// indexed off to the side and published with an atomic pointer swap; queries
// already running keep the snapshot they started with.
class DocumentSession {
public:
    DocumentSession(SegmenterConfig seg_cfg, std::shared_ptr<const VectorizerProvider> provider);

    // Segments and indexes the pages, then publishes the new index.
    // Throws InputError if the pages yield no clauses; the previous index stays.
    IndexHandle ingest(const std::vector<PageText>& pages);

    // ingest() on a worker thread. The worker uses this session: the session
    // must outlive the returned future, so get() or wait() on it before the
    // session is destroyed.
    std::future<IndexHandle> ingest_async(std::vector<PageText> pages);

    IndexHandle snapshot() const;

    // empty results (and a null index) before the first successful ingest
    Retrieval retrieve(const std::string& query, size_t k) const;

    void clear();

private:
    SegmenterConfig m_seg_cfg;
    std::shared_ptr<const VectorizerProvider> m_provider;
    IndexHandle m_current;  // accessed only through std::atomic_load / atomic_store
};

}  // namespace clausefind
