#include "search/Pipeline.hpp"
#include <utility>

namespace clausefind {

std::vector<Clause> process_document(const std::vector<PageText>& pages, const SegmenterConfig& cfg) {
    SectionSegmenter seg(cfg);
    return seg.segment(pages).release();
}

IndexHandle build_index(std::vector<Clause> clauses, const VectorizerProvider& provider) {
    return CorpusIndex::build(std::move(clauses), provider);
}

IndexHandle build_index(std::vector<Clause> clauses) {
    const VectorizerProvider sparse_only;
    return CorpusIndex::build(std::move(clauses), sparse_only);
}

std::vector<RetrievalResult> retrieve(const IndexHandle& index, const std::string& query, size_t k) {
    return RetrievalEngine(index).retrieve(query, k);
}

}  // namespace clausefind
