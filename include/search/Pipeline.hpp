#pragma once
#include "clauses/Clause.hpp"
#include "clauses/SectionSegmenter.hpp"
#include "search/CorpusIndex.hpp"
#include "search/RetrievalEngine.hpp"
#include "search/VectorizerProvider.hpp"
#include <string>
#include <vector>

namespace clausefind {

// pages -> clauses; empty input gives an empty list
std::vector<Clause> process_document(const std::vector<PageText>& pages,
                                     const SegmenterConfig& cfg = SegmenterConfig{});

IndexHandle build_index(std::vector<Clause> clauses, const VectorizerProvider& provider);

// tf-idf only
IndexHandle build_index(std::vector<Clause> clauses);

// null handle, blank query or k == 0 -> empty
std::vector<RetrievalResult> retrieve(const IndexHandle& index, const std::string& query, size_t k);

}  // namespace clausefind
