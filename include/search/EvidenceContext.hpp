#pragma once
#include "search/CorpusIndex.hpp"
#include "search/RetrievalEngine.hpp"
#include <string>
#include <vector>

namespace clausefind {

// Ranked clauses rendered as the evidence block handed to the decision step:
//
//   Clause 1: 1. Coverage (Page 1)
//   Dental treatment is covered up to Rs 50000 per year.
//
// Results whose clause id is not in the index are skipped.
std::string format_evidence(const CorpusIndex& index, const std::vector<RetrievalResult>& results);

}  // namespace clausefind
