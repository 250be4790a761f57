#include "search/EvidenceContext.hpp"
#include <sstream>

namespace clausefind {

std::string format_evidence(const CorpusIndex& index, const std::vector<RetrievalResult>& results) {
    std::ostringstream out;
    size_t n = 0;
    for (const auto& r : results) {
        const Clause* c = index.find(r.clause_id);
        if (!c) continue;

        out << "Clause " << ++n << ": " << c->title << " (Page " << c->page << ")\n"
            << c->body << "\n\n";
    }
    return out.str();
}

}  // namespace clausefind
