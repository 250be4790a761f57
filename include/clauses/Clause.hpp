#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace clausefind {

// One page of extracted text as handed over by the PDF text layer.
struct PageText {
    int page = 0;          // 1-based
    std::string text;      // raw, un-normalized
};

struct Clause {
    uint32_t id = 0;       // position in reading order
    std::string title;     // heading line, or "Section N" when none matched
    std::string body;      // normalized text under the heading
    int page = 0;          // page of the heading (1-based)
};

inline bool same_content(const Clause& a, const Clause& b) {
    return a.page == b.page && a.title == b.title && a.body == b.body;
}

}  // namespace clausefind
