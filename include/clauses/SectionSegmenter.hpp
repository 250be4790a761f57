#pragma once
#include "clauses/Clause.hpp"
#include "clauses/ClauseStore.hpp"
#include "clauses/HeadingRules.hpp"
#include "text/TextNormalizer.hpp"
#include <string>
#include <vector>

namespace clausefind {

struct SegmenterConfig {
    HeadingRuleConfig headings;
    bool drop_boilerplate = true;                  // page counters, registration / contact lines
    size_t min_body_chars = 0;                     // 0 keeps every non-empty clause
    std::string fallback_title_prefix = "Section"; // "Section 3" for clauses without a heading
};

class SectionSegmenter {
public:
    explicit SectionSegmenter(SegmenterConfig cfg = SegmenterConfig{});

    // Pages are consumed in the order given. Never throws on odd input; an
    // empty page list (or only blank pages) gives an empty store.
    ClauseStore segment(const std::vector<PageText>& pages) const;

    static bool is_boilerplate(const std::string& line);

    const SegmenterConfig& config() const { return m_cfg; }

private:
    SegmenterConfig m_cfg;
    TextNormalizer m_normalizer;

    struct OpenClause {
        bool active = false;
        bool synthesized = false;  // no heading; closes at end of page
        std::string title;
        int page = 0;
        std::vector<std::string> lines;
    };

    // emits the open clause (if it has a body) and resets it; returns true if
    // the clause had body text, whether or not it passed the length filter
    bool flush(OpenClause& open, ClauseStore& store) const;

    std::string fallback_title(const ClauseStore& store) const;
};

}  // namespace clausefind
