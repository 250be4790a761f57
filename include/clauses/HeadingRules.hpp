#pragma once
#include <cstddef>
#include <string>

namespace clausefind {

enum class HeadingKind {
    None,
    Numbered,   // "1. Coverage", "2.3 Waiting Period", "(iv) Ambulance", "Section 4 Claims"
    UpperCase,  // "GENERAL EXCLUSIONS"
    Keyword,    // "Definitions", "Claim Procedure:"
};

const char* heading_kind_name(HeadingKind kind);

struct HeadingRuleConfig {
    size_t max_heading_chars = 80;
    size_t max_heading_words = 8;
};

// Each rule is a pure predicate over one trimmed line. classify() applies the
// shape pre-check, then the rules in precedence order; first match wins.
namespace headings {

// short enough, non-empty, no trailing sentence punctuation
bool passes_shape_check(const std::string& line, const HeadingRuleConfig& cfg);

HeadingKind match_numbered(const std::string& line, const HeadingRuleConfig& cfg);
HeadingKind match_upper_case(const std::string& line, const HeadingRuleConfig& cfg);
HeadingKind match_keyword(const std::string& line, const HeadingRuleConfig& cfg);

HeadingKind classify(const std::string& line, const HeadingRuleConfig& cfg);

// length of the leading section marker ("1.", "2.3", "(a)", "Section 4:"), 0 if none
size_t numbered_marker_length(const std::string& line);

}  // namespace headings
}  // namespace clausefind
