#include "clauses/HeadingRules.hpp"
#include "text/TextUtil.hpp"
#include <cctype>
#include <unordered_set>

namespace clausefind {

const char* heading_kind_name(HeadingKind kind) {
    switch (kind) {
        case HeadingKind::Numbered:  return "numbered";
        case HeadingKind::UpperCase: return "uppercase";
        case HeadingKind::Keyword:   return "keyword";
        case HeadingKind::None:      break;
    }
    return "none";
}

namespace headings {

static bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
static bool is_upper(char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; }
static bool is_lower(char c) { return std::islower(static_cast<unsigned char>(c)) != 0; }
static bool is_alpha(char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0; }

static size_t count_words(const std::string& s) {
    size_t n = 0;
    bool in_word = false;
    for (char c : s) {
        if (c == ' ') {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++n;
        }
    }
    return n;
}

bool passes_shape_check(const std::string& line, const HeadingRuleConfig& cfg) {
    if (line.empty() || line.size() > cfg.max_heading_chars) return false;

    char last = line.back();
    return !(last == '.' || last == '!' || last == '?' || last == ';' || last == ',');
}

// "12" / "2.3" / "2.3.1" followed by "." or ")" (or a dotted group on its own)
static size_t digit_marker(const std::string& s) {
    size_t i = 0;
    size_t groups = 0;
    while (true) {
        size_t start = i;
        while (i < s.size() && is_digit(s[i]) && i - start < 3) ++i;
        if (i == start) break;
        ++groups;
        if (i + 1 < s.size() && s[i] == '.' && is_digit(s[i + 1])) {
            ++i;
            continue;
        }
        break;
    }
    if (groups == 0) return 0;
    if (i < s.size() && (s[i] == '.' || s[i] == ')')) return i + 1;
    return groups > 1 ? i : 0;
}

// "A." / "B)"
static size_t letter_marker(const std::string& s) {
    if (s.size() >= 2 && is_upper(s[0]) && (s[1] == '.' || s[1] == ')')) return 2;
    return 0;
}

// "(a)" / "(iv)" / "(3)"
static size_t paren_marker(const std::string& s) {
    if (s.empty() || s[0] != '(') return 0;
    size_t i = 1;
    while (i < s.size() && i <= 5 && (is_lower(s[i]) || is_digit(s[i]))) ++i;
    if (i == 1 || i >= s.size() || s[i] != ')') return 0;
    return i + 1;
}

// "Section 4", "CLAUSE 2.1:", "Part II -"
static size_t word_marker(const std::string& s) {
    static const char* words[] = {"section", "clause", "article", "part", "schedule", "chapter"};

    size_t sp = s.find(' ');
    if (sp == std::string::npos) return 0;
    const std::string head = textutil::to_lower_ascii(s.substr(0, sp));

    bool known = false;
    for (const char* w : words) {
        if (head == w) { known = true; break; }
    }
    if (!known) return 0;

    size_t i = sp + 1;
    size_t start = i;
    while (i < s.size() && (is_digit(s[i]) || s[i] == '.' ||
                            s[i] == 'I' || s[i] == 'V' || s[i] == 'X')) ++i;
    if (i == start) return 0;
    if (i < s.size() && (s[i] == ':' || s[i] == ')')) ++i;
    if (i + 1 < s.size() && s[i] == ' ' && s[i + 1] == '-') i += 2;
    return i;
}

size_t numbered_marker_length(const std::string& line) {
    if (size_t n = digit_marker(line)) return n;
    if (size_t n = letter_marker(line)) return n;
    if (size_t n = paren_marker(line)) return n;
    return word_marker(line);
}

HeadingKind match_numbered(const std::string& line, const HeadingRuleConfig&) {
    size_t m = numbered_marker_length(line);
    if (m == 0) return HeadingKind::None;

    // "Section 4" on its own is a heading; a bare "A)" or "2.3" is not
    if (m == line.size()) return word_marker(line) == m ? HeadingKind::Numbered : HeadingKind::None;

    if (line[m] != ' ') return HeadingKind::None;
    size_t i = m;
    while (i < line.size() && line[i] == ' ') ++i;
    if (i >= line.size()) return HeadingKind::None;

    // title text has to start like a title
    return (is_upper(line[i]) || is_digit(line[i])) ? HeadingKind::Numbered : HeadingKind::None;
}

HeadingKind match_upper_case(const std::string& line, const HeadingRuleConfig& cfg) {
    size_t letters = 0;
    for (char c : line) {
        if (is_lower(c)) return HeadingKind::None;
        if (is_alpha(c)) ++letters;
    }
    if (letters < 2) return HeadingKind::None;
    if (count_words(line) > cfg.max_heading_words) return HeadingKind::None;

    // "AND", "OF THE" and friends are shouting, not headings
    auto toks = textutil::tokenize(textutil::normalize(line));
    bool any_content = false;
    for (const auto& t : toks) {
        if (!textutil::is_stop_word(t)) { any_content = true; break; }
    }
    return any_content ? HeadingKind::UpperCase : HeadingKind::None;
}

HeadingKind match_keyword(const std::string& line, const HeadingRuleConfig& cfg) {
    static const std::unordered_set<std::string> labels = {
        "definitions", "definition", "exclusions", "general exclusions", "specific exclusions",
        "standard exclusions", "permanent exclusions", "coverage", "scope of cover",
        "scope of coverage", "benefits", "schedule of benefits", "table of benefits",
        "claim procedure", "claims procedure", "claim process", "claim settlement",
        "claims", "waiting period", "waiting periods", "conditions", "general conditions",
        "conditions precedent", "sum insured", "premium", "premium payment", "renewal",
        "cancellation", "free look period", "portability", "migration",
        "grievance redressal", "grievance redressal procedure", "preamble",
        "operative clause", "policy period", "territorial limits", "co-payment",
        "deductible", "moratorium period", "notice of claim", "documents required",
        "cashless facility", "reimbursement", "arbitration", "disclaimer",
    };

    if (count_words(line) > cfg.max_heading_words) return HeadingKind::None;

    std::string key = textutil::to_lower_ascii(line);
    if (!key.empty() && key.back() == ':') key.pop_back();
    key = textutil::trim(key);

    return labels.count(key) ? HeadingKind::Keyword : HeadingKind::None;
}

namespace {

using HeadingRule = HeadingKind (*)(const std::string&, const HeadingRuleConfig&);

// precedence order
const HeadingRule kRules[] = {
    &match_numbered,
    &match_upper_case,
    &match_keyword,
};

}  // namespace

HeadingKind classify(const std::string& line, const HeadingRuleConfig& cfg) {
    if (!passes_shape_check(line, cfg)) return HeadingKind::None;

    for (const auto& rule : kRules) {
        HeadingKind k = rule(line, cfg);
        if (k != HeadingKind::None) return k;
    }
    return HeadingKind::None;
}

}  // namespace headings
}  // namespace clausefind
