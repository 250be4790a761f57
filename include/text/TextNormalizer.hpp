#pragma once
#include <string>
#include <vector>

namespace clausefind {

// Cleans one page of extracted PDF text:
//  - CRLF / CR -> LF, tabs / form feeds / NBSP -> space, other controls dropped
//  - "cover-\nage" style line-break hyphenation rejoined
//  - space runs collapsed, lines trimmed, blank-line runs collapsed to one
// Never throws; garbage in gives (possibly empty) text out.
class TextNormalizer {
public:
    std::string normalize(const std::string& raw) const;

    // normalized text split on '\n' (blank paragraph separators included as "")
    static std::vector<std::string> split_lines(const std::string& normalized);

private:
    static std::string clean_chars(const std::string& raw);
    static std::string dehyphenate(const std::string& s);
    static std::string collapse_spaces(const std::string& line);
};

}  // namespace clausefind
