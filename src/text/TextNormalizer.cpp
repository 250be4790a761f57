#include "text/TextNormalizer.hpp"
#include <cctype>

namespace clausefind {

static bool is_alpha(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

static bool is_lower(char c) {
    return std::islower(static_cast<unsigned char>(c)) != 0;
}

std::string TextNormalizer::clean_chars(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());

    for (size_t i = 0; i < raw.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(raw[i]);

        if (c == '\r') {
            // CRLF -> LF, lone CR -> LF
            if (i + 1 < raw.size() && raw[i + 1] == '\n') continue;
            out.push_back('\n');
        } else if (c == '\n') {
            out.push_back('\n');
        } else if (c == '\t' || c == '\f' || c == '\v') {
            out.push_back(' ');
        } else if (c == 0xC2 && i + 1 < raw.size() && static_cast<unsigned char>(raw[i + 1]) == 0xA0) {
            // UTF-8 no-break space
            out.push_back(' ');
            ++i;
        } else if (c < 0x20 || c == 0x7F) {
            continue;
        } else {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

std::string TextNormalizer::dehyphenate(const std::string& s) {
    std::string out;
    out.reserve(s.size());

    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '-' && !out.empty() && is_alpha(out.back())) {
            // look past trailing spaces, one newline, leading spaces
            size_t j = i + 1;
            while (j < s.size() && s[j] == ' ') ++j;
            if (j < s.size() && s[j] == '\n') {
                size_t k = j + 1;
                while (k < s.size() && s[k] == ' ') ++k;
                if (k < s.size() && is_lower(s[k])) {
                    i = k - 1;  // drop "-", spaces, newline; resume at the word tail
                    continue;
                }
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

std::string TextNormalizer::collapse_spaces(const std::string& line) {
    std::string out;
    out.reserve(line.size());
    bool prev_space = true;  // also trims leading spaces

    for (char c : line) {
        if (c == ' ') {
            if (!prev_space) out.push_back(' ');
            prev_space = true;
        } else {
            out.push_back(c);
            prev_space = false;
        }
    }
    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

std::vector<std::string> TextNormalizer::split_lines(const std::string& normalized) {
    std::vector<std::string> lines;
    if (normalized.empty()) return lines;

    std::string cur;
    for (char ch : normalized) {
        if (ch == '\n') {
            lines.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(ch);
        }
    }
    lines.push_back(cur);
    return lines;
}

std::string TextNormalizer::normalize(const std::string& raw) const {
    const std::string joined = dehyphenate(clean_chars(raw));

    std::string out;
    out.reserve(joined.size());
    bool pending_blank = false;

    size_t start = 0;
    while (start <= joined.size()) {
        size_t end = joined.find('\n', start);
        if (end == std::string::npos) end = joined.size();

        std::string line = collapse_spaces(joined.substr(start, end - start));
        if (line.empty()) {
            pending_blank = !out.empty();
        } else {
            if (!out.empty()) out += pending_blank ? "\n\n" : "\n";
            out += line;
            pending_blank = false;
        }
        start = end + 1;
    }
    return out;
}

}  // namespace clausefind
