#include "text/TextUtil.hpp"
#include <cctype>
#include <unordered_map>
#include <unordered_set>

namespace clausefind {
namespace textutil {

std::string normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool prev_space = true;

    for (unsigned char ch : s) {
        unsigned char c = static_cast<unsigned char>(std::tolower(ch));

        bool keep = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');

        if (keep) {
            out.push_back(static_cast<char>(c));
            prev_space = false;
        } else {
            if (!prev_space) {
                out.push_back(' ');
                prev_space = true;
            }
        }
    }

    // trim trailing space
    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

std::vector<std::string> tokenize(const std::string& normalized) {
    std::vector<std::string> tokens;
    std::string cur;

    for (char c : normalized) {
        if (c == ' ') {
            if (cur.size() >= 2) tokens.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (cur.size() >= 2) tokens.push_back(cur);
    return tokens;
}

std::vector<std::string> normalize_tokens(const std::vector<std::string>& tokens) {
    // British / Indian-English spellings common in policy wordings
    static const std::unordered_map<std::string, std::string> fold = {
        {"hospitalisation", "hospitalization"},
        {"hospitalised", "hospitalized"},
        {"hospitalise", "hospitalize"},
        {"authorisation", "authorization"},
        {"authorised", "authorized"},
        {"organisation", "organization"},
        {"recognised", "recognized"},
        {"paediatric", "pediatric"},
        {"haemodialysis", "hemodialysis"},
        {"programme", "program"},
        {"cheque", "check"},
        {"copay", "copayment"},
        {"rs", "rupees"},
        {"inr", "rupees"},
    };

    std::vector<std::string> out;
    out.reserve(tokens.size());

    for (size_t i = 0; i < tokens.size(); ++i) {
        const std::string& t = tokens[i];

        // phrase merging (2-grams split by normalize())
        if (i + 1 < tokens.size()) {
            const std::string& n = tokens[i + 1];

            if (t == "pre" && n == "existing") {    // "pre-existing"
                out.push_back("preexisting");
                ++i;
                continue;
            }
            if (t == "co" && (n == "payment" || n == "pay")) {  // "co-payment"
                out.push_back("copayment");
                ++i;
                continue;
            }
            if (t == "day" && n == "care") {        // "day care" / "day-care"
                out.push_back("daycare");
                ++i;
                continue;
            }
        }

        auto it = fold.find(t);
        if (it != fold.end()) out.push_back(it->second);
        else out.push_back(t);
    }

    return out;
}

bool is_stop_word(const std::string& token) {
    static const std::unordered_set<std::string> stop = {
        "a", "about", "above", "after", "again", "against", "all", "also", "am", "an",
        "and", "any", "are", "as", "at", "be", "been", "before", "being", "below",
        "between", "both", "but", "by", "can", "could", "did", "do", "does", "doing",
        "down", "during", "each", "either", "etc", "few", "for", "from", "further",
        "had", "has", "have", "having", "he", "her", "here", "hers", "him", "his",
        "how", "if", "in", "into", "is", "it", "its", "itself", "me", "more", "most",
        "my", "no", "nor", "not", "of", "off", "on", "once", "only", "or", "other",
        "our", "ours", "out", "over", "own", "same", "shall", "she", "should", "so",
        "some", "such", "than", "that", "the", "their", "them", "then", "there",
        "these", "they", "this", "those", "through", "to", "too", "under", "until",
        "up", "upon", "very", "was", "we", "were", "what", "when", "where", "which",
        "while", "who", "whom", "why", "will", "with", "would", "you", "your", "yours",
    };
    return stop.count(token) != 0;
}

std::vector<std::string> drop_stop_words(const std::vector<std::string>& tokens) {
    std::vector<std::string> out;
    out.reserve(tokens.size());
    for (const auto& t : tokens) {
        if (!is_stop_word(t)) out.push_back(t);
    }
    return out;
}

std::vector<std::string> analyze(const std::string& text) {
    return drop_stop_words(normalize_tokens(tokenize(normalize(text))));
}

std::string trim(const std::string& s) {
    size_t i = 0, j = s.size();
    while (i < j && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
    return s.substr(i, j - i);
}

std::string to_lower_ascii(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

}  // namespace textutil
}  // namespace clausefind
