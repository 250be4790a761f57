#pragma once
#include <string>
#include <vector>

namespace clausefind {
namespace textutil {

// lowercase, keep letters/digits, turn everything else into spaces, collapse spaces
std::string normalize(const std::string& s);

// split normalized text into tokens, drop single-character junk
std::vector<std::string> tokenize(const std::string& normalized);

// spelling folding + phrase merging ("pre existing" -> "preexisting")
std::vector<std::string> normalize_tokens(const std::vector<std::string>& tokens);

bool is_stop_word(const std::string& token);

std::vector<std::string> drop_stop_words(const std::vector<std::string>& tokens);

// normalize -> tokenize -> normalize_tokens -> drop_stop_words
std::vector<std::string> analyze(const std::string& text);

std::string trim(const std::string& s);
std::string to_lower_ascii(std::string s);

}  // namespace textutil
}  // namespace clausefind
