#include "emb/WordPieceTokenizer.hpp"
#include <algorithm>
#include <fstream>
#include <utility>

namespace clausefind {

namespace {

constexpr uint32_t kReplacement = 0xFFFD;

// decodes the sequence at s[i] and advances i; malformed bytes give U+FFFD
uint32_t next_codepoint(const std::string& s, size_t& i) {
    const unsigned char b0 = static_cast<unsigned char>(s[i++]);
    if (b0 < 0x80) return b0;

    size_t extra = 0;
    uint32_t cp = 0;
    if ((b0 & 0xE0) == 0xC0)      { extra = 1; cp = b0 & 0x1F; }
    else if ((b0 & 0xF0) == 0xE0) { extra = 2; cp = b0 & 0x0F; }
    else if ((b0 & 0xF8) == 0xF0) { extra = 3; cp = b0 & 0x07; }
    else return kReplacement;

    for (size_t k = 0; k < extra; ++k) {
        if (i >= s.size()) return kReplacement;
        const unsigned char b = static_cast<unsigned char>(s[i]);
        if ((b & 0xC0) != 0x80) return kReplacement;
        cp = (cp << 6) | (b & 0x3F);
        ++i;
    }
    return cp;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

bool is_space(uint32_t cp) {
    return cp == ' ' || cp == '\t' || cp == '\n' || cp == '\r' || cp == '\f' || cp == '\v' ||
           cp == 0xA0 || (cp >= 0x2000 && cp <= 0x200A) || cp == 0x202F || cp == 0x205F ||
           cp == 0x3000;
}

bool is_control(uint32_t cp) {
    return cp < 0x20 || (cp >= 0x7F && cp <= 0x9F) || cp == kReplacement ||
           (cp >= 0x200B && cp <= 0x200F) || cp == 0xFEFF;
}

bool is_combining(uint32_t cp) {
    return cp >= 0x300 && cp <= 0x36F;
}

bool is_punct(uint32_t cp) {
    if ((cp >= 33 && cp <= 47) || (cp >= 58 && cp <= 64) ||
        (cp >= 91 && cp <= 96) || (cp >= 123 && cp <= 126)) return true;
    switch (cp) {
        case 0xA1: case 0xA7: case 0xAB: case 0xB6: case 0xB7: case 0xBB: case 0xBF:
            return true;
        default:
            break;
    }
    // general punctuation: dashes, quotes, bullets, ellipsis, primes
    if (cp >= 0x2010 && cp <= 0x2027) return true;
    if (cp >= 0x2030 && cp <= 0x205E) return true;
    return cp >= 0x3001 && cp <= 0x303F;
}

uint32_t to_lower(uint32_t cp) {
    if (cp >= 'A' && cp <= 'Z') return cp + 32;
    if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) return cp + 0x20;
    return cp;
}

// lowercase Latin-1 letters with their accent removed; '.' keeps the letter
uint32_t strip_accent(uint32_t cp) {
    static const char kFold[] = "aaaaaa.ceeeeiiii.nooooo..uuuuy.y";
    if (cp < 0xE0 || cp > 0xFF) return cp;
    const char f = kFold[cp - 0xE0];
    return f == '.' ? cp : static_cast<uint32_t>(f);
}

}  // namespace

bool WordPieceTokenizer::load_vocab(const std::string& vocab_path) {
    std::ifstream in(vocab_path);
    if (!in) return false;

    m_id_to_tok.clear();
    m_tok_to_id.clear();
    m_max_piece_len = 0;

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        m_max_piece_len = std::max(m_max_piece_len, line.size());
        m_tok_to_id.emplace(line, static_cast<int64_t>(m_id_to_tok.size()));
        m_id_to_tok.push_back(std::move(line));
    }

    if (cls_id() < 0 || sep_id() < 0 || unk_id() < 0) {
        m_id_to_tok.clear();
        m_tok_to_id.clear();
        return false;
    }
    return true;
}

int64_t WordPieceTokenizer::id_or(int64_t def, const std::string& tok) const {
    auto it = m_tok_to_id.find(tok);
    return it == m_tok_to_id.end() ? def : it->second;
}

std::vector<std::string> WordPieceTokenizer::basic_tokenize(const std::string& text) const {
    std::vector<std::string> words;
    std::string cur;
    auto flush = [&]() {
        if (!cur.empty()) { words.push_back(cur); cur.clear(); }
    };

    size_t i = 0;
    while (i < text.size()) {
        const uint32_t cp = strip_accent(to_lower(next_codepoint(text, i)));

        if (is_space(cp)) {
            flush();
        } else if (is_control(cp) || is_combining(cp)) {
            continue;
        } else if (is_punct(cp)) {
            flush();
            std::string mark;
            append_utf8(mark, cp);
            words.push_back(std::move(mark));
        } else {
            append_utf8(cur, cp);
        }
    }
    flush();
    return words;
}

void WordPieceTokenizer::wordpiece(const std::string& word, std::vector<int64_t>& out) const {
    const size_t mark = out.size();
    if (word.size() > kMaxWordChars) {
        out.push_back(unk_id());
        return;
    }

    std::string piece;
    size_t start = 0;

    // greedy longest match; continuation pieces carry the "##" prefix
    while (start < word.size()) {
        size_t end = std::min(word.size(), start + m_max_piece_len);
        int64_t found = -1;

        for (; end > start; --end) {
            // never split inside a UTF-8 sequence
            if (end < word.size() && (static_cast<unsigned char>(word[end]) & 0xC0) == 0x80) continue;

            piece.assign(start > 0 ? "##" : "");
            piece.append(word, start, end - start);
            auto it = m_tok_to_id.find(piece);
            if (it != m_tok_to_id.end()) {
                found = it->second;
                break;
            }
        }

        if (found < 0) {
            out.resize(mark);
            out.push_back(unk_id());
            return;
        }
        out.push_back(found);
        start = end;
    }
}

std::vector<int64_t> WordPieceTokenizer::piece_ids(const std::string& text) const {
    std::vector<int64_t> ids;
    for (const auto& w : basic_tokenize(text)) wordpiece(w, ids);
    return ids;
}

std::vector<int64_t> WordPieceTokenizer::encode(const std::string& text, size_t max_len) const {
    return encode_windows(text, max_len, 1).front();
}

std::vector<std::vector<int64_t>> WordPieceTokenizer::encode_windows(const std::string& text,
                                                                     size_t max_len,
                                                                     size_t max_windows) const {
    if (max_len < 2) max_len = 2;  // room for [CLS] + [SEP]
    if (max_windows == 0) max_windows = 1;
    const size_t body = max_len - 2;

    const std::vector<int64_t> pieces = piece_ids(text);

    std::vector<std::vector<int64_t>> windows;
    size_t pos = 0;
    do {
        const size_t n = std::min(body, pieces.size() - pos);

        std::vector<int64_t> ids;
        ids.reserve(n + 2);
        ids.push_back(cls_id());
        ids.insert(ids.end(), pieces.begin() + pos, pieces.begin() + pos + n);
        ids.push_back(sep_id());
        windows.push_back(std::move(ids));

        pos += n;
    } while (pos < pieces.size() && body > 0 && windows.size() < max_windows);

    return windows;
}

}  // namespace clausefind
