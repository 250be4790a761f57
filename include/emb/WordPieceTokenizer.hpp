#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace clausefind {

// BERT-style uncased WordPiece tokenizer driven by a vocab.txt (one token per line).
// Input is UTF-8; Latin-1 accents are folded and Unicode spaces / punctuation
// (NBSP, curly quotes, dashes, bullets) split words like their ASCII forms.
class WordPieceTokenizer {
public:
    // false if the file is missing or lacks [CLS]/[SEP]/[UNK]
    bool load_vocab(const std::string& vocab_path);

    // Returns token ids including [CLS] ... [SEP], truncated to max_len
    std::vector<int64_t> encode(const std::string& text, size_t max_len) const;

    // Splits the text into consecutive [CLS] ... [SEP] windows of at most
    // max_len ids each; at most max_windows windows, the rest is dropped.
    // Always returns at least one window.
    std::vector<std::vector<int64_t>> encode_windows(const std::string& text,
                                                     size_t max_len,
                                                     size_t max_windows) const;

    bool loaded() const { return !m_id_to_tok.empty(); }
    size_t vocab_size() const { return m_id_to_tok.size(); }

    int64_t pad_id() const { return id_or(0, "[PAD]"); }
    int64_t unk_id() const { return id_or(-1, "[UNK]"); }
    int64_t cls_id() const { return id_or(-1, "[CLS]"); }
    int64_t sep_id() const { return id_or(-1, "[SEP]"); }

    // lowercased, accent-folded words and punctuation marks
    std::vector<std::string> basic_tokenize(const std::string& text) const;

private:
    std::vector<std::string> m_id_to_tok;
    std::unordered_map<std::string, int64_t> m_tok_to_id;
    size_t m_max_piece_len = 0;  // longest vocab entry, bytes

    // longer words are emitted as [UNK] rather than searched piecewise
    static constexpr size_t kMaxWordChars = 100;

    // ids of the whole text, no specials
    std::vector<int64_t> piece_ids(const std::string& text) const;

    // appends the pieces of one word, or a single [UNK]
    void wordpiece(const std::string& word, std::vector<int64_t>& out) const;

    int64_t id_or(int64_t def, const std::string& tok) const;
};

}  // namespace clausefind
