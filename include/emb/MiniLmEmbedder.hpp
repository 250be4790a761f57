#pragma once
#include "emb/WordPieceTokenizer.hpp"
#include <memory>
#include <string>
#include <vector>

#include <onnxruntime_cxx_api.h>

namespace clausefind {

struct EmbedderConfig {
    std::string model_path;   // sentence-transformers MiniLM exported to ONNX
    std::string vocab_path;   // matching vocab.txt
    size_t max_len = 256;     // tokens per window, [CLS]/[SEP] included
    size_t max_windows = 4;   // long clauses are encoded window by window
    int intra_op_threads = 1;
};

// Sentence embedder: WordPiece -> ONNX encoder -> masked mean pooling -> L2 norm.
// Text longer than one window is pooled over all of its windows.
// embed() is safe to call from several threads once init() has succeeded.
class MiniLmEmbedder {
public:
    // false (with a message on stderr) if the vocab or model cannot be loaded
    bool init(const EmbedderConfig& cfg);

    bool ready() const { return m_session != nullptr; }

    // L2-normalized embedding; empty on failure
    std::vector<float> embed(const std::string& text) const;

    const EmbedderConfig& config() const { return m_cfg; }

private:
    EmbedderConfig m_cfg;
    WordPieceTokenizer m_tok;

    Ort::Env m_env{ORT_LOGGING_LEVEL_WARNING, "clausefind"};
    Ort::SessionOptions m_opts;
    std::unique_ptr<Ort::Session> m_session;

    std::vector<std::string> m_in_names;  // input_ids, attention_mask[, token_type_ids]
    std::string m_out_name;

    // adds the hidden states of one window to `sum`; returns the token count, 0 on failure
    size_t pool_window(const std::vector<int64_t>& ids, std::vector<float>& sum) const;
};

}  // namespace clausefind
