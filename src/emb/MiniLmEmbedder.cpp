#include "emb/MiniLmEmbedder.hpp"
#include <cmath>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace clausefind {

bool MiniLmEmbedder::init(const EmbedderConfig& cfg) {
    m_cfg = cfg;
    m_session.reset();

    if (cfg.model_path.empty() || !fs::exists(cfg.model_path)) {
        std::cerr << "MiniLmEmbedder: model not found: " << cfg.model_path << "\n";
        return false;
    }
    if (!m_tok.load_vocab(cfg.vocab_path)) {
        std::cerr << "MiniLmEmbedder: failed to load vocab: " << cfg.vocab_path << "\n";
        return false;
    }

    try {
        m_opts.SetIntraOpNumThreads(cfg.intra_op_threads);
        m_opts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);

        auto session = std::make_unique<Ort::Session>(m_env, cfg.model_path.c_str(), m_opts);

        const size_t n_in = session->GetInputCount();
        if (n_in < 2 || n_in > 3 || session->GetOutputCount() < 1) {
            std::cerr << "MiniLmEmbedder: unexpected model signature (" << n_in << " inputs)\n";
            return false;
        }

        Ort::AllocatorWithDefaultOptions allocator;
        m_in_names.clear();
        for (size_t i = 0; i < n_in; ++i) {
            auto name = session->GetInputNameAllocated(i, allocator);
            m_in_names.emplace_back(name.get());
        }
        auto out_name = session->GetOutputNameAllocated(0, allocator);
        m_out_name = out_name.get();

        m_session = std::move(session);
        return true;
    } catch (const Ort::Exception& e) {
        std::cerr << "MiniLmEmbedder ORT exception: " << e.what() << "\n";
        std::cerr << "model_path=" << cfg.model_path << "\n";
        return false;
    }
}

static void l2_normalize(std::vector<float>& v) {
    double ss = 0.0;
    for (float x : v) ss += (double)x * (double)x;
    if (ss <= 0.0) return;
    double inv = 1.0 / std::sqrt(ss);
    for (float& x : v) x = (float)(x * inv);
}

size_t MiniLmEmbedder::pool_window(const std::vector<int64_t>& ids, std::vector<float>& sum) const {
    const size_t seq_len = ids.size();

    std::vector<int64_t> input_ids = ids;
    std::vector<int64_t> mask(seq_len, 1);
    std::vector<int64_t> type_ids(seq_len, 0);
    std::vector<int64_t> shape{1, (int64_t)seq_len};

    Ort::MemoryInfo mem = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);

    // inputs in model order; anything not ids/mask is fed token types
    std::vector<Ort::Value> in_vals;
    std::vector<const char*> in_names;
    in_vals.reserve(m_in_names.size());
    for (const auto& name : m_in_names) {
        std::vector<int64_t>* src = &type_ids;
        if (name.find("input_ids") != std::string::npos) src = &input_ids;
        else if (name.find("mask") != std::string::npos) src = &mask;

        in_vals.push_back(Ort::Value::CreateTensor<int64_t>(mem, src->data(), src->size(),
                                                            shape.data(), shape.size()));
        in_names.push_back(name.c_str());
    }

    const char* out_names[1] = { m_out_name.c_str() };

    auto outs = m_session->Run(Ort::RunOptions{nullptr}, in_names.data(), in_vals.data(),
                               in_vals.size(), out_names, 1);

    auto shp = outs[0].GetTensorTypeAndShapeInfo().GetShape(); // [1, seq_len, hidden]
    if (shp.size() != 3 || shp[1] != (int64_t)seq_len || shp[2] <= 0) return 0;

    const size_t hidden = (size_t)shp[2];
    if (sum.empty()) sum.assign(hidden, 0.0f);
    if (sum.size() != hidden) return 0;

    const float* data = outs[0].GetTensorData<float>();
    for (size_t t = 0; t < seq_len; ++t) {
        const float* row = data + t * hidden;
        for (size_t j = 0; j < hidden; ++j) sum[j] += row[j];
    }
    return seq_len;
}

std::vector<float> MiniLmEmbedder::embed(const std::string& text) const {
    if (!m_session) return {};

    std::vector<float> pooled;
    size_t tokens = 0;

    try {
        for (const auto& window : m_tok.encode_windows(text, m_cfg.max_len, m_cfg.max_windows)) {
            size_t n = pool_window(window, pooled);
            if (n == 0) return {};
            tokens += n;
        }
    } catch (const Ort::Exception& e) {
        std::cerr << "MiniLmEmbedder: inference failed: " << e.what() << "\n";
        return {};
    }

    if (tokens == 0) return {};
    const float inv = (float)(1.0 / (double)tokens);
    for (float& x : pooled) x *= inv;

    l2_normalize(pooled);
    return pooled;
}

}  // namespace clausefind
