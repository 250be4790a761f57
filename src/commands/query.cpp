#include "commands/query.hpp"
#include "io/JsonIO.hpp"
#include "search/DocumentSession.hpp"
#include "search/Errors.hpp"
#include "search/EvidenceContext.hpp"
#include "search/Pipeline.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace clausefind;

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (argv[i] == key) return argv[i + 1];
    }
    return def;
}

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (argv[i] == key) return true;
    }
    return false;
}

int cmd_query(int argc, char** argv) {
    std::string pages_path   = get_arg(argc, argv, "--pages", "");
    std::string clauses_path = get_arg(argc, argv, "--clauses", "");
    std::string config_path  = get_arg(argc, argv, "--config", "");
    std::string query        = get_arg(argc, argv, "--q", "");
    const bool as_context    = has_flag(argc, argv, "--context");

    if (pages_path.empty() == clauses_path.empty()) {
        std::cerr << "error: give exactly one of --pages or --clauses\n";
        return 1;
    }

    try {
        AppConfig cfg = config_path.empty() ? AppConfig{} : load_config(config_path);
        cfg.embedder.model_path = get_arg(argc, argv, "--model", cfg.embedder.model_path);
        cfg.embedder.vocab_path = get_arg(argc, argv, "--vocab", cfg.embedder.vocab_path);
        const size_t topk = std::stoul(get_arg(argc, argv, "--topk", std::to_string(cfg.topk)));

        auto provider = std::make_shared<VectorizerProvider>(cfg.tfidf);
        if (!cfg.embedder.model_path.empty()) provider->load_dense(cfg.embedder);

        IndexHandle index;
        if (!pages_path.empty()) {
            DocumentSession session(cfg.segmenter, provider);
            index = session.ingest(load_pages(pages_path));
        } else {
            index = build_index(parse_clauses_json(read_file(clauses_path)), *provider);
        }

        std::cerr << "indexed " << index->size() << " clauses (" << backend_name(index->backend()) << ")\n";

        auto results = retrieve(index, query, topk);
        if (as_context) {
            std::cout << format_evidence(*index, results);
        } else {
            std::cout << results_to_json(*index, query, results) << "\n";
        }
        return 0;
    } catch (const InputError& e) {
        std::cerr << "error: " << e.what() << " (" << pages_path << ")\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
