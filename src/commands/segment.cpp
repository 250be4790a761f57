#include "commands/segment.hpp"
#include "io/JsonIO.hpp"
#include "search/Pipeline.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace clausefind;

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (argv[i] == key) return argv[i + 1];
    }
    return def;
}

int cmd_segment(int argc, char** argv) {
    std::string pages_path  = get_arg(argc, argv, "--pages", "");
    std::string config_path = get_arg(argc, argv, "--config", "");
    std::string outp        = get_arg(argc, argv, "--out", "");

    if (pages_path.empty()) {
        std::cerr << "error: --pages is required\n";
        return 1;
    }

    try {
        AppConfig cfg = config_path.empty() ? AppConfig{} : load_config(config_path);
        std::vector<PageText> pages = load_pages(pages_path);
        std::vector<Clause> clauses = process_document(pages, cfg.segmenter);

        if (clauses.empty()) {
            std::cerr << "error: no extractable text in " << pages_path << "\n";
            return 1;
        }

        const std::string doc = clauses_to_json(clauses);
        if (outp.empty()) {
            std::cout << doc << "\n";
            return 0;
        }

        std::ofstream out(outp);
        if (!out) {
            std::cerr << "error: failed to open " << outp << "\n";
            return 1;
        }
        out << doc << "\n";
        std::cout << "saved: " << outp << " (pages=" << pages.size() << ", clauses=" << clauses.size() << ")\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
