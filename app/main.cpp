#include "commands/query.hpp"
#include "commands/segment.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  clausefind segment [args]\n"
        << "  clausefind query [args]\n"
        << "  clausefind help\n";
    return 1;
}

static int print_segment_help() {
    std::cerr
        << "usage:\n"
        << "  clausefind segment --pages <path> [options]\n"
        << "\n"
        << "options:\n"
        << "  --pages <path>               (required) pages .json, or text with form-feed page breaks\n"
        << "  --config <path>              optional JSON config (segmenter/tfidf/embedder/topk)\n"
        << "  --out <path>                 write clauses JSON here instead of stdout\n";
    return 0;
}

static int print_query_help() {
    std::cerr
        << "usage:\n"
        << "  clausefind query (--pages <path> | --clauses <path>) --q \"<claim query>\" [options]\n"
        << "\n"
        << "input:\n"
        << "  --pages <path>               pages .json or form-feed separated text\n"
        << "  --clauses <path>             clauses JSON written by `clausefind segment`\n"
        << "  --config <path>              optional JSON config\n"
        << "\n"
        << "retrieval:\n"
        << "  --q <str>                    claim query\n"
        << "  --topk <n>                   default: 5 (or config topk)\n"
        << "  --context                    print the evidence block instead of JSON\n"
        << "\n"
        << "dense backend (falls back to tf-idf when unavailable):\n"
        << "  --model <path>               MiniLM ONNX model\n"
        << "  --vocab <path>               matching vocab.txt\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        print_usage();
        return 0;
    }

    // subcommand help
    if (cmd == "segment" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_segment_help();
    if (cmd == "query"   && (argc >= 3 && std::string(argv[2]) == "--help")) return print_query_help();

    if (cmd == "segment") return cmd_segment(argc - 1, argv + 1);
    if (cmd == "query")   return cmd_query(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
