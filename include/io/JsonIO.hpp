#pragma once
#include "clauses/Clause.hpp"
#include "clauses/SectionSegmenter.hpp"
#include "emb/MiniLmEmbedder.hpp"
#include "search/CorpusIndex.hpp"
#include "search/RetrievalEngine.hpp"
#include "search/TfidfVectorizer.hpp"
#include <string>
#include <vector>

namespace clausefind {

struct AppConfig {
    SegmenterConfig segmenter;
    TfidfConfig tfidf;
    EmbedderConfig embedder;   // empty model path = sparse only
    size_t topk = 5;
};

// All loaders throw std::runtime_error naming the offending field.

// {"pages": [{"page": 1, "text": "..."}, ...]}  (a bare array is accepted too)
std::vector<PageText> parse_pages_json(const std::string& json_text);

// pdftotext-style output: pages separated by form feeds, numbered from 1
std::vector<PageText> parse_pages_text(const std::string& text);

// .json -> parse_pages_json, anything else -> parse_pages_text
std::vector<PageText> load_pages(const std::string& path);

std::string clauses_to_json(const std::vector<Clause>& clauses, int indent = 2);
std::vector<Clause> parse_clauses_json(const std::string& json_text);

// [{"rank", "clause_id", "score", "title", "page", "text"}] plus query and backend
std::string results_to_json(const CorpusIndex& index,
                            const std::string& query,
                            const std::vector<RetrievalResult>& results,
                            int indent = 2);

// keys absent from the file keep their defaults
AppConfig parse_config_json(const std::string& json_text);
AppConfig load_config(const std::string& path);

std::string read_file(const std::string& path);

}  // namespace clausefind
