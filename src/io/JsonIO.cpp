#include "io/JsonIO.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace clausefind {

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static int64_t require_int(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_number_integer()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an integer");
    }
    return j.at(key).get<int64_t>();
}

// optional fields: leave `out` untouched when the key is absent
static void read_opt(const json& j, const char* key, const std::string& where, size_t& out) {
    if (!j.contains(key)) return;
    const json& v = j.at(key);
    if (!v.is_number_integer() || v.get<int64_t>() < 0) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a non-negative integer");
    }
    out = v.get<size_t>();
}

static void read_opt(const json& j, const char* key, const std::string& where, int& out) {
    if (!j.contains(key)) return;
    if (!j.at(key).is_number_integer()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an integer");
    }
    out = j.at(key).get<int>();
}

static void read_opt(const json& j, const char* key, const std::string& where, bool& out) {
    if (!j.contains(key)) return;
    if (!j.at(key).is_boolean()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a boolean");
    }
    out = j.at(key).get<bool>();
}

static void read_opt(const json& j, const char* key, const std::string& where, std::string& out) {
    if (!j.contains(key)) return;
    out = require_string(j, key, where);
}

static json parse_or_throw(const std::string& text, const std::string& what) {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("failed to parse " + what + " JSON: " + e.what());
    }
}

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("failed to open: " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static PageText parsePage(const json& j, size_t index, const std::string& where) {
    PageText p;
    if (j.is_string()) {
        // ["page one text", "page two text"]
        p.page = static_cast<int>(index) + 1;
        p.text = j.get<std::string>();
        return p;
    }

    require_object(j, where);
    p.text = require_string(j, "text", where);
    p.page = static_cast<int>(index) + 1;
    if (j.contains("page")) {
        int64_t n = require_int(j, "page", where);
        if (n < 1) throw std::runtime_error(where + ".page must be >= 1");
        p.page = static_cast<int>(n);
    }
    return p;
}

std::vector<PageText> parse_pages_json(const std::string& json_text) {
    json j = parse_or_throw(json_text, "pages");

    const json* arr = &j;
    std::string where = "pages";
    if (j.is_object()) {
        if (!j.contains("pages")) throw std::runtime_error("root missing required field: pages");
        arr = &j.at("pages");
        where = "root.pages";
    }
    require_array(*arr, where);

    std::vector<PageText> pages;
    pages.reserve(arr->size());
    for (size_t i = 0; i < arr->size(); ++i) {
        std::ostringstream oss;
        oss << where << "[" << i << "]";
        pages.push_back(parsePage(arr->at(i), i, oss.str()));
    }
    return pages;
}

std::vector<PageText> parse_pages_text(const std::string& text) {
    std::vector<PageText> pages;
    if (text.empty()) return pages;

    size_t start = 0;
    int n = 1;
    while (true) {
        size_t ff = text.find('\f', start);
        PageText p;
        p.page = n++;
        p.text = text.substr(start, ff == std::string::npos ? std::string::npos : ff - start);
        pages.push_back(std::move(p));
        if (ff == std::string::npos) break;
        start = ff + 1;
    }

    // pdftotext ends the last page with a form feed
    if (pages.size() > 1 && pages.back().text.empty()) pages.pop_back();
    return pages;
}

std::vector<PageText> load_pages(const std::string& path) {
    const std::string data = read_file(path);
    if (fs::path(path).extension() == ".json") return parse_pages_json(data);
    return parse_pages_text(data);
}

std::string clauses_to_json(const std::vector<Clause>& clauses, int indent) {
    json arr = json::array();
    for (const auto& c : clauses) {
        arr.push_back({
            {"id", c.id},
            {"title", c.title},
            {"page", c.page},
            {"text", c.body},
        });
    }
    json root = {{"clauses", arr}};
    return root.dump(indent);
}

static Clause parseClause(const json& j, const std::string& where) {
    require_object(j, where);

    Clause c;
    int64_t id = require_int(j, "id", where);
    if (id < 0) throw std::runtime_error(where + ".id must be >= 0");
    c.id    = static_cast<uint32_t>(id);
    c.title = require_string(j, "title", where);
    c.body  = require_string(j, "text", where);
    c.page  = static_cast<int>(require_int(j, "page", where));
    return c;
}

std::vector<Clause> parse_clauses_json(const std::string& json_text) {
    json j = parse_or_throw(json_text, "clauses");
    require_object(j, "root");

    if (!j.contains("clauses")) throw std::runtime_error("root missing required field: clauses");
    const json& arr = j.at("clauses");
    require_array(arr, "root.clauses");

    std::vector<Clause> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        std::ostringstream oss;
        oss << "root.clauses[" << i << "]";
        out.push_back(parseClause(arr.at(i), oss.str()));
    }
    return out;
}

std::string results_to_json(const CorpusIndex& index,
                            const std::string& query,
                            const std::vector<RetrievalResult>& results,
                            int indent) {
    json arr = json::array();
    for (const auto& r : results) {
        const Clause* c = index.find(r.clause_id);
        if (!c) continue;
        arr.push_back({
            {"rank", r.rank},
            {"clause_id", r.clause_id},
            {"score", r.score},
            {"title", c->title},
            {"page", c->page},
            {"text", c->body},
        });
    }

    json root = {
        {"query", query},
        {"backend", backend_name(index.backend())},
        {"corpus_size", index.size()},
        {"results", arr},
    };
    return root.dump(indent);
}

AppConfig parse_config_json(const std::string& json_text) {
    json j = parse_or_throw(json_text, "config");
    require_object(j, "config");

    AppConfig cfg;

    if (j.contains("segmenter")) {
        const json& s = j.at("segmenter");
        require_object(s, "config.segmenter");
        read_opt(s, "max_heading_chars", "config.segmenter", cfg.segmenter.headings.max_heading_chars);
        read_opt(s, "max_heading_words", "config.segmenter", cfg.segmenter.headings.max_heading_words);
        read_opt(s, "drop_boilerplate", "config.segmenter", cfg.segmenter.drop_boilerplate);
        read_opt(s, "min_body_chars", "config.segmenter", cfg.segmenter.min_body_chars);
        read_opt(s, "fallback_title_prefix", "config.segmenter", cfg.segmenter.fallback_title_prefix);
    }

    if (j.contains("tfidf")) {
        const json& t = j.at("tfidf");
        require_object(t, "config.tfidf");
        read_opt(t, "max_features", "config.tfidf", cfg.tfidf.max_features);
        read_opt(t, "bigrams", "config.tfidf", cfg.tfidf.bigrams);
        read_opt(t, "drop_stop_words", "config.tfidf", cfg.tfidf.drop_stop_words);
    }

    if (j.contains("embedder")) {
        const json& e = j.at("embedder");
        require_object(e, "config.embedder");
        read_opt(e, "model", "config.embedder", cfg.embedder.model_path);
        read_opt(e, "vocab", "config.embedder", cfg.embedder.vocab_path);
        read_opt(e, "max_len", "config.embedder", cfg.embedder.max_len);
        read_opt(e, "max_windows", "config.embedder", cfg.embedder.max_windows);
        read_opt(e, "threads", "config.embedder", cfg.embedder.intra_op_threads);
    }

    read_opt(j, "topk", "config", cfg.topk);
    return cfg;
}

AppConfig load_config(const std::string& path) {
    return parse_config_json(read_file(path));
}

}  // namespace clausefind
