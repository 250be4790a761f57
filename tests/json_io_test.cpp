#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "io/JsonIO.hpp"
#include "search/Pipeline.hpp"

using namespace clausefind;
using json = nlohmann::json;

static std::string error_of(const std::string& text, std::vector<PageText> (*parse)(const std::string&)) {
    try {
        parse(text);
    } catch (const std::runtime_error& e) {
        return e.what();
    }
    return "";
}

TEST(JsonIO, PagesObjectForm) {
    auto pages = parse_pages_json(R"({"pages": [{"page": 3, "text": "1. Cover"}, {"text": "2. Claims"}]})");
    ASSERT_EQ(pages.size(), 2u);
    EXPECT_EQ(pages[0].page, 3);
    EXPECT_EQ(pages[0].text, "1. Cover");
    EXPECT_EQ(pages[1].page, 2);
    EXPECT_EQ(pages[1].text, "2. Claims");
}

TEST(JsonIO, PagesBareArrayOfStrings) {
    auto pages = parse_pages_json(R"(["first page", "second page"])");
    ASSERT_EQ(pages.size(), 2u);
    EXPECT_EQ(pages[0].page, 1);
    EXPECT_EQ(pages[1].page, 2);
    EXPECT_EQ(pages[1].text, "second page");
}

TEST(JsonIO, PagesErrorsNameTheField) {
    EXPECT_EQ(error_of(R"({"pages": [{"page": 1, "text": "a"}, {"page": 2}]})", parse_pages_json),
              "root.pages[1] missing required field: text");
    EXPECT_EQ(error_of(R"({"pages": [{"page": 0, "text": "a"}]})", parse_pages_json),
              "root.pages[0].page must be >= 1");
    EXPECT_EQ(error_of(R"({"document": []})", parse_pages_json),
              "root missing required field: pages");
    EXPECT_EQ(error_of(R"({"pages": {}})", parse_pages_json),
              "root.pages must be an array");
    EXPECT_NE(error_of("{not json", parse_pages_json).find("failed to parse pages JSON"), std::string::npos);
}

TEST(JsonIO, FormFeedSeparatedText) {
    auto pages = parse_pages_text("page one\fpage two\f");
    ASSERT_EQ(pages.size(), 2u);
    EXPECT_EQ(pages[0].page, 1);
    EXPECT_EQ(pages[0].text, "page one");
    EXPECT_EQ(pages[1].page, 2);
    EXPECT_EQ(pages[1].text, "page two");

    EXPECT_TRUE(parse_pages_text("").empty());
    EXPECT_EQ(parse_pages_text("single").size(), 1u);
}

TEST(JsonIO, ClausesRoundTrip) {
    std::vector<Clause> clauses{
        Clause{0, "1. Coverage", "Dental treatment is covered.", 1},
        Clause{1, "2. Exclusions", "Cosmetic surgery \"elective\" is excluded.", 2},
    };

    auto back = parse_clauses_json(clauses_to_json(clauses));
    ASSERT_EQ(back.size(), clauses.size());
    for (size_t i = 0; i < back.size(); ++i) {
        EXPECT_EQ(back[i].id, clauses[i].id);
        EXPECT_TRUE(same_content(back[i], clauses[i]));
    }

    EXPECT_THROW(parse_clauses_json(R"({"clauses": [{"id": -1, "title": "x", "text": "y", "page": 1}]})"),
                 std::runtime_error);
    EXPECT_THROW(parse_clauses_json(R"([])"), std::runtime_error);
}

TEST(JsonIO, ResultsCarryClauseDetails) {
    std::vector<Clause> clauses{
        Clause{0, "1. Coverage", "Dental treatment is covered.", 1},
        Clause{1, "2. Ambulance", "Road ambulance is covered up to Rs 2000.", 4},
    };
    auto index = build_index(clauses);
    auto results = retrieve(index, "ambulance", 1);
    ASSERT_EQ(results.size(), 1u);

    json j = json::parse(results_to_json(*index, "ambulance", results));
    EXPECT_EQ(j["query"], "ambulance");
    EXPECT_EQ(j["backend"], "sparse");
    EXPECT_EQ(j["corpus_size"], 2);
    ASSERT_EQ(j["results"].size(), 1u);

    const json& r = j["results"][0];
    EXPECT_EQ(r["rank"], 0);
    EXPECT_EQ(r["clause_id"], 1);
    EXPECT_EQ(r["title"], "2. Ambulance");
    EXPECT_EQ(r["page"], 4);
    EXPECT_GT(r["score"].get<double>(), 0.0);
}

TEST(JsonIO, ConfigDefaults) {
    AppConfig cfg = parse_config_json("{}");
    EXPECT_EQ(cfg.topk, 5u);
    EXPECT_EQ(cfg.tfidf.max_features, 1000u);
    EXPECT_TRUE(cfg.tfidf.bigrams);
    EXPECT_TRUE(cfg.segmenter.drop_boilerplate);
    EXPECT_EQ(cfg.segmenter.headings.max_heading_chars, 80u);
    EXPECT_TRUE(cfg.embedder.model_path.empty());
}

TEST(JsonIO, ConfigOverrides) {
    AppConfig cfg = parse_config_json(R"({
        "topk": 3,
        "segmenter": {"max_heading_words": 5, "fallback_title_prefix": "Part"},
        "tfidf": {"max_features": 0, "bigrams": false},
        "embedder": {"model": "models/minilm.onnx", "vocab": "models/vocab.txt", "threads": 2}
    })");

    EXPECT_EQ(cfg.topk, 3u);
    EXPECT_EQ(cfg.segmenter.headings.max_heading_words, 5u);
    EXPECT_EQ(cfg.segmenter.headings.max_heading_chars, 80u);
    EXPECT_EQ(cfg.segmenter.fallback_title_prefix, "Part");
    EXPECT_EQ(cfg.tfidf.max_features, 0u);
    EXPECT_FALSE(cfg.tfidf.bigrams);
    EXPECT_TRUE(cfg.tfidf.drop_stop_words);
    EXPECT_EQ(cfg.embedder.model_path, "models/minilm.onnx");
    EXPECT_EQ(cfg.embedder.vocab_path, "models/vocab.txt");
    EXPECT_EQ(cfg.embedder.intra_op_threads, 2);
    EXPECT_EQ(cfg.embedder.max_len, 256u);
}

TEST(JsonIO, ConfigTypeErrors) {
    try {
        parse_config_json(R"({"tfidf": {"bigrams": "yes"}})");
        FAIL() << "expected a type error";
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()), "config.tfidf.bigrams must be a boolean");
    }

    EXPECT_THROW(parse_config_json(R"({"topk": -1})"), std::runtime_error);
    EXPECT_THROW(parse_config_json(R"({"segmenter": []})"), std::runtime_error);
    EXPECT_THROW(parse_config_json("[1, 2]"), std::runtime_error);
    EXPECT_THROW(parse_config_json("{\"topk\": "), std::runtime_error);
}
