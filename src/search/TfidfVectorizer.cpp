#include "search/TfidfVectorizer.hpp"
#include "text/TextUtil.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_set>
#include <utility>

namespace clausefind {

TfidfVectorizer::TfidfVectorizer(TfidfConfig cfg) : m_cfg(cfg) {}

std::vector<std::string> TfidfVectorizer::terms_of(const std::string& text) const {
    auto toks = textutil::normalize_tokens(textutil::tokenize(textutil::normalize(text)));
    if (m_cfg.drop_stop_words) toks = textutil::drop_stop_words(toks);

    std::vector<std::string> terms = toks;
    if (m_cfg.bigrams) {
        for (size_t i = 0; i + 1 < toks.size(); ++i) {
            terms.push_back(toks[i] + " " + toks[i + 1]);
        }
    }
    return terms;
}

FeatureVector TfidfVectorizer::weigh(const std::vector<std::string>& terms) const {
    std::unordered_map<uint32_t, uint32_t> tf;
    tf.reserve(terms.size());

    for (const auto& t : terms) {
        auto it = m_term_to_id.find(t);
        if (it == m_term_to_id.end()) continue;
        tf[it->second] += 1;
    }

    FeatureVector fv;
    fv.sparse.reserve(tf.size());

    for (const auto& kv : tf) {
        // log TF
        double w = (1.0 + std::log((double)kv.second)) * m_idf[kv.first];
        fv.sparse.push_back({kv.first, (float)w});
    }

    std::sort(fv.sparse.begin(), fv.sparse.end(),
              [](const auto& x, const auto& y) { return x.first < y.first; });
    return fv;
}

CorpusVectors TfidfVectorizer::vectorize_corpus(const std::vector<Clause>& clauses) {
    m_terms.clear();
    m_idf.clear();
    m_term_to_id.clear();

    const double N = (double)clauses.size();

    // Pass 1: DF and corpus frequency per term
    std::unordered_map<std::string, std::pair<uint32_t, uint64_t>> stats;  // term -> (df, total tf)
    std::vector<std::vector<std::string>> clause_terms;
    clause_terms.reserve(clauses.size());

    for (const auto& c : clauses) {
        auto terms = terms_of(clause_text(c));

        std::unordered_set<std::string> seen;
        seen.reserve(terms.size());
        for (const auto& t : terms) {
            auto& st = stats[t];
            st.second += 1;
            if (seen.insert(t).second) st.first += 1;
        }
        clause_terms.push_back(std::move(terms));
    }

    // Feature cap: most frequent terms across the corpus, ties by term
    std::vector<std::pair<std::string, std::pair<uint32_t, uint64_t>>> ranked(stats.begin(), stats.end());
    if (m_cfg.max_features > 0 && ranked.size() > m_cfg.max_features) {
        std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
            if (a.second.second != b.second.second) return a.second.second > b.second.second;
            return a.first < b.first;
        });
        ranked.resize(m_cfg.max_features);
    }

    // Freeze vocab: term ids in lexical order so rebuilds are identical
    std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) { return a.first < b.first; });

    m_terms.reserve(ranked.size());
    m_idf.reserve(ranked.size());

    for (const auto& r : ranked) {
        m_term_to_id.emplace(r.first, (uint32_t)m_terms.size());
        m_terms.push_back(r.first);
        // smooth: idf = log((N + 1)/(df + 1)) + 1
        m_idf.push_back(std::log((N + 1.0) / ((double)r.second.first + 1.0)) + 1.0);
    }

    // Pass 2: TF-IDF vectors
    CorpusVectors out;
    for (size_t i = 0; i < clauses.size(); ++i) {
        out.emplace(clauses[i].id, weigh(clause_terms[i]));
    }
    return out;
}

FeatureVector TfidfVectorizer::vectorize_query(const std::string& text) const {
    if (m_terms.empty()) return {};
    return weigh(terms_of(text));
}

}  // namespace clausefind
