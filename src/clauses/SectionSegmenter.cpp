#include "clauses/SectionSegmenter.hpp"
#include "text/TextUtil.hpp"
#include <cctype>
#include <utility>

namespace clausefind {

static std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (const auto& l : lines) {
        if (l.empty()) continue;
        if (!out.empty()) out.push_back(' ');
        out += l;
    }
    return out;
}

static bool all_digits(const std::string& s, size_t a, size_t b) {
    if (a >= b) return false;
    for (size_t i = a; i < b; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

// "page 3", "page3", "3 of 12", "- 7 -". A bare number ("5000") is body text.
static bool is_page_counter(const std::string& lc) {
    const bool dashed = lc.size() >= 2 && lc.front() == '-' && lc.back() == '-';

    std::string s;
    for (char c : lc) {
        if (c != ' ' && c != '-') s.push_back(c);
    }
    if (s.empty()) return false;

    if (s.compare(0, 4, "page") == 0) {
        size_t of = s.find("of", 4);
        if (of == std::string::npos) return all_digits(s, 4, s.size());
        return all_digits(s, 4, of) && all_digits(s, of + 2, s.size());
    }

    size_t of = s.find("of");
    if (of != std::string::npos) return all_digits(s, 0, of) && all_digits(s, of + 2, s.size());
    return dashed && all_digits(s, 0, s.size()) && s.size() <= 4;
}

bool SectionSegmenter::is_boilerplate(const std::string& line) {
    static const char* junk[] = {
        "uin:", "irda", "irdai regn", "regn. no.", "reg. no.", "cin:", "gstin",
        "subject matter of solicitation", "trade logo", "corporate office",
        "registered office", "toll-free", "toll free", "website:", "e-mail:",
        "email:", "confidential", "internal use",
    };

    const std::string lc = textutil::to_lower_ascii(textutil::trim(line));
    if (lc.empty()) return true;

    for (const char* k : junk) {
        if (lc.find(k) != std::string::npos) return true;
    }
    return is_page_counter(lc);
}

SectionSegmenter::SectionSegmenter(SegmenterConfig cfg) : m_cfg(std::move(cfg)) {}

std::string SectionSegmenter::fallback_title(const ClauseStore& store) const {
    return m_cfg.fallback_title_prefix + " " + std::to_string(store.next_id() + 1);
}

bool SectionSegmenter::flush(OpenClause& open, ClauseStore& store) const {
    bool had_body = false;

    if (open.active) {
        std::string body = join_lines(open.lines);
        if (!body.empty()) {
            had_body = true;
            if (body.size() >= m_cfg.min_body_chars) {
                std::string title = open.synthesized ? fallback_title(store) : open.title;
                store.append(std::move(title), std::move(body), open.page);
            }
        }
    }

    open = OpenClause{};
    return had_body;
}

ClauseStore SectionSegmenter::segment(const std::vector<PageText>& pages) const {
    ClauseStore store;
    OpenClause open;

    bool produced = false;          // some clause had a body (even if filtered out)
    int first_text_page = 0;
    std::vector<std::string> all_lines;

    for (const auto& pg : pages) {
        const std::string norm = m_normalizer.normalize(pg.text);
        if (norm.empty()) continue;
        if (first_text_page == 0) first_text_page = pg.page;

        for (const auto& line : TextNormalizer::split_lines(norm)) {
            if (line.empty()) continue;  // paragraph gap
            all_lines.push_back(line);

            // "UIN: ABC123" would otherwise pass as an upper-case heading
            if (m_cfg.drop_boilerplate && is_boilerplate(line)) continue;

            if (headings::classify(line, m_cfg.headings) != HeadingKind::None) {
                produced |= flush(open, store);
                open.active = true;
                open.title = line;
                open.page = pg.page;
                continue;
            }

            if (!open.active) {
                open.active = true;
                open.synthesized = true;
                open.page = pg.page;
            }
            open.lines.push_back(line);
        }

        // preamble text never runs into the next page; headed clauses do
        if (open.synthesized) produced |= flush(open, store);
    }
    produced |= flush(open, store);

    // headings only (or nothing but boilerplate): keep the text as one clause
    if (!produced && store.empty() && !all_lines.empty()) {
        store.append(fallback_title(store), join_lines(all_lines), first_text_page);
    }

    return store;
}

}  // namespace clausefind
