#pragma once
#include "clauses/Clause.hpp"
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace clausefind {

// Ordered, append-only clause list for one document. Ids are positions.
class ClauseStore {
public:
    ClauseStore() = default;

    // Returns false (and stores nothing) if an identical page/title/body
    // triple is already present.
    bool append(std::string title, std::string body, int page);

    const std::vector<Clause>& clauses() const { return m_clauses; }
    const Clause& at(uint32_t id) const { return m_clauses.at(id); }

    size_t size() const { return m_clauses.size(); }
    bool empty() const { return m_clauses.empty(); }

    // id the next appended clause will get
    uint32_t next_id() const { return static_cast<uint32_t>(m_clauses.size()); }

    std::vector<Clause> release() { m_seen.clear(); return std::move(m_clauses); }

private:
    std::vector<Clause> m_clauses;
    std::unordered_set<std::string> m_seen;  // page/title/body keys

    static std::string content_key(int page, const std::string& title, const std::string& body);
};

}  // namespace clausefind
