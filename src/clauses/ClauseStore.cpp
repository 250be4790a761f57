#include "clauses/ClauseStore.hpp"

namespace clausefind {

std::string ClauseStore::content_key(int page, const std::string& title, const std::string& body) {
    std::string key = std::to_string(page);
    key.reserve(key.size() + title.size() + body.size() + 2);
    key += '\x1f';
    key += title;
    key += '\x1f';
    key += body;
    return key;
}

bool ClauseStore::append(std::string title, std::string body, int page) {
    if (!m_seen.insert(content_key(page, title, body)).second) return false;

    Clause c;
    c.id = next_id();
    c.title = std::move(title);
    c.body = std::move(body);
    c.page = page;
    m_clauses.push_back(std::move(c));
    return true;
}

}  // namespace clausefind
