#pragma once

#include "scrape/Scraper.hpp"

#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace newscheckr {
namespace scrape {

// Serves articles from a JSON fixture keyed by URL, for offline runs:
//   { "<url>": { "title": "...", "text": "...", "authors": [...],
//                "published_at": "...", "source": "example.com" },
//     "<url>": { "error": "paywalled" | "unreachable" | "no-content" |
//                         "malformed-url" | "timeout" } }
// Unknown URLs fail as unreachable.
class MockScraper final : public Scraper {
public:
    explicit MockScraper(const nlohmann::json& fixture);

    // Throws std::runtime_error naming the path on unreadable or malformed files.
    static MockScraper from_file(const std::string& path);

    Article scrape(const std::string& url, double timeout_seconds) override;

    size_t size() const { return m_entries.size(); }

private:
    struct Entry {
        Article article;
        std::string error;
    };

    std::unordered_map<std::string, Entry> m_entries;
};

}  // namespace scrape
}  // namespace newscheckr
