#include "scrape/MockScraper.hpp"

#include "io/JsonIO.hpp"
#include "news/Errors.hpp"
#include "news/SourceRegistry.hpp"

#include <stdexcept>

using json = nlohmann::json;

namespace newscheckr {
namespace scrape {

static bool known_error(const std::string& e) {
    return e == "timeout" || e == "unreachable" || e == "paywalled" || e == "no-content" || e == "malformed-url";
}

MockScraper::MockScraper(const json& fixture) {
    jsonio::require_object(fixture, "fixture");

    for (auto it = fixture.begin(); it != fixture.end(); ++it) {
        const std::string where = "fixture[\"" + it.key() + "\"]";
        const json& e = it.value();
        jsonio::require_object(e, where);

        Entry entry;
        if (e.contains("error")) {
            entry.error = jsonio::require_string(e, "error", where);
            if (!known_error(entry.error)) throw std::runtime_error(where + ".error is not a scrape failure reason");
        } else {
            Article& a = entry.article;
            a.url = it.key();
            a.text = jsonio::require_string(e, "text", where);
            if (e.contains("title")) a.title = jsonio::require_string(e, "title", where);
            if (e.contains("authors")) a.authors = jsonio::require_string_array(e, "authors", where);
            if (e.contains("published_at") && !e["published_at"].is_null()) {
                a.published_at = jsonio::require_string(e, "published_at", where);
            }
            a.source_domain = e.contains("source") ? normalize_domain(jsonio::require_string(e, "source", where))
                                                   : domain_from_url(it.key());
        }
        m_entries.emplace(it.key(), std::move(entry));
    }
}

MockScraper MockScraper::from_file(const std::string& path) {
    return MockScraper(jsonio::read_json_file(path));
}

Article MockScraper::scrape(const std::string& url, double) {
    auto it = m_entries.find(url);
    if (it == m_entries.end()) {
        throw ScrapeError(ScrapeFailure::Unreachable, "no fixture for " + url);
    }

    const std::string& err = it->second.error;
    if (err.empty()) return it->second.article;

    if (err == "timeout") throw TimeoutError("timed out fetching " + url);
    if (err == "paywalled") throw ScrapeError(ScrapeFailure::Paywalled, "paywall at " + url);
    if (err == "no-content") throw ScrapeError(ScrapeFailure::NoContent, "no article text found at " + url);
    if (err == "malformed-url") throw ScrapeError(ScrapeFailure::MalformedUrl, "malformed url " + url);
    throw ScrapeError(ScrapeFailure::Unreachable, "could not reach " + url);
}

}  // namespace scrape
}  // namespace newscheckr
