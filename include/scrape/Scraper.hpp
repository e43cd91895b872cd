#pragma once

#include "news/Models.hpp"

#include <string>

namespace newscheckr {
namespace scrape {

// URL -> Article. Failures are ScrapeError (TimeoutError when the deadline is hit).
// Implementations are shared across requests and must be safe to call concurrently.
class Scraper {
public:
    virtual ~Scraper() = default;

    virtual Article scrape(const std::string& url, double timeout_seconds) = 0;
};

}  // namespace scrape
}  // namespace newscheckr
