#pragma once

#include "scrape/Scraper.hpp"

#include <string>

namespace newscheckr {
namespace scrape {

// Fetches pages with the curl executable (one child process per request,
// bounded by --max-time) and extracts article text from the HTML.
class CurlScraper final : public Scraper {
public:
    explicit CurlScraper(std::string curl_path = "curl", size_t min_text_chars = 100);

    Article scrape(const std::string& url, double timeout_seconds) override;

private:
    std::string m_curl;
    size_t m_min_text_chars;
};

// Throws the ScrapeError matching a non-zero curl exit code (28 -> TimeoutError).
void raise_for_curl_exit(int exit_code, const std::string& url);

// Throws the ScrapeError matching a failed HTTP status; 2xx/3xx pass.
void raise_for_http_status(int status, const std::string& url);

}  // namespace scrape
}  // namespace newscheckr
