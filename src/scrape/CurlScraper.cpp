#include "scrape/CurlScraper.hpp"

#include "news/Errors.hpp"
#include "news/SourceRegistry.hpp"
#include "scrape/HtmlText.hpp"
#include "scrape/ProcUtil.hpp"

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace newscheckr {
namespace scrape {

static const char* kStatusMarker = "\n@@newscheckr-http-status:";

CurlScraper::CurlScraper(std::string curl_path, size_t min_text_chars)
    : m_curl(std::move(curl_path)), m_min_text_chars(min_text_chars) {}

void raise_for_curl_exit(int exit_code, const std::string& url) {
    switch (exit_code) {
        case 0:
            return;
        case 28:
            throw TimeoutError("timed out fetching " + url);
        case 3:
            throw ScrapeError(ScrapeFailure::MalformedUrl, "curl rejected url " + url);
        case 6:
            throw ScrapeError(ScrapeFailure::Unreachable, "could not resolve host for " + url);
        case 7:
            throw ScrapeError(ScrapeFailure::Unreachable, "could not connect to " + url);
        default: {
            std::ostringstream msg;
            msg << "curl failed with exit code " << exit_code << " for " << url;
            throw ScrapeError(ScrapeFailure::Unreachable, msg.str());
        }
    }
}

void raise_for_http_status(int status, const std::string& url) {
    if (status >= 200 && status < 400) return;

    std::ostringstream msg;
    msg << "HTTP " << status << " from " << url;

    if (status == 401 || status == 402 || status == 403 || status == 451) {
        throw ScrapeError(ScrapeFailure::Paywalled, msg.str());
    }
    if (status == 404 || status == 410) {
        throw ScrapeError(ScrapeFailure::NoContent, msg.str());
    }
    if (status >= 500 || status == 408 || status == 429 || status <= 0) {
        throw ScrapeError(ScrapeFailure::Unreachable, msg.str());
    }
    throw ScrapeError(ScrapeFailure::NoContent, msg.str());
}

Article CurlScraper::scrape(const std::string& url, double timeout_seconds) {
    const std::string domain = domain_from_url(url);
    if (domain.empty()) throw ScrapeError(ScrapeFailure::MalformedUrl, "not an http(s) url: " + url);

    std::ostringstream max_time;
    max_time << timeout_seconds;

    const std::vector<std::string> argv = {
        m_curl, "-sS", "-L", "--compressed",
        "--max-time", max_time.str(),
        "--max-redirs", "5",
        "-A", "Mozilla/5.0 (compatible; newscheckr/1.0)",
        "-w", std::string(kStatusMarker) + "%{http_code}",
        url
    };

    procutil::ProcResult res;
    try {
        res = procutil::run_capture(argv);
    } catch (const std::runtime_error& e) {
        throw ScrapeError(ScrapeFailure::Unreachable, std::string("cannot run curl: ") + e.what());
    }

    raise_for_curl_exit(res.exit_code, url);

    const size_t marker = res.output.rfind(kStatusMarker);
    if (marker == std::string::npos) {
        throw ScrapeError(ScrapeFailure::Unreachable, "no HTTP status from curl for " + url);
    }
    const int status = std::atoi(res.output.c_str() + marker + std::string(kStatusMarker).size());
    raise_for_http_status(status, url);

    const HtmlDocument doc = extract_html(res.output.substr(0, marker));
    if (doc.text.size() < m_min_text_chars) {
        throw ScrapeError(ScrapeFailure::NoContent, "no article text found at " + url);
    }

    std::cerr << "Scraper: fetched " << url << " (" << doc.text.size() << " chars)\n";

    Article a;
    a.url = url;
    a.source_domain = domain;
    a.title = doc.title;
    a.text = doc.text;
    a.authors = doc.authors;
    a.published_at = doc.published_at;
    return a;
}

}  // namespace scrape
}  // namespace newscheckr
