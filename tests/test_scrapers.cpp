#include "news/Errors.hpp"
#include "scrape/BoundedScraper.hpp"
#include "scrape/CurlScraper.hpp"
#include "scrape/MockScraper.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace newscheckr;
using namespace newscheckr::scrape;

template <class F>
static ScrapeFailure failure_of(F&& f) {
    try {
        f();
    } catch (const TimeoutError&) {
        throw;
    } catch (const ScrapeError& e) {
        return e.reason();
    }
    ADD_FAILURE() << "expected ScrapeError";
    return ScrapeFailure::NoContent;
}

TEST(CurlExit, MapsToFailures) {
    EXPECT_NO_THROW(raise_for_curl_exit(0, "http://a.com"));
    EXPECT_THROW(raise_for_curl_exit(28, "http://a.com"), TimeoutError);
    EXPECT_EQ(failure_of([] { raise_for_curl_exit(3, "http://a.com"); }), ScrapeFailure::MalformedUrl);
    EXPECT_EQ(failure_of([] { raise_for_curl_exit(6, "http://a.com"); }), ScrapeFailure::Unreachable);
    EXPECT_EQ(failure_of([] { raise_for_curl_exit(7, "http://a.com"); }), ScrapeFailure::Unreachable);
    EXPECT_EQ(failure_of([] { raise_for_curl_exit(35, "http://a.com"); }), ScrapeFailure::Unreachable);
}

TEST(HttpStatus, MapsToFailures) {
    EXPECT_NO_THROW(raise_for_http_status(200, "u"));
    EXPECT_NO_THROW(raise_for_http_status(301, "u"));
    EXPECT_EQ(failure_of([] { raise_for_http_status(402, "u"); }), ScrapeFailure::Paywalled);
    EXPECT_EQ(failure_of([] { raise_for_http_status(403, "u"); }), ScrapeFailure::Paywalled);
    EXPECT_EQ(failure_of([] { raise_for_http_status(404, "u"); }), ScrapeFailure::NoContent);
    EXPECT_EQ(failure_of([] { raise_for_http_status(503, "u"); }), ScrapeFailure::Unreachable);
    EXPECT_EQ(failure_of([] { raise_for_http_status(429, "u"); }), ScrapeFailure::Unreachable);
    EXPECT_EQ(failure_of([] { raise_for_http_status(0, "u"); }), ScrapeFailure::Unreachable);
    EXPECT_EQ(failure_of([] { raise_for_http_status(418, "u"); }), ScrapeFailure::NoContent);
}

TEST(HttpStatus, TimeoutIsAlsoAScrapeError) {
    try {
        raise_for_curl_exit(28, "http://slow.example.com");
        FAIL() << "expected TimeoutError";
    } catch (const ScrapeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::Timeout);
        EXPECT_FALSE(e.transient());
    }
}

namespace {

// Stands in for the curl executable: prints a canned body and status marker.
class FakeCurl : public ::testing::Test {
protected:
    void TearDown() override {
        if (!m_path.empty()) fs::remove(m_path);
    }

    std::string install(const std::string& body, int status, int exit_code = 0) {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        m_path = fs::temp_directory_path() / (std::string("newscheckr_fake_curl_") + info->name());

        std::ofstream out(m_path);
        out << "#!/bin/sh\n"
            << "cat <<'HTML'\n" << body << "\nHTML\n"
            << "printf '\\n@@newscheckr-http-status:" << status << "'\n"
            << "exit " << exit_code << "\n";
        out.close();
        fs::permissions(m_path, fs::perms::owner_all);
        return m_path.string();
    }

    fs::path m_path;
};

const char* kArticleHtml =
    "<html><head><meta property=\"og:title\" content=\"Budget Passes\">"
    "<meta name=\"author\" content=\"Jane Doe\"></head><body><article>"
    "<p>The city council approved the new transit budget on Monday after a long debate.</p>"
    "<p>Officials said construction of the new bus shelters would start in the spring.</p>"
    "</article></body></html>";

}  // namespace

TEST_F(FakeCurl, FetchesAndExtractsArticle) {
    CurlScraper scraper(install(kArticleHtml, 200));
    const Article a = scraper.scrape("https://www.Example.com/news/budget", 5.0);

    EXPECT_EQ(a.url, "https://www.Example.com/news/budget");
    EXPECT_EQ(a.source_domain, "example.com");
    EXPECT_EQ(a.title, "Budget Passes");
    ASSERT_EQ(a.authors.size(), 1u);
    EXPECT_EQ(a.authors[0], "Jane Doe");
    EXPECT_EQ(a.text.find("The city council approved"), 0u);
    EXPECT_NE(a.text.find("\n\nOfficials said"), std::string::npos);
}

TEST_F(FakeCurl, PaywallStatus) {
    CurlScraper scraper(install(kArticleHtml, 403));
    EXPECT_EQ(failure_of([&] { scraper.scrape("https://example.com/x", 5.0); }), ScrapeFailure::Paywalled);
}

TEST_F(FakeCurl, ShortPageIsNoContent) {
    CurlScraper scraper(install("<html><body><p>Subscribe.</p></body></html>", 200));
    EXPECT_EQ(failure_of([&] { scraper.scrape("https://example.com/x", 5.0); }), ScrapeFailure::NoContent);
}

TEST_F(FakeCurl, CurlTimeoutExit) {
    CurlScraper scraper(install("", 0, 28));
    EXPECT_THROW(scraper.scrape("https://example.com/x", 0.5), TimeoutError);
}

TEST(CurlScraper, MissingExecutableIsUnreachable) {
    CurlScraper scraper("/nonexistent/newscheckr/curl");
    EXPECT_EQ(failure_of([&] { scraper.scrape("https://example.com/x", 1.0); }), ScrapeFailure::Unreachable);
}

TEST(CurlScraper, RejectsUrlWithoutScheme) {
    CurlScraper scraper("/nonexistent/newscheckr/curl");
    EXPECT_EQ(failure_of([&] { scraper.scrape("example.com/x", 1.0); }), ScrapeFailure::MalformedUrl);
}

static json mock_fixture() {
    return {
        {"https://www.reuters.com/a", {
            {"title", "Budget"}, {"text", "Council approved the budget."},
            {"authors", json::array({"Jane Doe"})}, {"published_at", "2024-03-05"}}},
        {"https://mirror.example.org/b", {{"text", "Body."}, {"source", "WWW.BBC.co.uk"}}},
        {"https://slow.example.com/", {{"error", "timeout"}}},
        {"https://paid.example.com/", {{"error", "paywalled"}}},
        {"https://empty.example.com/", {{"error", "no-content"}}}
    };
}

TEST(MockScraper, ServesFixtureArticles) {
    MockScraper mock(mock_fixture());
    EXPECT_EQ(mock.size(), 5u);

    const Article a = mock.scrape("https://www.reuters.com/a", 1.0);
    EXPECT_EQ(a.url, "https://www.reuters.com/a");
    EXPECT_EQ(a.source_domain, "reuters.com");
    EXPECT_EQ(a.title, "Budget");
    EXPECT_EQ(a.text, "Council approved the budget.");
    ASSERT_TRUE(a.published_at.has_value());
    EXPECT_EQ(*a.published_at, "2024-03-05");

    EXPECT_EQ(mock.scrape("https://mirror.example.org/b", 1.0).source_domain, "bbc.co.uk");
}

TEST(MockScraper, RaisesConfiguredErrors) {
    MockScraper mock(mock_fixture());
    EXPECT_THROW(mock.scrape("https://slow.example.com/", 1.0), TimeoutError);
    EXPECT_EQ(failure_of([&] { mock.scrape("https://paid.example.com/", 1.0); }), ScrapeFailure::Paywalled);
    EXPECT_EQ(failure_of([&] { mock.scrape("https://empty.example.com/", 1.0); }), ScrapeFailure::NoContent);
    EXPECT_EQ(failure_of([&] { mock.scrape("https://unknown.example.com/", 1.0); }), ScrapeFailure::Unreachable);
}

TEST(MockScraper, RejectsBadFixtures) {
    const json bad_reason = {{"https://a.com/", {{"error", "gone"}}}};
    const json missing_text = {{"https://a.com/", {{"title", "no text"}}}};
    EXPECT_THROW(MockScraper{json::array()}, std::runtime_error);
    EXPECT_THROW(MockScraper{bad_reason}, std::runtime_error);
    EXPECT_THROW(MockScraper{missing_text}, std::runtime_error);
    EXPECT_THROW(MockScraper::from_file("/nonexistent/fixture.json"), std::runtime_error);
}

namespace {

class SlowScraper final : public Scraper {
public:
    Article scrape(const std::string& url, double) override {
        const int now = ++m_active;
        int seen = m_peak.load();
        while (now > seen && !m_peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        --m_active;

        Article a;
        a.url = url;
        return a;
    }

    int peak() const { return m_peak.load(); }

private:
    std::atomic<int> m_active{0};
    std::atomic<int> m_peak{0};
};

class ThrowingScraper final : public Scraper {
public:
    Article scrape(const std::string& url, double) override {
        throw ScrapeError(ScrapeFailure::Unreachable, "down: " + url);
    }
};

}  // namespace

TEST(BoundedScraper, CapsConcurrentScrapes) {
    SlowScraper slow;
    BoundedScraper bounded(slow, 2);
    EXPECT_EQ(bounded.max_in_flight(), 2u);

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&bounded, i] {
            bounded.scrape("https://example.com/" + std::to_string(i), 1.0);
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_LE(slow.peak(), 2);
    EXPECT_GE(slow.peak(), 1);
    EXPECT_EQ(bounded.in_flight(), 0u);
}

TEST(BoundedScraper, ReleasesSlotOnError) {
    ThrowingScraper down;
    BoundedScraper bounded(down, 1);
    EXPECT_THROW(bounded.scrape("https://a.com/", 1.0), ScrapeError);
    EXPECT_THROW(bounded.scrape("https://a.com/", 1.0), ScrapeError);
    EXPECT_EQ(bounded.in_flight(), 0u);
}

TEST(BoundedScraper, RejectsZeroLimit) {
    ThrowingScraper down;
    EXPECT_THROW(BoundedScraper(down, 0), std::invalid_argument);
}
