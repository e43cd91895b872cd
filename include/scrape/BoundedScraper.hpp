#pragma once

#include "scrape/Scraper.hpp"

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace newscheckr {
namespace scrape {

// Caps the number of scrapes in flight through the wrapped scraper.
// Callers over the limit block until a slot frees up.
class BoundedScraper final : public Scraper {
public:
    // Throws std::invalid_argument when max_in_flight is 0.
    BoundedScraper(Scraper& inner, size_t max_in_flight);

    Article scrape(const std::string& url, double timeout_seconds) override;

    size_t max_in_flight() const { return m_max; }
    size_t in_flight() const;

private:
    void acquire();
    void release();

    Scraper& m_inner;
    size_t m_max;
    size_t m_active = 0;
    mutable std::mutex m_mu;
    std::condition_variable m_cv;
};

}  // namespace scrape
}  // namespace newscheckr
