#include "scrape/BoundedScraper.hpp"

#include <stdexcept>

namespace newscheckr {
namespace scrape {

BoundedScraper::BoundedScraper(Scraper& inner, size_t max_in_flight)
    : m_inner(inner), m_max(max_in_flight) {
    if (m_max == 0) throw std::invalid_argument("BoundedScraper: max_in_flight must be positive");
}

size_t BoundedScraper::in_flight() const {
    std::lock_guard<std::mutex> lock(m_mu);
    return m_active;
}

void BoundedScraper::acquire() {
    std::unique_lock<std::mutex> lock(m_mu);
    m_cv.wait(lock, [this] { return m_active < m_max; });
    ++m_active;
}

void BoundedScraper::release() {
    {
        std::lock_guard<std::mutex> lock(m_mu);
        --m_active;
    }
    m_cv.notify_one();
}

Article BoundedScraper::scrape(const std::string& url, double timeout_seconds) {
    struct Slot {
        BoundedScraper& owner;
        explicit Slot(BoundedScraper& o) : owner(o) { owner.acquire(); }
        ~Slot() { owner.release(); }
    } slot(*this);

    return m_inner.scrape(url, timeout_seconds);
}

}  // namespace scrape
}  // namespace newscheckr
