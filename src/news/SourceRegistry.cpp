#include "news/SourceRegistry.hpp"
#include "text/TextUtil.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace newscheckr {

std::string normalize_domain(const std::string& domain) {
    std::string s = textutil::trim(domain);
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (s.compare(0, 4, "www.") == 0) s = s.substr(4);
    if (!s.empty() && s.back() == '.') s.pop_back();
    return s;
}

std::string domain_from_url(const std::string& url) {
    const std::string u = textutil::trim(url);

    const size_t scheme_end = u.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) return "";

    size_t host_begin = scheme_end + 3;
    size_t host_end = u.find_first_of("/?#", host_begin);
    if (host_end == std::string::npos) host_end = u.size();

    std::string authority = u.substr(host_begin, host_end - host_begin);

    // user:pass@host:port
    const size_t at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);
    const size_t colon = authority.find(':');
    if (colon != std::string::npos) authority = authority.substr(0, colon);

    return normalize_domain(authority);
}

SourceRegistry::SourceRegistry(const std::vector<SourceRating>& ratings) {
    m_ratings.reserve(ratings.size() * 2 + 8);
    for (const auto& r : ratings) {
        SourceRating norm = r;
        norm.domain = normalize_domain(r.domain);
        if (norm.domain.empty()) throw std::invalid_argument("source registry: empty domain");
        if (!(r.reputation_score >= 0.0 && r.reputation_score <= 100.0)) {
            throw std::invalid_argument("source registry: reputation out of range for " + norm.domain);
        }
        if (!m_ratings.emplace(norm.domain, norm).second) {
            throw std::invalid_argument("source registry: duplicate domain " + norm.domain);
        }
    }
}

const SourceRegistry& SourceRegistry::builtin() {
    static const SourceRegistry registry({
        // wire services and public broadcasters
        {"reuters.com", 90, BiasLabel::Center},
        {"apnews.com", 92, BiasLabel::Center},
        {"ap.org", 92, BiasLabel::Center},
        {"bbc.com", 88, BiasLabel::Center},
        {"bbc.co.uk", 88, BiasLabel::Center},
        {"npr.org", 87, BiasLabel::Center},
        {"pbs.org", 86, BiasLabel::Center},
        {"economist.com", 85, BiasLabel::Center},
        {"bloomberg.com", 85, BiasLabel::Center},
        {"wsj.com", 84, BiasLabel::Center},
        {"csmonitor.com", 84, BiasLabel::Center},
        {"thehill.com", 72, BiasLabel::Center},

        // left-leaning
        {"nytimes.com", 82, BiasLabel::Left},
        {"washingtonpost.com", 81, BiasLabel::Left},
        {"theguardian.com", 79, BiasLabel::Left},
        {"cnn.com", 75, BiasLabel::Left},
        {"msnbc.com", 70, BiasLabel::Left},
        {"huffpost.com", 62, BiasLabel::Left},

        // right-leaning
        {"foxnews.com", 68, BiasLabel::Right},
        {"nypost.com", 65, BiasLabel::Right},
        {"washingtonexaminer.com", 62, BiasLabel::Right},
        {"dailymail.co.uk", 60, BiasLabel::Right},
        {"breitbart.com", 45, BiasLabel::Right},

        // satire and low credibility
        {"theonion.com", 20, BiasLabel::Center},
        {"babylonbee.com", 20, BiasLabel::Right},
        {"infowars.com", 15, BiasLabel::Right},
    });
    return registry;
}

SourceRating SourceRegistry::default_rating(const std::string& domain) {
    SourceRating r;
    r.domain = normalize_domain(domain);
    r.reputation_score = kDefaultReputation;
    r.known_bias = BiasLabel::Center;
    return r;
}

SourceRating SourceRegistry::lookup(const std::string& domain) const {
    const std::string key = normalize_domain(domain);
    auto it = m_ratings.find(key);
    if (it != m_ratings.end()) return it->second;
    return default_rating(key);
}

bool SourceRegistry::contains(const std::string& domain) const {
    return m_ratings.find(normalize_domain(domain)) != m_ratings.end();
}

std::vector<SourceRating> SourceRegistry::list() const {
    std::vector<SourceRating> out;
    out.reserve(m_ratings.size());
    for (const auto& kv : m_ratings) out.push_back(kv.second);

    std::sort(out.begin(), out.end(), [](const SourceRating& a, const SourceRating& b) {
        return a.domain < b.domain;
    });
    return out;
}

}  // namespace newscheckr
