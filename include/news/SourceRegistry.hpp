#pragma once

#include "news/Models.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace newscheckr {

// Registry key rule: trim, lowercase, strip one leading "www.", drop a trailing dot.
std::string normalize_domain(const std::string& domain);

// Host part of an http(s) URL, normalized with normalize_domain.
// Returns "" when the URL has no scheme or host.
std::string domain_from_url(const std::string& url);

constexpr double kDefaultReputation = 50.0;

// Immutable domain -> reputation table. Exact-match lookup on normalized keys.
class SourceRegistry {
public:
    // Throws std::invalid_argument on duplicate domains or scores outside [0,100].
    explicit SourceRegistry(const std::vector<SourceRating>& ratings);

    // Curated table of known publications, built on first use.
    static const SourceRegistry& builtin();

    // Never fails: a miss yields the neutral default rating for the normalized domain.
    SourceRating lookup(const std::string& domain) const;
    bool contains(const std::string& domain) const;

    // sorted by domain
    std::vector<SourceRating> list() const;
    size_t size() const { return m_ratings.size(); }

    static SourceRating default_rating(const std::string& domain);

private:
    std::unordered_map<std::string, SourceRating> m_ratings;
};

}  // namespace newscheckr
