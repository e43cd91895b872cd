#pragma once

#include "text/FeatureVector.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace newscheckr {

// Fixed term list from model training. Term id = position in the list.
// Terms are unigrams or space-joined bigrams over stopword-filtered tokens.
class Vocabulary {
public:
    Vocabulary() = default;

    // Throws std::invalid_argument on size mismatch, empty or duplicate terms,
    // or non-finite / negative idf.
    Vocabulary(std::vector<std::string> terms, std::vector<double> idf);

    size_t size() const { return m_terms.size(); }
    bool has_bigrams() const { return m_has_bigrams; }

    bool lookup(const std::string& term, uint32_t& id) const;
    const std::string& term(uint32_t id) const { return m_terms.at(id); }
    double idf(uint32_t id) const { return m_idf.at(id); }

    uint32_t stat_base() const { return static_cast<uint32_t>(m_terms.size()); }
    uint32_t feature_count() const { return stat_base() + static_cast<uint32_t>(kStatFeatureCount); }

    // "tfidf:<term>" or "stat:<name>" -> feature id
    bool resolve_feature(const std::string& name, uint32_t& id) const;
    std::string feature_name(uint32_t id) const;

private:
    std::vector<std::string> m_terms;                 // term_id -> term
    std::vector<double> m_idf;                        // term_id -> idf
    std::unordered_map<std::string, uint32_t> m_term_to_id;
    bool m_has_bigrams = false;
};

}  // namespace newscheckr
