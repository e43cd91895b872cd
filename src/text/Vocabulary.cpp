#include "text/Vocabulary.hpp"

#include <cmath>
#include <stdexcept>

namespace newscheckr {

static const char* kTfidfPrefix = "tfidf:";
static const char* kStatPrefix = "stat:";

static bool starts_with(const std::string& s, const char* prefix, std::string& rest) {
    const std::string p(prefix);
    if (s.compare(0, p.size(), p) != 0) return false;
    rest = s.substr(p.size());
    return true;
}

Vocabulary::Vocabulary(std::vector<std::string> terms, std::vector<double> idf)
    : m_terms(std::move(terms)), m_idf(std::move(idf)) {
    if (m_terms.size() != m_idf.size()) {
        throw std::invalid_argument("vocabulary: " + std::to_string(m_terms.size()) + " terms but " +
                                    std::to_string(m_idf.size()) + " idf weights");
    }

    m_term_to_id.reserve(m_terms.size() * 2 + 8);
    for (size_t id = 0; id < m_terms.size(); ++id) {
        const std::string& t = m_terms[id];
        if (t.empty()) throw std::invalid_argument("vocabulary: empty term at index " + std::to_string(id));
        if (!std::isfinite(m_idf[id]) || m_idf[id] < 0.0) {
            throw std::invalid_argument("vocabulary: invalid idf for term '" + t + "'");
        }
        if (!m_term_to_id.emplace(t, static_cast<uint32_t>(id)).second) {
            throw std::invalid_argument("vocabulary: duplicate term '" + t + "'");
        }
        if (t.find(' ') != std::string::npos) m_has_bigrams = true;
    }
}

bool Vocabulary::lookup(const std::string& term, uint32_t& id) const {
    auto it = m_term_to_id.find(term);
    if (it == m_term_to_id.end()) return false;
    id = it->second;
    return true;
}

bool Vocabulary::resolve_feature(const std::string& name, uint32_t& id) const {
    std::string rest;
    if (starts_with(name, kTfidfPrefix, rest)) {
        return lookup(rest, id);
    }
    if (starts_with(name, kStatPrefix, rest)) {
        StatFeature f;
        if (!parse_stat_feature(rest, f)) return false;
        id = stat_base() + static_cast<uint32_t>(f);
        return true;
    }
    return false;
}

std::string Vocabulary::feature_name(uint32_t id) const {
    if (id < stat_base()) return std::string(kTfidfPrefix) + m_terms[id];
    const uint32_t idx = id - stat_base();
    if (idx < kStatFeatureCount) return std::string(kStatPrefix) + stat_feature_name(static_cast<StatFeature>(idx));
    return "unknown:" + std::to_string(id);
}

}  // namespace newscheckr
