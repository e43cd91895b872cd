#include "summary/TextRankStrategy.hpp"

#include <cmath>
#include <set>

namespace newscheckr {

static double overlap_similarity(const std::set<std::string>& a, const std::set<std::string>& b) {
    if (a.empty() || b.empty()) return 0.0;

    const double denom = std::log((double)a.size()) + std::log((double)b.size());
    if (denom <= 0.0) return 0.0;  // two one-word sentences

    size_t common = 0;
    for (const auto& t : a) {
        if (b.count(t)) ++common;
    }
    return (double)common / denom;
}

std::vector<double> TextRankStrategy::score_sentences(const std::vector<std::string>& sentences) const {
    const auto terms = sentence_terms(sentences);

    std::vector<std::set<std::string>> sets;
    sets.reserve(terms.size());
    bool any_words = false;
    for (const auto& t : terms) {
        sets.emplace_back(t.begin(), t.end());
        if (!t.empty()) any_words = true;
    }
    if (!any_words) throw StrategyError("textrank: no content words");

    const size_t n = sentences.size();
    Matrix w(n, std::vector<double>(n, 0.0));
    bool any_edge = false;
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            const double s = overlap_similarity(sets[i], sets[j]);
            if (s > 0.0) {
                w[i][j] = w[j][i] = s;
                any_edge = true;
            }
        }
    }
    if (!any_edge) throw StrategyError("textrank: sentence graph has no edges");

    return weighted_pagerank(w, m_damping);
}

}  // namespace newscheckr
