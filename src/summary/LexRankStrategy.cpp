#include "summary/LexRankStrategy.hpp"
#include "text/FeatureVector.hpp"

#include <cmath>
#include <map>
#include <set>

namespace newscheckr {

std::vector<double> LexRankStrategy::score_sentences(const std::vector<std::string>& sentences) const {
    const auto terms = sentence_terms(sentences);
    const size_t n = sentences.size();

    // term ids in lexical order so vectors do not depend on hash order
    std::map<std::string, uint32_t> ids;
    std::map<std::string, size_t> df;
    for (const auto& toks : terms) {
        std::set<std::string> seen(toks.begin(), toks.end());
        for (const auto& t : seen) df[t] += 1;
    }
    if (df.empty()) throw StrategyError("lexrank: no content words");
    for (const auto& kv : df) ids.emplace(kv.first, (uint32_t)ids.size());

    std::vector<SparseWeights> vecs(n);
    std::vector<double> norms(n, 0.0);
    for (size_t i = 0; i < n; ++i) {
        std::map<std::string, size_t> tf;
        for (const auto& t : terms[i]) tf[t] += 1;

        for (const auto& kv : tf) {
            const double idf = 1.0 + std::log((double)n / (double)df[kv.first]);
            const double w = (double)kv.second * idf;
            vecs[i].push_back({ids[kv.first], (float)w});
            norms[i] += w * w;
        }
        sort_and_merge(vecs[i]);
        norms[i] = std::sqrt(norms[i]);
    }

    Matrix w(n, std::vector<double>(n, 0.0));
    bool any_edge = false;
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            if (norms[i] <= 0.0 || norms[j] <= 0.0) continue;
            const double c = dot_sparse(vecs[i], vecs[j]) / (norms[i] * norms[j]);
            if (c > 0.0) {
                w[i][j] = w[j][i] = c;
                any_edge = true;
            }
        }
    }
    if (!any_edge) throw StrategyError("lexrank: similarity matrix is zero");

    return weighted_pagerank(w, m_damping);
}

}  // namespace newscheckr
