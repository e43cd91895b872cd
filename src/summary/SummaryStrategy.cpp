#include "summary/SummaryStrategy.hpp"
#include "text/TextUtil.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace newscheckr {

std::string SummaryStrategy::summarize(const std::string& text, size_t max_sentences) const {
    const auto sentences = textutil::split_sentences(text);
    if (sentences.size() < 2) {
        throw StrategyError(std::string(name()) + ": needs at least two sentences");
    }

    const std::vector<double> scores = score_sentences(sentences);
    if (scores.size() != sentences.size()) {
        throw StrategyError(std::string(name()) + ": score count does not match sentence count");
    }
    for (double s : scores) {
        if (!std::isfinite(s)) throw StrategyError(std::string(name()) + ": non-finite sentence score");
    }

    return join_sentences(sentences, select_top(scores, max_sentences));
}

std::vector<size_t> select_top(const std::vector<double>& scores, size_t k) {
    std::vector<size_t> idx(scores.size());
    std::iota(idx.begin(), idx.end(), 0);

    std::stable_sort(idx.begin(), idx.end(), [&](size_t a, size_t b) {
        return scores[a] > scores[b];
    });

    if (idx.size() > k) idx.resize(k);
    std::sort(idx.begin(), idx.end());
    return idx;
}

std::string join_sentences(const std::vector<std::string>& sentences, const std::vector<size_t>& picked) {
    std::string out;
    for (size_t i : picked) {
        if (!out.empty()) out += ' ';
        out += sentences.at(i);
    }
    return out;
}

std::vector<double> weighted_pagerank(const Matrix& w, double damping, size_t max_iter, double tol) {
    const size_t n = w.size();
    if (n == 0) return {};

    std::vector<double> row_sum(n, 0.0);
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) row_sum[i] += w[i][j];
    }

    const double base = (1.0 - damping) / (double)n;
    std::vector<double> rank(n, 1.0 / (double)n);
    std::vector<double> next(n, 0.0);

    for (size_t it = 0; it < max_iter; ++it) {
        for (size_t i = 0; i < n; ++i) {
            double acc = 0.0;
            for (size_t j = 0; j < n; ++j) {
                if (w[j][i] > 0.0 && row_sum[j] > 0.0) acc += w[j][i] / row_sum[j] * rank[j];
            }
            next[i] = base + damping * acc;
        }

        double delta = 0.0;
        for (size_t i = 0; i < n; ++i) delta += std::fabs(next[i] - rank[i]);
        rank.swap(next);
        if (delta < tol) break;
    }
    return rank;
}

std::vector<std::vector<std::string>> sentence_terms(const std::vector<std::string>& sentences) {
    std::vector<std::vector<std::string>> out;
    out.reserve(sentences.size());
    for (const auto& s : sentences) out.push_back(textutil::content_tokens(s));
    return out;
}

}  // namespace newscheckr
