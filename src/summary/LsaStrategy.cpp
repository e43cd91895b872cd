#include "summary/LsaStrategy.hpp"

#include <algorithm>
#include <cmath>
#include <map>

namespace newscheckr {

static const size_t kPowerIterations = 200;
static const double kPowerTolerance = 1e-10;
static const double kZeroEigen = 1e-12;

static std::vector<double> multiply(const Matrix& m, const std::vector<double>& v) {
    std::vector<double> out(v.size(), 0.0);
    for (size_t i = 0; i < m.size(); ++i) {
        double acc = 0.0;
        for (size_t j = 0; j < v.size(); ++j) acc += m[i][j] * v[j];
        out[i] = acc;
    }
    return out;
}

static double norm2(const std::vector<double>& v) {
    double s = 0.0;
    for (double x : v) s += x * x;
    return std::sqrt(s);
}

// dominant eigenpair of a symmetric PSD matrix; eigenvalue 0 when m is (numerically) zero
static double dominant_eigen(const Matrix& m, std::vector<double>& vec) {
    const size_t n = m.size();
    vec.assign(n, 0.0);
    for (size_t i = 0; i < n; ++i) vec[i] = 1.0 / (double)(i + 1);
    double nv = norm2(vec);
    for (double& x : vec) x /= nv;

    double lambda = 0.0;
    for (size_t it = 0; it < kPowerIterations; ++it) {
        std::vector<double> next = multiply(m, vec);
        const double nn = norm2(next);
        if (nn <= kZeroEigen) return 0.0;
        for (double& x : next) x /= nn;

        double delta = 0.0;
        for (size_t i = 0; i < n; ++i) delta += std::fabs(next[i] - vec[i]);
        vec.swap(next);
        lambda = nn;
        if (delta < kPowerTolerance) break;
    }

    // Rayleigh quotient for the final estimate
    const std::vector<double> mv = multiply(m, vec);
    double rq = 0.0;
    for (size_t i = 0; i < n; ++i) rq += vec[i] * mv[i];
    return rq > 0.0 ? rq : lambda;
}

std::vector<double> LsaStrategy::score_sentences(const std::vector<std::string>& sentences) const {
    const auto terms = sentence_terms(sentences);
    const size_t n = sentences.size();

    std::map<std::string, std::vector<double>> rows;  // term -> counts per sentence
    for (size_t j = 0; j < n; ++j) {
        for (const auto& t : terms[j]) {
            auto& row = rows[t];
            if (row.empty()) row.assign(n, 0.0);
            row[j] += 1.0;
        }
    }
    if (rows.empty()) throw StrategyError("lsa: no content words");

    // Gram matrix G = A^T A (sentence x sentence)
    Matrix g(n, std::vector<double>(n, 0.0));
    for (const auto& kv : rows) {
        const auto& r = kv.second;
        for (size_t a = 0; a < n; ++a) {
            if (r[a] == 0.0) continue;
            for (size_t b = 0; b < n; ++b) g[a][b] += r[a] * r[b];
        }
    }

    const size_t dims = std::min(n, rows.size());
    std::vector<double> sigmas;
    std::vector<std::vector<double>> vectors;

    for (size_t k = 0; k < dims; ++k) {
        std::vector<double> v;
        const double lambda = dominant_eigen(g, v);
        if (lambda <= kZeroEigen) break;

        sigmas.push_back(std::sqrt(lambda));
        vectors.push_back(v);

        for (size_t a = 0; a < n; ++a) {
            for (size_t b = 0; b < n; ++b) g[a][b] -= lambda * v[a] * v[b];
        }
    }
    if (sigmas.empty()) throw StrategyError("lsa: term-sentence matrix is zero");

    const double cutoff = m_min_sigma_ratio * sigmas.front();

    std::vector<double> scores(n, 0.0);
    for (size_t j = 0; j < n; ++j) {
        double acc = 0.0;
        for (size_t k = 0; k < sigmas.size(); ++k) {
            if (sigmas[k] < cutoff) continue;
            const double p = sigmas[k] * vectors[k][j];
            acc += p * p;
        }
        scores[j] = std::sqrt(acc);
    }
    return scores;
}

}  // namespace newscheckr
