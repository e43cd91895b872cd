#include "news/CredibilityClassifier.hpp"

#include <cmath>

namespace newscheckr {

static double clamp(double x, double lo, double hi) {
    if (x < lo) return lo;
    if (x > hi) return hi;
    return x;
}

CredibilityClassifier::CredibilityClassifier(const TreeEnsemble& model, BlendWeights weights)
    : m_model(model), m_weights(weights) {}

double CredibilityClassifier::probability(const FeatureVector& v) const {
    return m_model.predict_proba(v);
}

double CredibilityClassifier::blend(double probability, const SourceRating& rating) const {
    const double p = clamp(probability, 0.0, 1.0);
    const double prior = clamp(rating.reputation_score, 0.0, 100.0) / 100.0;
    return clamp(100.0 * (m_weights.model * p + m_weights.source * prior), 0.0, 100.0);
}

double CredibilityClassifier::score(const FeatureVector& v, const SourceRating& rating) const {
    return blend(probability(v), rating);
}

double CredibilityClassifier::source_only(const SourceRating& rating) {
    return clamp(rating.reputation_score, 0.0, 100.0);
}

double finalize_score(double raw, double fallback) {
    double x = std::isfinite(raw) ? raw : fallback;
    if (!std::isfinite(x)) x = 0.0;
    return clamp(std::round(x * 10.0) / 10.0, 0.0, 100.0);
}

}  // namespace newscheckr
