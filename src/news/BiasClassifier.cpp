#include "news/BiasClassifier.hpp"

namespace newscheckr {

BiasClassifier::BiasClassifier(const NaiveBayesModel& model, double tie_epsilon)
    : m_model(model), m_tie_epsilon(tie_epsilon) {}

BiasProbabilities BiasClassifier::probabilities(const FeatureVector& v) const {
    return m_model.predict_proba(v);
}

BiasResult BiasClassifier::classify(const FeatureVector& v) const {
    const BiasProbabilities probs = probabilities(v);

    size_t top = 0;
    for (size_t c = 1; c < kBiasClassCount; ++c) {
        if (probs[c] > probs[top]) top = c;
    }

    double second = -1.0;
    for (size_t c = 0; c < kBiasClassCount; ++c) {
        if (c != top && probs[c] > second) second = probs[c];
    }

    const size_t center = static_cast<size_t>(BiasLabel::Center);

    BiasResult r;
    if (probs[top] - second < m_tie_epsilon) {
        r.label = BiasLabel::Center;
        r.confidence = probs[center];
    } else {
        r.label = static_cast<BiasLabel>(top);
        r.confidence = probs[top];
    }
    return r;
}

}  // namespace newscheckr
