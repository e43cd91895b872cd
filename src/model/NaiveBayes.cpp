#include "model/NaiveBayes.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace newscheckr {

NaiveBayesModel::NaiveBayesModel(std::vector<NaiveBayesClass> classes, size_t vocab_size)
    : m_vocab_size(vocab_size) {
    if (classes.size() != kBiasClassCount) {
        throw std::invalid_argument("bias model needs exactly 3 classes, got " + std::to_string(classes.size()));
    }

    std::array<bool, kBiasClassCount> seen{};
    for (auto& c : classes) {
        const size_t idx = static_cast<size_t>(c.label);
        if (seen[idx]) throw std::invalid_argument(std::string("duplicate bias class: ") + bias_str(c.label));
        seen[idx] = true;

        if (!std::isfinite(c.log_prior) || c.log_prior > 0.0) {
            throw std::invalid_argument(std::string("invalid log prior for class ") + bias_str(c.label));
        }
        if (c.log_probs.size() != vocab_size) {
            throw std::invalid_argument(std::string("class ") + bias_str(c.label) + " has " +
                                        std::to_string(c.log_probs.size()) + " log probs, vocabulary has " +
                                        std::to_string(vocab_size));
        }
        for (double lp : c.log_probs) {
            if (!std::isfinite(lp) || lp > 0.0) {
                throw std::invalid_argument(std::string("invalid log prob in class ") + bias_str(c.label));
            }
        }
        m_classes[idx] = std::move(c);
    }
}

BiasProbabilities NaiveBayesModel::predict_proba(const FeatureVector& v) const {
    BiasProbabilities jll{};
    for (size_t c = 0; c < kBiasClassCount; ++c) {
        const auto& cls = m_classes[c];
        double s = cls.log_prior;
        for (const auto& w : v.weights) {
            if (w.first < cls.log_probs.size()) s += (double)w.second * cls.log_probs[w.first];
        }
        jll[c] = s;
    }

    // log-sum-exp
    double mx = jll[0];
    for (double x : jll) if (x > mx) mx = x;

    double denom = 0.0;
    BiasProbabilities out{};
    for (size_t c = 0; c < kBiasClassCount; ++c) {
        out[c] = std::exp(jll[c] - mx);
        denom += out[c];
    }
    for (double& p : out) p /= denom;
    return out;
}

}  // namespace newscheckr
