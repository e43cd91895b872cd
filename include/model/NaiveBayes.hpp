#pragma once

#include "news/Models.hpp"
#include "text/FeatureVector.hpp"

#include <array>
#include <vector>

namespace newscheckr {

struct NaiveBayesClass {
    BiasLabel label = BiasLabel::Center;
    double log_prior = 0.0;
    std::vector<double> log_probs;   // term_id -> log P(term | class), dense over the vocabulary
};

using BiasProbabilities = std::array<double, kBiasClassCount>;  // indexed by BiasLabel

// Multinomial naive Bayes over TF-IDF weights:
// jll(c) = log_prior(c) + sum_i x_i * log P(term_i | c), softmax over classes.
class NaiveBayesModel {
public:
    NaiveBayesModel() = default;

    // Requires exactly one class per BiasLabel, each with vocab_size finite log probs.
    // Throws std::invalid_argument otherwise.
    NaiveBayesModel(std::vector<NaiveBayesClass> classes, size_t vocab_size);

    BiasProbabilities predict_proba(const FeatureVector& v) const;

    size_t vocab_size() const { return m_vocab_size; }

private:
    std::array<NaiveBayesClass, kBiasClassCount> m_classes;
    size_t m_vocab_size = 0;
};

}  // namespace newscheckr
