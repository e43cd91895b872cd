#pragma once

#include "model/NaiveBayes.hpp"
#include "news/Models.hpp"
#include "text/FeatureVector.hpp"

namespace newscheckr {

class BiasClassifier {
public:
    BiasClassifier(const NaiveBayesModel& model, double tie_epsilon);

    // Argmax class with its probability as confidence. When the top two
    // probabilities are closer than tie_epsilon the result is Center, with the
    // Center probability as confidence.
    BiasResult classify(const FeatureVector& v) const;

    BiasProbabilities probabilities(const FeatureVector& v) const;

private:
    const NaiveBayesModel& m_model;
    double m_tie_epsilon;
};

}  // namespace newscheckr
