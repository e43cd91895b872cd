#pragma once

#include "model/TreeEnsemble.hpp"
#include "news/Models.hpp"
#include "text/FeatureVector.hpp"

namespace newscheckr {

struct BlendWeights {
    double model = 0.7;
    double source = 0.3;
};

class CredibilityClassifier {
public:
    CredibilityClassifier(const TreeEnsemble& model, BlendWeights weights);

    // raw probability of high credibility from the text alone
    double probability(const FeatureVector& v) const;

    // 100 * (w_model * p + w_source * reputation / 100), in [0,100]
    double score(const FeatureVector& v, const SourceRating& rating) const;

    double blend(double probability, const SourceRating& rating) const;

    // used when no feature vector could be built
    static double source_only(const SourceRating& rating);

private:
    const TreeEnsemble& m_model;
    BlendWeights m_weights;
};

// one decimal, clamped to [0,100]; non-finite input -> fallback
double finalize_score(double raw, double fallback);

}  // namespace newscheckr
