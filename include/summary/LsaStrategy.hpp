#pragma once

#include "summary/SummaryStrategy.hpp"

namespace newscheckr {

// Latent semantic analysis over the term-by-sentence count matrix. Singular
// triplets come from power iteration with deflation on the sentence Gram
// matrix; a sentence's salience is the length of its projection weighted by
// singular value, over dimensions with sigma >= min_sigma_ratio * sigma_max.
class LsaStrategy final : public SummaryStrategy {
public:
    explicit LsaStrategy(double min_sigma_ratio = 0.5) : m_min_sigma_ratio(min_sigma_ratio) {}

    const char* name() const override { return "lsa"; }
    std::vector<double> score_sentences(const std::vector<std::string>& sentences) const override;

private:
    double m_min_sigma_ratio;
};

}  // namespace newscheckr
