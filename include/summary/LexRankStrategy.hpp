#pragma once

#include "summary/SummaryStrategy.hpp"

namespace newscheckr {

// Continuous LexRank: cosine similarity of per-sentence TF-IDF vectors, with IDF
// computed over the article's own sentences.
class LexRankStrategy final : public SummaryStrategy {
public:
    explicit LexRankStrategy(double damping = 0.85) : m_damping(damping) {}

    const char* name() const override { return "lexrank"; }
    std::vector<double> score_sentences(const std::vector<std::string>& sentences) const override;

private:
    double m_damping;
};

}  // namespace newscheckr
