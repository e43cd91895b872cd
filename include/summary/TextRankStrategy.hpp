#pragma once

#include "summary/SummaryStrategy.hpp"

namespace newscheckr {

// Sentence graph with edge weight = shared content words / (ln|a| + ln|b|),
// ranked by weighted PageRank.
class TextRankStrategy final : public SummaryStrategy {
public:
    explicit TextRankStrategy(double damping = 0.85) : m_damping(damping) {}

    const char* name() const override { return "textrank"; }
    std::vector<double> score_sentences(const std::vector<std::string>& sentences) const override;

private:
    double m_damping;
};

}  // namespace newscheckr
