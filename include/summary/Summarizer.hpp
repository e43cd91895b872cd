#pragma once

#include "summary/SummaryStrategy.hpp"

#include <memory>
#include <string>
#include <vector>

namespace newscheckr {

struct SummaryOutcome {
    std::string summary;
    std::string method;   // strategy name, "verbatim" or "positional"
};

// Ordered fallback chain of extractive strategies.
//   1. each strategy in order; StrategyError falls through to the next
//   2. text with <= max_sentences sentences is returned verbatim (trimmed)
//   3. positional scoring (0.6 * position + 0.4 * length), which cannot fail
// Only text without any sentence boundary raises SummarizationError.
class Summarizer {
public:
    explicit Summarizer(std::vector<std::unique_ptr<SummaryStrategy>> strategies);

    // TextRank, LexRank, LSA
    static Summarizer with_default_strategies();

    SummaryOutcome summarize(const std::string& text, size_t max_sentences = 2) const;

    size_t strategy_count() const { return m_strategies.size(); }

private:
    std::vector<std::unique_ptr<SummaryStrategy>> m_strategies;
};

// Positional fallback scores: earlier and longer sentences score higher.
std::vector<double> positional_scores(const std::vector<std::string>& sentences);

}  // namespace newscheckr
