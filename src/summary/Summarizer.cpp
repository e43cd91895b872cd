#include "summary/Summarizer.hpp"

#include "news/Errors.hpp"
#include "summary/LexRankStrategy.hpp"
#include "summary/LsaStrategy.hpp"
#include "summary/TextRankStrategy.hpp"
#include "text/TextUtil.hpp"

#include <algorithm>
#include <stdexcept>

namespace newscheckr {

Summarizer::Summarizer(std::vector<std::unique_ptr<SummaryStrategy>> strategies)
    : m_strategies(std::move(strategies)) {
    for (const auto& s : m_strategies) {
        if (!s) throw std::invalid_argument("Summarizer: null strategy");
    }
}

Summarizer Summarizer::with_default_strategies() {
    std::vector<std::unique_ptr<SummaryStrategy>> chain;
    chain.push_back(std::make_unique<TextRankStrategy>());
    chain.push_back(std::make_unique<LexRankStrategy>());
    chain.push_back(std::make_unique<LsaStrategy>());
    return Summarizer(std::move(chain));
}

std::vector<double> positional_scores(const std::vector<std::string>& sentences) {
    const size_t n = sentences.size();
    size_t longest = 0;
    for (const auto& s : sentences) longest = std::max(longest, s.size());

    std::vector<double> out(n, 0.0);
    for (size_t i = 0; i < n; ++i) {
        const double position = 1.0 - (double)i / (double)n;
        const double length = longest ? (double)sentences[i].size() / (double)longest : 0.0;
        out[i] = 0.6 * position + 0.4 * length;
    }
    return out;
}

SummaryOutcome Summarizer::summarize(const std::string& text, size_t max_sentences) const {
    if (max_sentences == 0) throw std::invalid_argument("Summarizer: max_sentences must be positive");

    const auto sentences = textutil::split_sentences(text);
    if (sentences.empty()) throw SummarizationError("no sentence boundary found in text");

    for (const auto& strategy : m_strategies) {
        try {
            return SummaryOutcome{strategy->summarize(text, max_sentences), strategy->name()};
        } catch (const StrategyError&) {
            // next strategy
        }
    }

    if (sentences.size() <= max_sentences) {
        return SummaryOutcome{textutil::trim(text), "verbatim"};
    }

    return SummaryOutcome{join_sentences(sentences, select_top(positional_scores(sentences), max_sentences)),
                          "positional"};
}

}  // namespace newscheckr
