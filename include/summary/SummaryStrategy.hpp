#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace newscheckr {

// A strategy could not rank this text (too few sentences, no content words,
// degenerate graph or matrix). The Summarizer falls through to the next one.
class StrategyError : public std::runtime_error {
public:
    explicit StrategyError(const std::string& message) : std::runtime_error(message) {}
};

class SummaryStrategy {
public:
    virtual ~SummaryStrategy() = default;

    virtual const char* name() const = 0;

    // Top max_sentences sentences by score, joined in document order.
    // Throws StrategyError.
    std::string summarize(const std::string& text, size_t max_sentences) const;

    // One salience score per sentence. Throws StrategyError.
    virtual std::vector<double> score_sentences(const std::vector<std::string>& sentences) const = 0;
};

using Matrix = std::vector<std::vector<double>>;

// Indices of the k best scores (ties -> earlier sentence), in ascending order.
std::vector<size_t> select_top(const std::vector<double>& scores, size_t k);

std::string join_sentences(const std::vector<std::string>& sentences, const std::vector<size_t>& picked);

// Weighted PageRank over a symmetric non-negative adjacency matrix.
// Rows are normalized by their sums; isolated nodes keep the teleport share.
std::vector<double> weighted_pagerank(const Matrix& w, double damping, size_t max_iter = 100, double tol = 1e-9);

// Content words (normalized, stopwords removed) of each sentence.
std::vector<std::vector<std::string>> sentence_terms(const std::vector<std::string>& sentences);

}  // namespace newscheckr
