#include "news/Labels.hpp"

#include <algorithm>

namespace newscheckr {

static void add_label(std::vector<std::string>& out, const char* label) {
    if (std::find(out.begin(), out.end(), label) == out.end()) out.emplace_back(label);
}

std::vector<std::string> derive_labels(const LabelInputs& in, double biased_confidence) {
    std::vector<std::string> out;
    const double s = in.credibility_score;

    if (s >= 80.0) {
        add_label(out, "Highly Reliable");
    } else if (s >= 60.0) {
        add_label(out, "Mixed Reliability");
        add_label(out, "Needs Verification");
    } else if (s >= 40.0) {
        add_label(out, "Low Reliability");
    } else if (s >= 25.0) {
        add_label(out, "Likely Biased");
    } else {
        add_label(out, "Satire/Clickbait");
    }

    if (in.bias.label != BiasLabel::Center && in.bias.confidence >= biased_confidence) {
        add_label(out, "Biased");
    }

    if (in.source.reputation_score >= 85.0) add_label(out, "Well-sourced");
    if (in.extraction_skipped) add_label(out, "InsufficientData");
    if (in.summary_failed) add_label(out, "SummaryUnavailable");

    return out;
}

}  // namespace newscheckr
