#pragma once

#include "news/Models.hpp"

#include <string>
#include <vector>

namespace newscheckr {

struct LabelInputs {
    double credibility_score = 0.0;
    BiasResult bias;
    SourceRating source;
    bool extraction_skipped = false;
    bool summary_failed = false;
};

// Fixed rule table, evaluated top to bottom (several rules may fire):
//   score >= 80                      Highly Reliable
//   60 <= score < 80                 Mixed Reliability, Needs Verification
//   40 <= score < 60                 Low Reliability
//   25 <= score < 40                 Likely Biased
//   score < 25                       Satire/Clickbait
//   bias != Center, conf >= min      Biased
//   reputation >= 85                 Well-sourced
//   extraction skipped               InsufficientData
//   summary failed                   SummaryUnavailable
std::vector<std::string> derive_labels(const LabelInputs& in, double biased_confidence = 0.6);

}  // namespace newscheckr
