#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace newscheckr {

enum class BiasLabel {
    Left = 0,
    Center = 1,
    Right = 2
};

constexpr size_t kBiasClassCount = 3;

const char* bias_str(BiasLabel b);
// Accepts "Left" / "Center" / "Right" (case-insensitive). Returns false otherwise.
bool parse_bias(const std::string& s, BiasLabel& out);

struct Article {
    std::string url;                         // empty for the text flow
    std::string source_domain;               // normalized; empty when unknown
    std::string title;
    std::string text;
    std::vector<std::string> authors;
    std::optional<std::string> published_at;
};

struct SourceRating {
    std::string domain;                      // lowercase, no leading "www."
    double reputation_score = 50.0;          // [0,100]
    std::optional<BiasLabel> known_bias;
};

struct BiasResult {
    BiasLabel label = BiasLabel::Center;
    double confidence = 0.0;                 // [0,1]
};

struct ResultMetadata {
    std::string title;
    std::vector<std::string> authors;
    std::optional<std::string> published_at;
    std::string url;

    bool source_known = false;
    std::string analysis_method;             // "blended" | "source_only"
    std::optional<double> model_probability; // absent when feature extraction was skipped
    double bias_confidence = 0.0;
    std::string bias_origin;                 // "model" | "source_rating"
    size_t word_count = 0;
    std::optional<std::string> summary_method;
    bool degraded = false;
};

struct AnalysisResult {
    std::string source;
    double credibility_score = 0.0;          // [0,100], one decimal
    BiasLabel bias = BiasLabel::Center;
    std::string summary;
    std::vector<std::string> labels;         // ordered, no duplicates
    ResultMetadata metadata;
};

}  // namespace newscheckr
