#pragma once

#include <cstddef>
#include <string>

namespace newscheckr {

struct PipelineConfig {
    // credibility = 100 * (model_weight * p + source_weight * reputation / 100)
    double model_weight = 0.7;
    double source_weight = 0.3;

    size_t min_words = 50;               // below this, feature extraction is skipped
    double bias_tie_epsilon = 0.05;      // top-2 class gap under this -> Center
    double biased_confidence = 0.6;      // "Biased" label threshold
    size_t max_sentences = 2;

    double scrape_timeout_seconds = 10.0;
    int scrape_retry_backoff_ms = 500;
    size_t max_concurrent_scrapes = 4;

    std::string models_dir = "models";
};

}  // namespace newscheckr
