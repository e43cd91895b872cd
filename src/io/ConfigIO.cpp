#include "io/ConfigIO.hpp"
#include "io/JsonIO.hpp"

#include <cmath>
#include <stdexcept>

using json = nlohmann::json;

namespace newscheckr {

static size_t require_count(const json& j, const char* key) {
    const int64_t v = jsonio::require_integer(j, key, "config");
    if (v < 0) throw std::runtime_error("config." + std::string(key) + " must not be negative");
    return (size_t)v;
}

void apply_config_json(PipelineConfig& cfg, const json& j) {
    jsonio::require_object(j, "config");

    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();

        if (key == "model_weight") cfg.model_weight = jsonio::require_number(j, "model_weight", "config");
        else if (key == "source_weight") cfg.source_weight = jsonio::require_number(j, "source_weight", "config");
        else if (key == "min_words") cfg.min_words = require_count(j, "min_words");
        else if (key == "bias_tie_epsilon") cfg.bias_tie_epsilon = jsonio::require_number(j, "bias_tie_epsilon", "config");
        else if (key == "biased_confidence") cfg.biased_confidence = jsonio::require_number(j, "biased_confidence", "config");
        else if (key == "max_sentences") cfg.max_sentences = require_count(j, "max_sentences");
        else if (key == "scrape_timeout_seconds") cfg.scrape_timeout_seconds = jsonio::require_number(j, "scrape_timeout_seconds", "config");
        else if (key == "scrape_retry_backoff_ms") cfg.scrape_retry_backoff_ms = (int)jsonio::require_integer(j, "scrape_retry_backoff_ms", "config");
        else if (key == "max_concurrent_scrapes") cfg.max_concurrent_scrapes = require_count(j, "max_concurrent_scrapes");
        else if (key == "models_dir") cfg.models_dir = jsonio::require_string(j, "models_dir", "config");
        else throw std::runtime_error("config." + key + " is not a known setting");
    }
}

void validate_config(const PipelineConfig& cfg) {
    if (cfg.model_weight < 0.0 || cfg.source_weight < 0.0) {
        throw std::runtime_error("config: blend weights must not be negative");
    }
    if (std::fabs(cfg.model_weight + cfg.source_weight - 1.0) > 1e-9) {
        throw std::runtime_error("config: model_weight + source_weight must equal 1");
    }
    if (cfg.bias_tie_epsilon < 0.0 || cfg.bias_tie_epsilon >= 1.0) {
        throw std::runtime_error("config.bias_tie_epsilon must be in [0,1)");
    }
    if (cfg.biased_confidence < 0.0 || cfg.biased_confidence > 1.0) {
        throw std::runtime_error("config.biased_confidence must be in [0,1]");
    }
    if (cfg.min_words == 0) throw std::runtime_error("config.min_words must be positive");
    if (cfg.max_sentences == 0) throw std::runtime_error("config.max_sentences must be positive");
    if (!(cfg.scrape_timeout_seconds > 0.0)) throw std::runtime_error("config.scrape_timeout_seconds must be positive");
    if (cfg.scrape_retry_backoff_ms < 0) throw std::runtime_error("config.scrape_retry_backoff_ms must not be negative");
    if (cfg.max_concurrent_scrapes == 0) throw std::runtime_error("config.max_concurrent_scrapes must be positive");
}

PipelineConfig load_pipeline_config(const std::string& path) {
    PipelineConfig cfg;
    apply_config_json(cfg, jsonio::read_json_file(path));
    validate_config(cfg);
    return cfg;
}

json config_to_json(const PipelineConfig& cfg) {
    json j;
    j["model_weight"] = cfg.model_weight;
    j["source_weight"] = cfg.source_weight;
    j["min_words"] = cfg.min_words;
    j["bias_tie_epsilon"] = cfg.bias_tie_epsilon;
    j["biased_confidence"] = cfg.biased_confidence;
    j["max_sentences"] = cfg.max_sentences;
    j["scrape_timeout_seconds"] = cfg.scrape_timeout_seconds;
    j["scrape_retry_backoff_ms"] = cfg.scrape_retry_backoff_ms;
    j["max_concurrent_scrapes"] = cfg.max_concurrent_scrapes;
    j["models_dir"] = cfg.models_dir;
    return j;
}

}  // namespace newscheckr
