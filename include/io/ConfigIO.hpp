#pragma once

#include "news/PipelineConfig.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace newscheckr {

// Overrides fields of cfg from a JSON object. Unknown keys and wrong types are
// errors (std::runtime_error naming "config.<key>").
void apply_config_json(PipelineConfig& cfg, const nlohmann::json& j);

// Throws std::runtime_error when weights are negative or do not sum to 1,
// or when counts/timeouts are not positive.
void validate_config(const PipelineConfig& cfg);

// Defaults overridden by the file at path, then validated.
PipelineConfig load_pipeline_config(const std::string& path);

nlohmann::json config_to_json(const PipelineConfig& cfg);

}  // namespace newscheckr
