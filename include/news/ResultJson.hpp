#pragma once

#include "news/AnalysisService.hpp"
#include "news/Errors.hpp"
#include "news/Models.hpp"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace newscheckr {

// {"source","credibility_score","bias","summary","labels","metadata":{...}}
nlohmann::json result_to_json(const AnalysisResult& r);

// {"sources":[{"domain","reputation_score","known_bias"}], "total_sources": n}
nlohmann::json sources_to_json(const std::vector<SourceRating>& sources);

// {"modelsLoaded": bool, "vocabularySize": n}
nlohmann::json health_to_json(const HealthStatus& h);

// {"error":{"code","reason"?,"message"}}; reason for scrape failures (timeouts report "unreachable")
nlohmann::json error_to_json(const AnalysisError& e);
nlohmann::json error_to_json(const std::string& code, const std::string& message);

}  // namespace newscheckr
