#include "news/ResultJson.hpp"

using json = nlohmann::json;

namespace newscheckr {

static json optional_string(const std::optional<std::string>& s) {
    return s ? json(*s) : json(nullptr);
}

json result_to_json(const AnalysisResult& r) {
    const ResultMetadata& m = r.metadata;

    json meta;
    meta["title"] = m.title;
    meta["authors"] = m.authors;
    meta["published_at"] = optional_string(m.published_at);
    meta["url"] = m.url;
    meta["source_known"] = m.source_known;
    meta["analysis_method"] = m.analysis_method;
    meta["model_probability"] = m.model_probability ? json(*m.model_probability) : json(nullptr);
    meta["bias_confidence"] = m.bias_confidence;
    meta["bias_origin"] = m.bias_origin;
    meta["word_count"] = m.word_count;
    meta["summary_method"] = optional_string(m.summary_method);
    meta["degraded"] = m.degraded;

    json j;
    j["source"] = r.source;
    j["credibility_score"] = r.credibility_score;
    j["bias"] = bias_str(r.bias);
    j["summary"] = r.summary;
    j["labels"] = r.labels;
    j["metadata"] = std::move(meta);
    return j;
}

json sources_to_json(const std::vector<SourceRating>& sources) {
    json arr = json::array();
    for (const auto& s : sources) {
        arr.push_back({
            {"domain", s.domain},
            {"reputation_score", s.reputation_score},
            {"known_bias", s.known_bias ? json(bias_str(*s.known_bias)) : json(nullptr)}
        });
    }
    return json{{"sources", std::move(arr)}, {"total_sources", sources.size()}};
}

json health_to_json(const HealthStatus& h) {
    return json{{"modelsLoaded", h.models_loaded}, {"vocabularySize", h.vocabulary_size}};
}

json error_to_json(const AnalysisError& e) {
    json err;
    err["code"] = error_code_str(e.code());
    if (const auto* se = dynamic_cast<const ScrapeError*>(&e)) err["reason"] = scrape_failure_str(se->reason());
    err["message"] = e.what();
    return json{{"error", std::move(err)}};
}

json error_to_json(const std::string& code, const std::string& message) {
    return json{{"error", {{"code", code}, {"message", message}}}};
}

}  // namespace newscheckr
