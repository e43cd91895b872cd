#pragma once

#include "model/ModelBundle.hpp"
#include "news/Models.hpp"
#include "news/Pipeline.hpp"
#include "news/PipelineConfig.hpp"
#include "news/SourceRegistry.hpp"
#include "scrape/BoundedScraper.hpp"
#include "scrape/Scraper.hpp"

#include <memory>
#include <string>
#include <vector>

namespace newscheckr {

struct HealthStatus {
    bool models_loaded = false;
    size_t vocabulary_size = 0;
};

// Throws InputError unless url is http(s)://<host>... without whitespace.
void validate_url(const std::string& url);

// Entry points of the analyzer. Safe to call from several threads; scrapes go
// through a bounded pool of max_concurrent_scrapes slots.
class AnalysisService {
public:
    // models may be null (failed load): health() still answers, analyze* throw
    // ModelUnavailableError. A null scraper means CurlScraper. registry must
    // outlive the service; temporaries are rejected.
    AnalysisService(std::shared_ptr<const ModelBundle> models,
                    const SourceRegistry& registry,
                    PipelineConfig cfg,
                    std::shared_ptr<scrape::Scraper> scraper = nullptr);
    AnalysisService(std::shared_ptr<const ModelBundle> models,
                    const SourceRegistry&& registry,
                    PipelineConfig cfg,
                    std::shared_ptr<scrape::Scraper> scraper = nullptr) = delete;

    AnalysisResult analyze(const std::string& url, const StageObserver& observer = nullptr) const;

    // source: optional domain (or URL) the text came from; empty = unknown
    AnalysisResult analyze_text(const std::string& text, const std::string& source = "",
                                const StageObserver& observer = nullptr) const;

    std::vector<SourceRating> list_sources() const;
    HealthStatus health() const;

private:
    const Pipeline& pipeline() const;

    std::shared_ptr<const ModelBundle> m_models;
    const SourceRegistry& m_registry;
    std::shared_ptr<scrape::Scraper> m_scraper;
    std::unique_ptr<scrape::BoundedScraper> m_bounded;
    std::unique_ptr<Pipeline> m_pipeline;   // null without models
};

}  // namespace newscheckr
