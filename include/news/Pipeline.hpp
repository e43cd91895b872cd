#pragma once

#include "model/ModelBundle.hpp"
#include "news/Models.hpp"
#include "news/PipelineConfig.hpp"
#include "news/SourceRegistry.hpp"
#include "scrape/Scraper.hpp"
#include "summary/Summarizer.hpp"

#include <functional>
#include <memory>
#include <string>

namespace newscheckr {

enum class Stage {
    Received,
    Scraped,
    FeatureExtracted,
    Classified,
    Summarized,
    Labeled,
    Completed,
    Failed
};

const char* stage_str(Stage s);

// Called on every state transition with a short human-readable detail.
using StageObserver = std::function<void(Stage stage, const std::string& detail)>;

// Per-request orchestration over shared, immutable models and registry.
// Holds no per-request state, so one instance serves concurrent requests.
//
// Degradable failures stay inside: too little text skips the classifiers
// (score = source reputation, bias = the source's known lean or Center) and a
// text without sentence boundaries yields an empty summary. Input, scrape and
// model errors propagate after a Failed notification.
class Pipeline {
public:
    // Throws ModelUnavailableError when models is null and std::runtime_error
    // when cfg does not validate.
    // registry must outlive the pipeline; temporaries are rejected.
    Pipeline(std::shared_ptr<const ModelBundle> models, const SourceRegistry& registry, PipelineConfig cfg);
    Pipeline(std::shared_ptr<const ModelBundle> models, const SourceRegistry&& registry, PipelineConfig cfg) = delete;

    // Text flow: the article is already in hand.
    AnalysisResult analyze_article(const Article& article, const StageObserver& observer = nullptr) const;

    // URL flow: scrape (one retry after backoff on transient failure), then analyze.
    AnalysisResult analyze_url(const std::string& url, scrape::Scraper& scraper,
                               const StageObserver& observer = nullptr) const;

    const PipelineConfig& config() const { return m_cfg; }

private:
    Article fetch(const std::string& url, scrape::Scraper& scraper, const StageObserver& observer) const;
    AnalysisResult run(const Article& article, const StageObserver& observer) const;

    std::shared_ptr<const ModelBundle> m_models;
    const SourceRegistry& m_registry;
    PipelineConfig m_cfg;
    Summarizer m_summarizer;
};

}  // namespace newscheckr
