#include "news/AnalysisService.hpp"

#include "news/Errors.hpp"
#include "scrape/CurlScraper.hpp"
#include "text/TextUtil.hpp"

#include <cctype>

namespace newscheckr {

static bool starts_with_ci(const std::string& s, const std::string& prefix) {
    if (s.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) != prefix[i]) return false;
    }
    return true;
}

void validate_url(const std::string& url) {
    if (textutil::trim(url).empty()) throw InputError("url is empty");

    for (char c : url) {
        if (std::isspace(static_cast<unsigned char>(c))) throw InputError("url contains whitespace: " + url);
    }
    if (!starts_with_ci(url, "http://") && !starts_with_ci(url, "https://")) {
        throw InputError("url must start with http:// or https://: " + url);
    }
    if (domain_from_url(url).empty()) throw InputError("url has no host: " + url);
}

AnalysisService::AnalysisService(std::shared_ptr<const ModelBundle> models,
                                 const SourceRegistry& registry,
                                 PipelineConfig cfg,
                                 std::shared_ptr<scrape::Scraper> scraper)
    : m_models(std::move(models)), m_registry(registry), m_scraper(std::move(scraper)) {
    if (!m_scraper) m_scraper = std::make_shared<scrape::CurlScraper>();
    m_bounded = std::make_unique<scrape::BoundedScraper>(*m_scraper, cfg.max_concurrent_scrapes);
    if (m_models) m_pipeline = std::make_unique<Pipeline>(m_models, m_registry, std::move(cfg));
}

const Pipeline& AnalysisService::pipeline() const {
    if (!m_pipeline) throw ModelUnavailableError("classifier parameters failed to load; refusing to analyze");
    return *m_pipeline;
}

AnalysisResult AnalysisService::analyze(const std::string& url, const StageObserver& observer) const {
    validate_url(url);
    return pipeline().analyze_url(url, *m_bounded, observer);
}

AnalysisResult AnalysisService::analyze_text(const std::string& text, const std::string& source,
                                             const StageObserver& observer) const {
    if (textutil::trim(text).empty()) throw InputError("text is empty");

    Article a;
    a.text = text;
    const std::string src = textutil::trim(source);
    a.source_domain = src.find("://") != std::string::npos ? domain_from_url(src) : normalize_domain(src);

    return pipeline().analyze_article(a, observer);
}

std::vector<SourceRating> AnalysisService::list_sources() const {
    return m_registry.list();
}

HealthStatus AnalysisService::health() const {
    HealthStatus h;
    h.models_loaded = m_models != nullptr;
    h.vocabulary_size = m_models ? m_models->vocabulary().size() : 0;
    return h;
}

}  // namespace newscheckr
