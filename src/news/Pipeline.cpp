#include "news/Pipeline.hpp"

#include "io/ConfigIO.hpp"
#include "news/BiasClassifier.hpp"
#include "news/CredibilityClassifier.hpp"
#include "news/Errors.hpp"
#include "news/Labels.hpp"
#include "text/FeatureExtractor.hpp"

#include <chrono>
#include <future>
#include <iostream>
#include <optional>
#include <sstream>
#include <thread>

namespace newscheckr {

const char* stage_str(Stage s) {
    switch (s) {
        case Stage::Received: return "Received";
        case Stage::Scraped: return "Scraped";
        case Stage::FeatureExtracted: return "FeatureExtracted";
        case Stage::Classified: return "Classified";
        case Stage::Summarized: return "Summarized";
        case Stage::Labeled: return "Labeled";
        case Stage::Completed: return "Completed";
        case Stage::Failed: return "Failed";
    }
    return "Failed";
}

static void notify(const StageObserver& observer, Stage stage, const std::string& detail) {
    if (observer) observer(stage, detail);
}

static std::string failure_detail(const std::exception& e) {
    if (const auto* se = dynamic_cast<const ScrapeError*>(&e)) {
        return std::string(error_code_str(se->code())) + "/" + scrape_failure_str(se->reason()) + ": " + e.what();
    }
    if (const auto* ae = dynamic_cast<const AnalysisError*>(&e)) {
        return std::string(error_code_str(ae->code())) + ": " + e.what();
    }
    return e.what();
}

Pipeline::Pipeline(std::shared_ptr<const ModelBundle> models, const SourceRegistry& registry, PipelineConfig cfg)
    : m_models(std::move(models)),
      m_registry(registry),
      m_cfg(std::move(cfg)),
      m_summarizer(Summarizer::with_default_strategies()) {
    if (!m_models) throw ModelUnavailableError("no classifier parameters loaded");
    validate_config(m_cfg);
}

Article Pipeline::fetch(const std::string& url, scrape::Scraper& scraper, const StageObserver& observer) const {
    for (int attempt = 1;; ++attempt) {
        try {
            return scraper.scrape(url, m_cfg.scrape_timeout_seconds);
        } catch (const ScrapeError& e) {
            if (!e.transient() || attempt >= 2) throw;

            std::cerr << "Pipeline: scrape of " << url << " failed (" << e.what() << "), retrying in "
                      << m_cfg.scrape_retry_backoff_ms << " ms\n";
            notify(observer, Stage::Received, "retrying after transient scrape failure");
            std::this_thread::sleep_for(std::chrono::milliseconds(m_cfg.scrape_retry_backoff_ms));
        }
    }
}

AnalysisResult Pipeline::analyze_url(const std::string& url, scrape::Scraper& scraper,
                                     const StageObserver& observer) const {
    notify(observer, Stage::Received, url);

    Article article;
    try {
        article = fetch(url, scraper, observer);
    } catch (const std::exception& e) {
        notify(observer, Stage::Failed, failure_detail(e));
        throw;
    }

    if (article.url.empty()) article.url = url;
    article.source_domain = article.source_domain.empty() ? domain_from_url(url)
                                                          : normalize_domain(article.source_domain);

    notify(observer, Stage::Scraped, article.source_domain);
    return run(article, observer);
}

AnalysisResult Pipeline::analyze_article(const Article& article, const StageObserver& observer) const {
    notify(observer, Stage::Received, "text");
    notify(observer, Stage::Scraped, article.source_domain.empty() ? "unknown source" : article.source_domain);
    return run(article, observer);
}

AnalysisResult Pipeline::run(const Article& article, const StageObserver& observer) const {
    const auto t0 = std::chrono::steady_clock::now();

    try {
        const SourceRating rating = m_registry.lookup(article.source_domain);
        const bool source_known = !article.source_domain.empty() && m_registry.contains(article.source_domain);

        // features
        FeatureExtractor extractor(m_models->vocabulary(), m_cfg.min_words);
        std::optional<FeatureVector> features;
        size_t word_count = 0;
        try {
            features = extractor.extract(article.text);
            word_count = features->word_count;
            notify(observer, Stage::FeatureExtracted, std::to_string(word_count) + " words");
        } catch (const InsufficientContentError& e) {
            word_count = e.word_count();
            notify(observer, Stage::FeatureExtracted, std::string("skipped: ") + e.what());
        }

        // classification
        double score = 0.0;
        BiasResult bias;
        std::optional<double> probability;
        std::string bias_origin;

        if (features) {
            const CredibilityClassifier credibility(m_models->credibility_model(),
                                                    BlendWeights{m_cfg.model_weight, m_cfg.source_weight});
            const BiasClassifier bias_classifier(m_models->bias_model(), m_cfg.bias_tie_epsilon);

            const FeatureVector& fv = *features;
            auto bias_task = std::async(std::launch::async, [&bias_classifier, &fv] {
                return bias_classifier.classify(fv);
            });

            probability = credibility.probability(fv);
            score = finalize_score(credibility.blend(*probability, rating), rating.reputation_score);
            bias = bias_task.get();
            bias_origin = "model";
        } else {
            score = CredibilityClassifier::source_only(rating);
            bias.label = rating.known_bias.value_or(BiasLabel::Center);
            bias.confidence = 0.0;
            bias_origin = "source_rating";
        }
        {
            std::ostringstream d;
            d << "score=" << score << " bias=" << bias_str(bias.label);
            notify(observer, Stage::Classified, d.str());
        }

        // summary
        std::string summary;
        std::optional<std::string> summary_method;
        bool summary_failed = false;
        try {
            SummaryOutcome outcome = m_summarizer.summarize(article.text, m_cfg.max_sentences);
            summary = std::move(outcome.summary);
            summary_method = std::move(outcome.method);
            notify(observer, Stage::Summarized, *summary_method);
        } catch (const SummarizationError& e) {
            summary_failed = true;
            notify(observer, Stage::Summarized, std::string("unavailable: ") + e.what());
        }

        // labels
        LabelInputs li;
        li.credibility_score = score;
        li.bias = bias;
        li.source = rating;
        li.extraction_skipped = !features.has_value();
        li.summary_failed = summary_failed;

        AnalysisResult r;
        r.labels = derive_labels(li, m_cfg.biased_confidence);
        notify(observer, Stage::Labeled, std::to_string(r.labels.size()) + " labels");

        r.source = rating.domain.empty() ? "unknown" : rating.domain;
        r.credibility_score = score;
        r.bias = bias.label;
        r.summary = summary;

        ResultMetadata& m = r.metadata;
        m.title = article.title;
        m.authors = article.authors;
        m.published_at = article.published_at;
        m.url = article.url;
        m.source_known = source_known;
        m.analysis_method = features ? "blended" : "source_only";
        m.model_probability = probability;
        m.bias_confidence = bias.confidence;
        m.bias_origin = bias_origin;
        m.word_count = word_count;
        m.summary_method = summary_method;
        m.degraded = !features || summary_failed;

        const double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
        std::cerr << "Pipeline: " << r.source << " score=" << r.credibility_score << " bias=" << bias_str(r.bias)
                  << (m.degraded ? " (degraded)" : "") << " in " << secs << "s\n";

        notify(observer, Stage::Completed, r.source);
        return r;
    } catch (const std::exception& e) {
        notify(observer, Stage::Failed, failure_detail(e));
        throw;
    }
}

}  // namespace newscheckr
