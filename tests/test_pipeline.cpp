#include "model/ModelBundle.hpp"
#include "news/Errors.hpp"
#include "news/Pipeline.hpp"
#include "news/ResultJson.hpp"
#include "news/SourceRegistry.hpp"
#include "support/Fixtures.hpp"
#include "text/TextUtil.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <future>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

using namespace newscheckr;
using fixtures::ScriptedScraper;

static bool has_label(const AnalysisResult& r, const std::string& label) {
    return std::find(r.labels.begin(), r.labels.end(), label) != r.labels.end();
}

static Article text_article(const std::string& text, const std::string& domain = "") {
    Article a;
    a.text = text;
    a.source_domain = domain;
    return a;
}

static PipelineConfig fast_config() {
    PipelineConfig cfg;
    cfg.scrape_retry_backoff_ms = 0;
    return cfg;
}

class PipelineTest : public ::testing::Test {
protected:
    PipelineTest() : m_pipeline(fixtures::fixture_bundle(), SourceRegistry::builtin(), fast_config()) {}

    Pipeline m_pipeline;
};

TEST_F(PipelineTest, ReputableNeutralArticle) {
    const AnalysisResult r = m_pipeline.analyze_article(text_article(fixtures::neutral_article(), "reuters.com"));

    EXPECT_EQ(r.source, "reuters.com");
    EXPECT_DOUBLE_EQ(r.credibility_score, 90.0);
    EXPECT_EQ(r.bias, BiasLabel::Center);
    EXPECT_EQ(r.labels, std::vector<std::string>({"Highly Reliable", "Well-sourced"}));

    const ResultMetadata& m = r.metadata;
    EXPECT_TRUE(m.source_known);
    EXPECT_EQ(m.analysis_method, "blended");
    ASSERT_TRUE(m.model_probability.has_value());
    EXPECT_NEAR(*m.model_probability, 0.9, 1e-9);
    EXPECT_EQ(m.bias_origin, "model");
    EXPECT_NEAR(m.bias_confidence, 1.0 / 3.0, 1e-9);
    EXPECT_FALSE(m.degraded);
    EXPECT_GE(m.word_count, 50u);
    ASSERT_TRUE(m.summary_method.has_value());
    EXPECT_EQ(*m.summary_method, "textrank");

    const auto picked = textutil::split_sentences(r.summary);
    EXPECT_GE(picked.size(), 1u);
    EXPECT_LE(picked.size(), 2u);
}

TEST_F(PipelineTest, UnknownSourceBlendsWithDefaultReputation) {
    const AnalysisResult r = m_pipeline.analyze_article(text_article(fixtures::neutral_article(), "example.com"));
    EXPECT_EQ(r.source, "example.com");
    EXPECT_DOUBLE_EQ(r.credibility_score, 78.0);
    EXPECT_FALSE(r.metadata.source_known);
    EXPECT_EQ(r.labels, std::vector<std::string>({"Mixed Reliability", "Needs Verification"}));
}

TEST_F(PipelineTest, ShortTextFallsBackToSource) {
    const AnalysisResult r = m_pipeline.analyze_article(text_article(fixtures::ten_words()));

    EXPECT_EQ(r.source, "unknown");
    EXPECT_DOUBLE_EQ(r.credibility_score, 50.0);
    EXPECT_EQ(r.bias, BiasLabel::Center);
    EXPECT_TRUE(has_label(r, "InsufficientData"));
    EXPECT_EQ(r.labels, std::vector<std::string>({"Low Reliability", "InsufficientData"}));
    EXPECT_EQ(r.summary, fixtures::ten_words());

    const ResultMetadata& m = r.metadata;
    EXPECT_EQ(m.analysis_method, "source_only");
    EXPECT_FALSE(m.model_probability.has_value());
    EXPECT_EQ(m.bias_origin, "source_rating");
    EXPECT_DOUBLE_EQ(m.bias_confidence, 0.0);
    EXPECT_EQ(m.word_count, 10u);
    EXPECT_TRUE(m.degraded);
    EXPECT_FALSE(m.source_known);
}

TEST_F(PipelineTest, ShortTextUsesKnownSourceLean) {
    const AnalysisResult r = m_pipeline.analyze_article(text_article(fixtures::ten_words(), "foxnews.com"));
    EXPECT_DOUBLE_EQ(r.credibility_score, 68.0);
    EXPECT_EQ(r.bias, BiasLabel::Right);
    EXPECT_FALSE(has_label(r, "Biased"));
    EXPECT_EQ(r.labels, std::vector<std::string>({"Mixed Reliability", "Needs Verification", "InsufficientData"}));
}

TEST_F(PipelineTest, PartisanArticleIsLabeledBiased) {
    const AnalysisResult left = m_pipeline.analyze_article(text_article(fixtures::left_article()));
    EXPECT_EQ(left.bias, BiasLabel::Left);
    EXPECT_GT(left.metadata.bias_confidence, 0.99);
    EXPECT_TRUE(has_label(left, "Biased"));

    const AnalysisResult right = m_pipeline.analyze_article(text_article(fixtures::right_article()));
    EXPECT_EQ(right.bias, BiasLabel::Right);
    EXPECT_TRUE(has_label(right, "Biased"));
}

TEST_F(PipelineTest, ShoutingLowersCredibility) {
    const AnalysisResult r = m_pipeline.analyze_article(text_article(fixtures::shouting_article()));
    EXPECT_DOUBLE_EQ(r.credibility_score, 40.7);
    EXPECT_EQ(r.labels.front(), "Low Reliability");
}

TEST_F(PipelineTest, SingleSentenceSummaryIsVerbatim) {
    const AnalysisResult r = m_pipeline.analyze_article(text_article(fixtures::single_sentence()));
    EXPECT_EQ(r.summary, fixtures::single_sentence());
    ASSERT_TRUE(r.metadata.summary_method.has_value());
    EXPECT_EQ(*r.metadata.summary_method, "verbatim");
}

TEST_F(PipelineTest, SingleSentenceEndingInAbbreviationIsVerbatim) {
    const std::string text = "The president flew back to the U.S.";
    const AnalysisResult r = m_pipeline.analyze_article(text_article(text));
    EXPECT_EQ(r.summary, text);
    ASSERT_TRUE(r.metadata.summary_method.has_value());
    EXPECT_EQ(*r.metadata.summary_method, "verbatim");
    EXPECT_FALSE(has_label(r, "SummaryUnavailable"));
}

TEST_F(PipelineTest, TextWithoutBoundaryHasNoSummary) {
    const AnalysisResult r = m_pipeline.analyze_article(text_article("breaking news with no full stop"));
    EXPECT_TRUE(r.summary.empty());
    EXPECT_FALSE(r.metadata.summary_method.has_value());
    EXPECT_TRUE(has_label(r, "SummaryUnavailable"));
    EXPECT_TRUE(r.metadata.degraded);
}

TEST_F(PipelineTest, IdenticalInputGivesIdenticalOutput) {
    const Article a = text_article(fixtures::neutral_article(), "bbc.co.uk");
    const std::string first = result_to_json(m_pipeline.analyze_article(a)).dump();
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(result_to_json(m_pipeline.analyze_article(a)).dump(), first);
    }
}

TEST_F(PipelineTest, ReportsStagesInOrder) {
    std::vector<Stage> seen;
    m_pipeline.analyze_article(text_article(fixtures::neutral_article()),
                               [&](Stage s, const std::string&) { seen.push_back(s); });

    EXPECT_EQ(seen, std::vector<Stage>({Stage::Received, Stage::Scraped, Stage::FeatureExtracted,
                                        Stage::Classified, Stage::Summarized, Stage::Labeled,
                                        Stage::Completed}));
}

TEST_F(PipelineTest, UrlFlowFillsSourceFromUrl) {
    ScriptedScraper scraper(ScriptedScraper::Failure::None, 0, text_article(fixtures::neutral_article()));
    const AnalysisResult r = m_pipeline.analyze_url("https://www.reuters.com/world/story", scraper);

    EXPECT_EQ(scraper.calls(), 1);
    EXPECT_EQ(r.source, "reuters.com");
    EXPECT_EQ(r.metadata.url, "https://www.reuters.com/world/story");
    EXPECT_DOUBLE_EQ(r.credibility_score, 90.0);
}

TEST_F(PipelineTest, RetriesOnceAfterTransientFailure) {
    ScriptedScraper scraper(ScriptedScraper::Failure::Unreachable, 1, text_article(fixtures::neutral_article()));
    const AnalysisResult r = m_pipeline.analyze_url("https://apnews.com/article/1", scraper);
    EXPECT_EQ(scraper.calls(), 2);
    EXPECT_EQ(r.source, "apnews.com");
}

TEST_F(PipelineTest, GivesUpAfterSecondTransientFailure) {
    ScriptedScraper scraper(ScriptedScraper::Failure::Unreachable, 5, text_article(fixtures::neutral_article()));

    std::vector<Stage> seen;
    try {
        m_pipeline.analyze_url("https://apnews.com/article/1", scraper,
                               [&](Stage s, const std::string&) { seen.push_back(s); });
        FAIL() << "expected ScrapeError";
    } catch (const ScrapeError& e) {
        EXPECT_EQ(e.reason(), ScrapeFailure::Unreachable);
    }
    EXPECT_EQ(scraper.calls(), 2);
    ASSERT_FALSE(seen.empty());
    EXPECT_EQ(seen.back(), Stage::Failed);
}

TEST_F(PipelineTest, TimeoutIsNotRetried) {
    ScriptedScraper scraper(ScriptedScraper::Failure::Timeout, 1, text_article(fixtures::neutral_article()));
    EXPECT_THROW(m_pipeline.analyze_url("https://apnews.com/article/1", scraper), TimeoutError);
    EXPECT_EQ(scraper.calls(), 1);
}

TEST_F(PipelineTest, PaywallIsNotRetried) {
    ScriptedScraper scraper(ScriptedScraper::Failure::Paywalled, 1, text_article(fixtures::neutral_article()));
    try {
        m_pipeline.analyze_url("https://wsj.com/articles/x", scraper);
        FAIL() << "expected ScrapeError";
    } catch (const ScrapeError& e) {
        EXPECT_EQ(e.reason(), ScrapeFailure::Paywalled);
        EXPECT_EQ(e.code(), ErrorCode::ScrapeError);
    }
    EXPECT_EQ(scraper.calls(), 1);
}

TEST_F(PipelineTest, ConcurrentRequestsAreIndependent) {
    const std::vector<std::pair<std::string, std::string>> inputs = {
        {fixtures::neutral_article(), "reuters.com"},
        {fixtures::left_article(), ""},
        {fixtures::right_article(), ""},
        {fixtures::ten_words(), "foxnews.com"},
        {fixtures::shouting_article(), ""},
    };

    std::vector<std::string> expected;
    for (const auto& in : inputs) {
        expected.push_back(result_to_json(m_pipeline.analyze_article(text_article(in.first, in.second))).dump());
    }

    std::vector<std::future<std::string>> futures;
    for (int round = 0; round < 4; ++round) {
        for (const auto& in : inputs) {
            futures.push_back(std::async(std::launch::async, [this, in] {
                return result_to_json(m_pipeline.analyze_article(text_article(in.first, in.second))).dump();
            }));
        }
    }
    for (size_t i = 0; i < futures.size(); ++i) {
        EXPECT_EQ(futures[i].get(), expected[i % inputs.size()]);
    }
}

TEST(PipelineSetup, RegistryMustNotBeTemporary) {
    using Models = std::shared_ptr<const ModelBundle>;
    static_assert(std::is_constructible<Pipeline, Models, const SourceRegistry&, PipelineConfig>::value,
                  "lvalue registry");
    static_assert(!std::is_constructible<Pipeline, Models, SourceRegistry, PipelineConfig>::value,
                  "temporary registry");

    SourceRegistry local({{"local.example", 70, BiasLabel::Center}});
    const Pipeline pipeline(fixtures::fixture_bundle(), local, fast_config());
    EXPECT_EQ(pipeline.analyze_article(text_article(fixtures::ten_words(), "local.example")).credibility_score, 70.0);
}

TEST(PipelineSetup, RejectsMissingModelsAndBadConfig) {
    EXPECT_THROW(Pipeline(nullptr, SourceRegistry::builtin(), PipelineConfig{}), ModelUnavailableError);

    PipelineConfig cfg;
    cfg.model_weight = 0.9;
    EXPECT_THROW(Pipeline(fixtures::fixture_bundle(), SourceRegistry::builtin(), cfg), std::runtime_error);
}

TEST(PipelineShippedModels, ReputableNeutralArticle) {
    const auto models = ModelBundle::load_from_dir(NEWSCHECKR_MODELS_DIR);
    const Pipeline pipeline(models, SourceRegistry::builtin(), fast_config());

    const AnalysisResult r = pipeline.analyze_article(text_article(fixtures::neutral_article(), "reuters.com"));
    EXPECT_GE(r.credibility_score, 80.0);
    EXPECT_EQ(r.bias, BiasLabel::Center);
    EXPECT_EQ(r.labels, std::vector<std::string>({"Highly Reliable", "Well-sourced"}));
}

TEST(PipelineShippedModels, PartisanArticle) {
    const auto models = ModelBundle::load_from_dir(NEWSCHECKR_MODELS_DIR);
    const Pipeline pipeline(models, SourceRegistry::builtin(), fast_config());

    const AnalysisResult r = pipeline.analyze_article(text_article(fixtures::left_article()));
    EXPECT_EQ(r.bias, BiasLabel::Left);
    EXPECT_TRUE(has_label(r, "Biased"));
}
