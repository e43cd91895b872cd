#pragma once

#include "model/ModelBundle.hpp"
#include "news/Errors.hpp"
#include "scrape/Scraper.hpp"

#include <atomic>
#include <cmath>
#include <memory>
#include <string>
#include <vector>

namespace fixtures {

using namespace newscheckr;

inline const std::vector<std::string>& neutral_terms() {
    static const std::vector<std::string> t = {
        "government", "officials", "according", "report", "economy",
        "market", "percent", "budget", "council", "data"
    };
    return t;
}

inline const std::vector<std::string>& left_terms() {
    static const std::vector<std::string> t = {
        "progressive", "inequality", "billionaires", "activists", "equity"
    };
    return t;
}

inline const std::vector<std::string>& right_terms() {
    static const std::vector<std::string> t = {
        "patriots", "liberty", "taxpayers", "socialist", "elites"
    };
    return t;
}

inline Vocabulary fixture_vocabulary() {
    std::vector<std::string> terms = neutral_terms();
    terms.insert(terms.end(), left_terms().begin(), left_terms().end());
    terms.insert(terms.end(), right_terms().begin(), right_terms().end());
    std::vector<double> idf(terms.size(), 2.0);
    return Vocabulary(terms, idf);
}

inline DecisionTree stump(uint32_t feature, double threshold, double left_value, double right_value) {
    DecisionTree t;
    TreeNode root;
    root.leaf = false;
    root.feature = feature;
    root.threshold = threshold;
    root.left = 1;
    root.right = 2;
    TreeNode lo;
    lo.value = left_value;
    TreeNode hi;
    hi.value = right_value;
    t.nodes = {root, lo, hi};
    return t;
}

inline DecisionTree constant_tree(double value) {
    DecisionTree t;
    TreeNode leaf;
    leaf.value = value;
    t.nodes = {leaf};
    return t;
}

// calm text -> p = 0.9; shouting (caps and '!') -> p = 0.1/0.1/0.9 mean
inline TreeEnsemble fixture_forest(const Vocabulary& v) {
    const uint32_t caps = v.stat_base() + static_cast<uint32_t>(StatFeature::CapsRatio);
    const uint32_t excl = v.stat_base() + static_cast<uint32_t>(StatFeature::ExclamationRatio);
    return TreeEnsemble({
        stump(caps, 0.2, 0.9, 0.1),
        stump(excl, 0.3, 0.9, 0.1),
        constant_tree(0.9)
    });
}

// Each side's terms are likely under its own class; neutral terms are equally
// likely everywhere, so neutral text scores identically under all classes.
inline NaiveBayesModel fixture_bias_model(const Vocabulary& v) {
    auto make = [&](BiasLabel label) {
        NaiveBayesClass c;
        c.label = label;
        c.log_prior = std::log(1.0 / 3.0);
        c.log_probs.assign(v.size(), std::log(0.05));
        for (const auto& t : left_terms()) {
            uint32_t id = 0;
            v.lookup(t, id);
            c.log_probs[id] = std::log(label == BiasLabel::Left ? 0.08 : 0.002);
        }
        for (const auto& t : right_terms()) {
            uint32_t id = 0;
            v.lookup(t, id);
            c.log_probs[id] = std::log(label == BiasLabel::Right ? 0.08 : 0.002);
        }
        return c;
    };
    return NaiveBayesModel({make(BiasLabel::Left), make(BiasLabel::Center), make(BiasLabel::Right)}, v.size());
}

inline std::shared_ptr<const ModelBundle> fixture_bundle() {
    Vocabulary v = fixture_vocabulary();
    TreeEnsemble forest = fixture_forest(v);
    NaiveBayesModel nb = fixture_bias_model(v);
    return std::make_shared<const ModelBundle>(std::move(v), std::move(forest), std::move(nb));
}

inline std::string repeat_until(const std::vector<std::string>& sentences, size_t min_words) {
    std::string out;
    size_t words = 0;
    for (size_t i = 0; words < min_words; ++i) {
        const std::string& s = sentences[i % sentences.size()];
        if (!out.empty()) out += ' ';
        out += s;
        for (char c : s) {
            if (c == ' ') ++words;
        }
        ++words;
    }
    return out;
}

// politically neutral wire-style copy, roughly 500 words
inline std::string neutral_article() {
    return repeat_until({
        "Government officials released the quarterly budget report on Tuesday, according to a statement from the finance ministry.",
        "The report showed the regional economy grew by 2.1 percent over the period, slightly above the estimate published in March.",
        "Council members reviewed the data during a public session and asked the statistics office for a detailed breakdown by sector.",
        "Market analysts noted that manufacturing output rose while retail spending remained broadly flat across the surveyed cities.",
        "According to the ministry, the budget deficit narrowed as tax receipts increased and borrowing costs stayed near recent averages.",
        "Officials said the figures would be revised next month once late submissions from smaller municipalities are processed.",
        "The central statistics office plans to publish the full methodology alongside the revised data later in the year.",
        "Independent economists described the results as consistent with a gradual recovery in domestic demand and investment.",
    }, 500);
}

inline std::string left_article() {
    return repeat_until({
        "Progressive activists rallied against inequality as billionaires recorded another year of soaring profits.",
        "The activists demanded equity for workers and argued that billionaires have captured the progressive agenda.",
        "Organizers said inequality and the power of billionaires would define the next progressive campaign for equity.",
    }, 120);
}

inline std::string right_article() {
    return repeat_until({
        "Patriots gathered to defend liberty and warned taxpayers about socialist spending plans pushed by coastal elites.",
        "Speakers told taxpayers that liberty is under threat from socialist elites who ignore ordinary patriots.",
    }, 120);
}

// same neutral copy, shouted
inline std::string shouting_article() {
    return repeat_until({
        "GOVERNMENT OFFICIALS ARE HIDING THE REAL BUDGET REPORT FROM YOU!!!",
        "THE ECONOMY DATA IS FAKE AND THE COUNCIL KNOWS IT!!!",
        "SHARE THIS BEFORE THE MARKET REPORT GETS DELETED!!!",
    }, 120);
}

inline std::string ten_words() {
    return "Markets were quiet today as traders awaited the budget report.";
}

inline std::string single_sentence() {
    return "The council approved the new transit budget on Monday evening.";
}

// Scraper double: fails a fixed number of times, then serves a fixed article.
class ScriptedScraper final : public scrape::Scraper {
public:
    enum class Failure { None, Unreachable, Paywalled, Timeout };

    ScriptedScraper(Failure failure, int failures, Article article)
        : m_failure(failure), m_failures_left(failures), m_article(std::move(article)) {}

    Article scrape(const std::string& url, double) override {
        ++m_calls;
        if (m_failures_left.fetch_sub(1) > 0) {
            switch (m_failure) {
                case Failure::Unreachable:
                    throw ScrapeError(ScrapeFailure::Unreachable, "connection refused: " + url);
                case Failure::Paywalled:
                    throw ScrapeError(ScrapeFailure::Paywalled, "paywall at " + url);
                case Failure::Timeout:
                    throw TimeoutError("timed out fetching " + url);
                case Failure::None:
                    break;
            }
        }
        Article a = m_article;
        a.url = url;
        return a;
    }

    int calls() const { return m_calls.load(); }

private:
    Failure m_failure;
    std::atomic<int> m_failures_left;
    std::atomic<int> m_calls{0};
    Article m_article;
};

}  // namespace fixtures
