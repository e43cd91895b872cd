#include "text/FeatureExtractor.hpp"
#include "text/TextUtil.hpp"
#include "news/Errors.hpp"

#include <cctype>
#include <cmath>
#include <unordered_map>

namespace newscheckr {

FeatureExtractor::FeatureExtractor(const Vocabulary& vocab, size_t min_words)
    : m_vocab(vocab), m_min_words(min_words) {}

TextStats compute_text_stats(const std::string& raw, const std::vector<std::string>& tokens) {
    TextStats st;
    st.word_count = static_cast<double>(tokens.size());

    size_t sentences = textutil::split_sentences(raw).size();
    if (sentences == 0 && !textutil::trim(raw).empty()) sentences = 1;
    st.sentence_count = static_cast<double>(sentences);

    size_t chars = 0;
    for (const auto& t : tokens) chars += t.size();
    st.avg_word_length = tokens.empty() ? 0.0 : static_cast<double>(chars) / static_cast<double>(tokens.size());

    size_t excl = 0, quest = 0, upper = 0, alpha = 0;
    for (unsigned char c : raw) {
        if (c == '!') ++excl;
        else if (c == '?') ++quest;
        if (std::isalpha(c)) {
            ++alpha;
            if (std::isupper(c)) ++upper;
        }
    }

    if (sentences > 0) {
        st.exclamation_ratio = static_cast<double>(excl) / static_cast<double>(sentences);
        st.question_ratio = static_cast<double>(quest) / static_cast<double>(sentences);
    }
    st.caps_ratio = alpha == 0 ? 0.0 : static_cast<double>(upper) / static_cast<double>(alpha);
    return st;
}

FeatureVector FeatureExtractor::extract(const std::string& text) const {
    const auto tokens = textutil::tokenize(textutil::normalize(text));
    if (tokens.size() < m_min_words) {
        throw InsufficientContentError(tokens.size(), m_min_words);
    }

    const auto content = textutil::remove_stopwords(tokens);

    std::unordered_map<uint32_t, uint32_t> tf;
    tf.reserve(content.size() * 2 + 8);

    auto count_term = [&](const std::string& t) {
        uint32_t id = 0;
        if (m_vocab.lookup(t, id)) tf[id] += 1;
    };

    for (const auto& t : content) count_term(t);
    if (m_vocab.has_bigrams()) {
        for (const auto& bg : textutil::bigrams(content)) count_term(bg);
    }

    FeatureVector fv;
    fv.word_count = tokens.size();
    fv.stat_base = m_vocab.stat_base();
    fv.stats = compute_text_stats(text, tokens);

    fv.weights.reserve(tf.size());
    for (const auto& kv : tf) {
        // log TF
        double w = (1.0 + std::log((double)kv.second)) * m_vocab.idf(kv.first);
        fv.weights.push_back({kv.first, (float)w});
    }

    // norm summed in term-id order
    sort_and_merge(fv.weights);
    double norm2 = 0.0;
    for (const auto& w : fv.weights) norm2 += (double)w.second * (double)w.second;

    if (norm2 > 0.0) {
        const double inv = 1.0 / std::sqrt(norm2);
        for (auto& w : fv.weights) w.second = (float)(w.second * inv);
    }

    return fv;
}

}  // namespace newscheckr
