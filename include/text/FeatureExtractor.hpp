#pragma once

#include "text/FeatureVector.hpp"
#include "text/Vocabulary.hpp"

#include <string>
#include <vector>

namespace newscheckr {

// Raw article text -> FeatureVector over a trained vocabulary.
// Pure function of (text, vocabulary, min_words): no state between calls.
class FeatureExtractor {
public:
    FeatureExtractor(const Vocabulary& vocab, size_t min_words);

    // Throws InsufficientContentError when the text has fewer than min_words tokens.
    FeatureVector extract(const std::string& text) const;

    size_t min_words() const { return m_min_words; }

private:
    const Vocabulary& m_vocab;
    size_t m_min_words;
};

// tokens = textutil::tokenize(textutil::normalize(raw)), before stopword removal
TextStats compute_text_stats(const std::string& raw, const std::vector<std::string>& tokens);

}  // namespace newscheckr
