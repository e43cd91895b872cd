#include "text/FeatureVector.hpp"

#include <algorithm>

namespace newscheckr {

const char* stat_feature_name(StatFeature f) {
    switch (f) {
        case StatFeature::WordCount: return "word_count";
        case StatFeature::SentenceCount: return "sentence_count";
        case StatFeature::AvgWordLength: return "avg_word_length";
        case StatFeature::ExclamationRatio: return "exclamation_ratio";
        case StatFeature::QuestionRatio: return "question_ratio";
        case StatFeature::CapsRatio: return "caps_ratio";
        default: return "unknown";
    }
}

bool parse_stat_feature(const std::string& name, StatFeature& out) {
    for (uint32_t i = 0; i < kStatFeatureCount; ++i) {
        const auto f = static_cast<StatFeature>(i);
        if (name == stat_feature_name(f)) {
            out = f;
            return true;
        }
    }
    return false;
}

double TextStats::get(StatFeature f) const {
    switch (f) {
        case StatFeature::WordCount: return word_count;
        case StatFeature::SentenceCount: return sentence_count;
        case StatFeature::AvgWordLength: return avg_word_length;
        case StatFeature::ExclamationRatio: return exclamation_ratio;
        case StatFeature::QuestionRatio: return question_ratio;
        case StatFeature::CapsRatio: return caps_ratio;
        default: return 0.0;
    }
}

double FeatureVector::value(uint32_t feature_id) const {
    if (feature_id >= stat_base) {
        const uint32_t idx = feature_id - stat_base;
        if (idx >= kStatFeatureCount) return 0.0;
        return stats.get(static_cast<StatFeature>(idx));
    }

    auto it = std::lower_bound(weights.begin(), weights.end(), feature_id,
                               [](const std::pair<uint32_t, float>& w, uint32_t id) { return w.first < id; });
    if (it == weights.end() || it->first != feature_id) return 0.0;
    return it->second;
}

void sort_and_merge(SparseWeights& v) {
    std::sort(v.begin(), v.end(), [](auto& x, auto& y){ return x.first < y.first; });
    size_t w = 0;
    for (size_t i = 0; i < v.size(); ) {
        uint32_t id = v[i].first;
        float sum = 0.0f;
        size_t j = i;
        while (j < v.size() && v[j].first == id) {
            sum += v[j].second;
            ++j;
        }
        v[w++] = {id, sum};
        i = j;
    }
    v.resize(w);
}

double dot_sparse(const SparseWeights& a, const SparseWeights& b) {
    size_t i = 0, j = 0;
    double s = 0.0;
    while (i < a.size() && j < b.size()) {
        if (a[i].first == b[j].first) {
            s += (double)a[i].second * (double)b[j].second;
            ++i; ++j;
        } else if (a[i].first < b[j].first) {
            ++i;
        } else {
            ++j;
        }
    }
    return s;
}

}  // namespace newscheckr
