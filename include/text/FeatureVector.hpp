#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace newscheckr {

// Dense text statistics appended after the vocabulary in feature-id space.
// Order is part of the model artifact contract.
enum class StatFeature : uint32_t {
    WordCount = 0,
    SentenceCount,
    AvgWordLength,
    ExclamationRatio,   // '!' per sentence
    QuestionRatio,      // '?' per sentence
    CapsRatio           // uppercase letters / all letters
};

constexpr size_t kStatFeatureCount = 6;

const char* stat_feature_name(StatFeature f);
bool parse_stat_feature(const std::string& name, StatFeature& out);

struct TextStats {
    double word_count = 0.0;
    double sentence_count = 0.0;
    double avg_word_length = 0.0;
    double exclamation_ratio = 0.0;
    double question_ratio = 0.0;
    double caps_ratio = 0.0;

    double get(StatFeature f) const;
};

using SparseWeights = std::vector<std::pair<uint32_t, float>>;  // (term_id, weight)

// TF-IDF weights over the trained vocabulary (sorted by term id, L2-normalized)
// plus the dense statistics. Feature ids [0, stat_base) address terms,
// [stat_base, stat_base + kStatFeatureCount) address statistics.
struct FeatureVector {
    SparseWeights weights;
    TextStats stats;
    size_t word_count = 0;
    uint32_t stat_base = 0;

    double value(uint32_t feature_id) const;
};

// sorts by id and sums duplicates
void sort_and_merge(SparseWeights& v);

double dot_sparse(const SparseWeights& a, const SparseWeights& b);

}  // namespace newscheckr
