#pragma once

#include "text/FeatureVector.hpp"

#include <cstdint>
#include <vector>

namespace newscheckr {

struct TreeNode {
    bool leaf = true;
    uint32_t feature = 0;     // internal: feature id
    double threshold = 0.0;   // internal: go left when value <= threshold
    int32_t left = -1;
    int32_t right = -1;
    double value = 0.0;       // leaf: probability of the positive class
};

struct DecisionTree {
    std::vector<TreeNode> nodes;  // nodes[0] is the root

    double predict(const FeatureVector& v) const;
};

// Averaged forest of binary trees (random-forest style probability).
class TreeEnsemble {
public:
    TreeEnsemble() = default;

    // Throws std::invalid_argument for empty forests, empty trees, children that
    // do not point forward inside the tree, or leaf values outside [0,1].
    explicit TreeEnsemble(std::vector<DecisionTree> trees);

    // Mean leaf probability over all trees, clamped to [0,1].
    double predict_proba(const FeatureVector& v) const;

    size_t size() const { return m_trees.size(); }
    uint32_t max_feature_id() const { return m_max_feature; }

private:
    std::vector<DecisionTree> m_trees;
    uint32_t m_max_feature = 0;
};

}  // namespace newscheckr
