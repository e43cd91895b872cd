#include "model/TreeEnsemble.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace newscheckr {

static double clamp01(double x) {
    if (x < 0.0) return 0.0;
    if (x > 1.0) return 1.0;
    return x;
}

double DecisionTree::predict(const FeatureVector& v) const {
    size_t i = 0;
    // children always point forward, so this terminates within nodes.size() steps
    while (!nodes[i].leaf) {
        const TreeNode& n = nodes[i];
        i = (v.value(n.feature) <= n.threshold) ? (size_t)n.left : (size_t)n.right;
    }
    return nodes[i].value;
}

TreeEnsemble::TreeEnsemble(std::vector<DecisionTree> trees) : m_trees(std::move(trees)) {
    if (m_trees.empty()) throw std::invalid_argument("forest has no trees");

    for (size_t t = 0; t < m_trees.size(); ++t) {
        const auto& nodes = m_trees[t].nodes;
        const std::string where = "trees[" + std::to_string(t) + "]";
        if (nodes.empty()) throw std::invalid_argument(where + " has no nodes");

        for (size_t i = 0; i < nodes.size(); ++i) {
            const TreeNode& n = nodes[i];
            const std::string at = where + ".nodes[" + std::to_string(i) + "]";
            if (n.leaf) {
                if (!std::isfinite(n.value) || n.value < 0.0 || n.value > 1.0) {
                    throw std::invalid_argument(at + " leaf value must be in [0,1]");
                }
                continue;
            }
            if (!std::isfinite(n.threshold)) throw std::invalid_argument(at + " threshold must be finite");

            auto child_ok = [&](int32_t c) {
                return c > (int32_t)i && c < (int32_t)nodes.size();
            };
            if (!child_ok(n.left) || !child_ok(n.right)) {
                throw std::invalid_argument(at + " children must point forward inside the tree");
            }
            if (n.feature > m_max_feature) m_max_feature = n.feature;
        }
    }
}

double TreeEnsemble::predict_proba(const FeatureVector& v) const {
    if (m_trees.empty()) return 0.0;

    double sum = 0.0;
    for (const auto& t : m_trees) sum += t.predict(v);
    return clamp01(sum / (double)m_trees.size());
}

}  // namespace newscheckr
