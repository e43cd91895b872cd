#include "model/ModelBundle.hpp"
#include "io/JsonIO.hpp"
#include "news/Errors.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace newscheckr {

static Vocabulary parse_vocabulary(const json& j) {
    jsonio::require_object(j, "vocabulary");
    auto terms = jsonio::require_string_array(j, "terms", "vocabulary");
    auto idf = jsonio::require_number_array(j, "idf", "vocabulary");
    return Vocabulary(std::move(terms), std::move(idf));
}

static TreeNode parse_node(const json& j, const std::string& where, const Vocabulary& vocab) {
    jsonio::require_object(j, where);

    TreeNode n;
    if (j.contains("value")) {
        n.leaf = true;
        n.value = jsonio::require_number(j, "value", where);
        return n;
    }

    n.leaf = false;
    const std::string feature = jsonio::require_string(j, "feature", where);
    if (!vocab.resolve_feature(feature, n.feature)) {
        throw std::runtime_error(where + ".feature unknown feature: " + feature);
    }
    n.threshold = jsonio::require_number(j, "threshold", where);
    n.left = (int32_t)jsonio::require_integer(j, "left", where);
    n.right = (int32_t)jsonio::require_integer(j, "right", where);
    return n;
}

static TreeEnsemble parse_forest(const json& j, const Vocabulary& vocab) {
    jsonio::require_object(j, "forest");
    const json& trees = jsonio::require_field(j, "trees", "forest");
    jsonio::require_array(trees, "forest.trees");

    std::vector<DecisionTree> out;
    out.reserve(trees.size());
    for (size_t t = 0; t < trees.size(); ++t) {
        const std::string where = jsonio::index_path("forest.trees", t);
        jsonio::require_object(trees.at(t), where);

        const json& nodes = jsonio::require_field(trees.at(t), "nodes", where);
        jsonio::require_array(nodes, where + ".nodes");

        DecisionTree tree;
        tree.nodes.reserve(nodes.size());
        for (size_t i = 0; i < nodes.size(); ++i) {
            tree.nodes.push_back(parse_node(nodes.at(i), jsonio::index_path(where + ".nodes", i), vocab));
        }
        out.push_back(std::move(tree));
    }
    return TreeEnsemble(std::move(out));
}

static NaiveBayesModel parse_bias_model(const json& j, const Vocabulary& vocab) {
    jsonio::require_object(j, "bias");
    const json& classes = jsonio::require_field(j, "classes", "bias");
    jsonio::require_array(classes, "bias.classes");

    std::vector<NaiveBayesClass> out;
    out.reserve(classes.size());
    for (size_t c = 0; c < classes.size(); ++c) {
        const std::string where = jsonio::index_path("bias.classes", c);
        const json& cj = classes.at(c);
        jsonio::require_object(cj, where);

        NaiveBayesClass cls;
        const std::string label = jsonio::require_string(cj, "label", where);
        if (!parse_bias(label, cls.label)) {
            throw std::runtime_error(where + ".label must be Left, Center or Right");
        }
        cls.log_prior = jsonio::require_number(cj, "log_prior", where);
        const double unseen = jsonio::require_number(cj, "unseen_log_prob", where);

        cls.log_probs.assign(vocab.size(), unseen);

        const json& lp = jsonio::require_field(cj, "log_probs", where);
        jsonio::require_object(lp, where + ".log_probs");
        for (auto it = lp.begin(); it != lp.end(); ++it) {
            uint32_t id = 0;
            if (!vocab.lookup(it.key(), id)) {
                throw std::runtime_error(where + ".log_probs term not in vocabulary: " + it.key());
            }
            if (!it.value().is_number()) {
                throw std::runtime_error(where + ".log_probs." + it.key() + " must be a number");
            }
            cls.log_probs[id] = it.value().get<double>();
        }
        out.push_back(std::move(cls));
    }
    return NaiveBayesModel(std::move(out), vocab.size());
}

ModelBundle::ModelBundle(Vocabulary vocab, TreeEnsemble credibility, NaiveBayesModel bias)
    : m_vocab(std::move(vocab)), m_credibility(std::move(credibility)), m_bias(std::move(bias)) {
    if (m_vocab.size() == 0) {
        throw ModelUnavailableError("model bundle: empty vocabulary");
    }
    if (m_credibility.size() == 0) {
        throw ModelUnavailableError("model bundle: credibility forest has no trees");
    }
    if (m_credibility.max_feature_id() >= m_vocab.feature_count()) {
        throw ModelUnavailableError("model bundle: forest references feature " +
                                    std::to_string(m_credibility.max_feature_id()) + " outside the vocabulary");
    }
    if (m_bias.vocab_size() != m_vocab.size()) {
        throw ModelUnavailableError("model bundle: bias model covers " + std::to_string(m_bias.vocab_size()) +
                                    " terms, vocabulary has " + std::to_string(m_vocab.size()));
    }
}

std::shared_ptr<const ModelBundle> ModelBundle::load_from_dir(const std::string& dir) {
    const fs::path root(dir);
    try {
        const json vj = jsonio::read_json_file(root / "vocabulary.json");
        Vocabulary vocab = parse_vocabulary(vj);

        const json fj = jsonio::read_json_file(root / "credibility_forest.json");
        TreeEnsemble forest = parse_forest(fj, vocab);

        const json bj = jsonio::read_json_file(root / "bias_nb.json");
        NaiveBayesModel bias = parse_bias_model(bj, vocab);

        auto bundle = std::make_shared<const ModelBundle>(std::move(vocab), std::move(forest), std::move(bias));
        std::cerr << "ModelBundle: loaded " << bundle->vocabulary().size() << " terms, "
                  << bundle->credibility_model().size() << " trees from " << root.string() << "\n";
        return bundle;
    } catch (const ModelUnavailableError&) {
        throw;
    } catch (const std::exception& e) {
        throw ModelUnavailableError("failed to load models from " + root.string() + ": " + e.what());
    }
}

}  // namespace newscheckr
