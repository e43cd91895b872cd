#pragma once

#include "model/NaiveBayes.hpp"
#include "model/TreeEnsemble.hpp"
#include "text/Vocabulary.hpp"

#include <memory>
#include <string>

namespace newscheckr {

// Trained parameters shared read-only by every request: vocabulary,
// credibility forest and bias model. Built once at startup, never mutated.
class ModelBundle {
public:
    // Checks that every feature the forest references exists and that the bias
    // model covers the vocabulary. Throws ModelUnavailableError otherwise.
    ModelBundle(Vocabulary vocab, TreeEnsemble credibility, NaiveBayesModel bias);

    // Loads vocabulary.json, credibility_forest.json and bias_nb.json from dir.
    // Any missing file, parse error or invalid parameter -> ModelUnavailableError.
    static std::shared_ptr<const ModelBundle> load_from_dir(const std::string& dir);

    const Vocabulary& vocabulary() const { return m_vocab; }
    const TreeEnsemble& credibility_model() const { return m_credibility; }
    const NaiveBayesModel& bias_model() const { return m_bias; }

private:
    Vocabulary m_vocab;
    TreeEnsemble m_credibility;
    NaiveBayesModel m_bias;
};

}  // namespace newscheckr
