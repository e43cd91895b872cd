#include "commands/health.hpp"

#include "io/ConfigIO.hpp"
#include "model/ModelBundle.hpp"
#include "news/AnalysisService.hpp"
#include "news/Errors.hpp"
#include "news/ResultJson.hpp"
#include "news/SourceRegistry.hpp"

#include <iostream>
#include <string>

using namespace newscheckr;

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

// Exit 0 when the models load, 5 otherwise. The health JSON is printed either way.
int cmd_health(int argc, char** argv) {
    PipelineConfig cfg;
    const std::string config_path = get_arg(argc, argv, "--config", "");
    try {
        if (!config_path.empty()) cfg = load_pipeline_config(config_path);
    } catch (const std::runtime_error& e) {
        std::cout << error_to_json(InputError(std::string("invalid configuration: ") + e.what())).dump(2) << "\n";
        return 2;
    }
    cfg.models_dir = get_arg(argc, argv, "--models", cfg.models_dir);

    std::shared_ptr<const ModelBundle> models;
    try {
        models = ModelBundle::load_from_dir(cfg.models_dir);
    } catch (const ModelUnavailableError& e) {
        std::cerr << "health: " << e.what() << "\n";
    }

    const AnalysisService service(models, SourceRegistry::builtin(), cfg);
    nlohmann::json j = health_to_json(service.health());
    if (has_flag(argc, argv, "--show_config")) j["config"] = config_to_json(cfg);

    std::cout << j.dump(2) << "\n";
    return j["modelsLoaded"].get<bool>() ? 0 : 5;
}
