#include "commands/analyze.hpp"

#include "io/ConfigIO.hpp"
#include "model/ModelBundle.hpp"
#include "news/AnalysisService.hpp"
#include "news/Errors.hpp"
#include "news/ResultJson.hpp"
#include "news/SourceRegistry.hpp"
#include "scrape/CurlScraper.hpp"
#include "scrape/MockScraper.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <iostream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
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

struct Printer {
    std::ostream* a = nullptr;
    std::ostream* b = nullptr;
    template <typename T>
    Printer& operator<<(const T& v) {
        if (a) (*a) << v;
        if (b) (*b) << v;
        return *this;
    }
    Printer& operator<<(std::ostream& (*manip)(std::ostream&)) {
        if (a) manip(*a);
        if (b) manip(*b);
        return *this;
    }
};

static bool open_out(std::ofstream& out, const std::string& out_path) {
    if (out_path.empty()) return false;
    try {
        fs::path p(out_path);
        if (p.has_parent_path()) fs::create_directories(p.parent_path());
        out.open(p, std::ios::out | std::ios::trunc);
        return (bool)out;
    } catch (const fs::filesystem_error&) {
        return false;
    }
}

static int exit_code_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::InputError: return 2;
        case ErrorCode::ScrapeError: return 3;
        case ErrorCode::Timeout: return 4;
        case ErrorCode::ModelUnavailable: return 5;
        case ErrorCode::InsufficientContent:
        case ErrorCode::SummarizationError:
            break;
    }
    return 1;
}

static int analyze_usage() {
    std::cerr << "usage:\n"
              << "  newscheckr analyze (--url <u> | --text <t> | --file <path>) [options]\n"
              << "  newscheckr analyze --help\n";
    return 2;
}

static bool read_text_file(const std::string& path, std::string& out) {
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f) return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    out = ss.str();
    return true;
}

static int fail(const nlohmann::json& err, int code) {
    std::cout << err.dump(2) << "\n";
    return code;
}

int cmd_analyze(int argc, char** argv) {
    const std::string url = get_arg(argc, argv, "--url", "");
    std::string text = get_arg(argc, argv, "--text", "");
    const std::string file = get_arg(argc, argv, "--file", "");
    const std::string source = get_arg(argc, argv, "--source", "");
    const std::string config_path = get_arg(argc, argv, "--config", "");
    const std::string mock_path = get_arg(argc, argv, "--scrape_mock", "");
    const std::string out_path = get_arg(argc, argv, "--out", "");
    const bool verbose = has_flag(argc, argv, "--verbose");

    const int inputs = (url.empty() ? 0 : 1) + (has_flag(argc, argv, "--text") ? 1 : 0) + (file.empty() ? 0 : 1);
    if (inputs != 1) {
        std::cerr << "error: exactly one of --url, --text, --file is required\n";
        return analyze_usage();
    }

    if (!file.empty() && !read_text_file(file, text)) {
        return fail(error_to_json(InputError("cannot read --file " + file)), 2);
    }

    // configuration: defaults < --config file < flags
    PipelineConfig cfg;
    try {
        if (!config_path.empty()) cfg = load_pipeline_config(config_path);
        cfg.models_dir = get_arg(argc, argv, "--models", cfg.models_dir);

        const std::string max_sentences = get_arg(argc, argv, "--max_sentences", "");
        if (!max_sentences.empty()) {
            const long n = std::stol(max_sentences);
            if (n <= 0) throw std::invalid_argument("--max_sentences must be positive");
            cfg.max_sentences = (size_t)n;
        }
        const std::string timeout = get_arg(argc, argv, "--timeout", "");
        if (!timeout.empty()) cfg.scrape_timeout_seconds = std::stod(timeout);

        validate_config(cfg);
    } catch (const std::exception& e) {
        return fail(error_to_json(InputError(std::string("invalid configuration: ") + e.what())), 2);
    }

    std::shared_ptr<const ModelBundle> models;
    try {
        models = ModelBundle::load_from_dir(cfg.models_dir);
    } catch (const ModelUnavailableError& e) {
        return fail(error_to_json(e), 5);
    }

    std::shared_ptr<scrape::Scraper> scraper;
    if (!mock_path.empty()) {
        try {
            scraper = std::make_shared<scrape::MockScraper>(scrape::MockScraper::from_file(mock_path));
        } catch (const std::runtime_error& e) {
            return fail(error_to_json(InputError(std::string("invalid --scrape_mock: ") + e.what())), 2);
        }
    } else {
        scraper = std::make_shared<scrape::CurlScraper>();
    }

    StageObserver observer;
    if (verbose) {
        observer = [](Stage stage, const std::string& detail) {
            std::cerr << "Pipeline: [" << stage_str(stage) << "] " << detail << "\n";
        };
    }

    std::ofstream out;
    bool write_out = false;
    if (!out_path.empty()) {
        write_out = open_out(out, out_path);
        if (!write_out) {
            std::cerr << "error: failed to open --out path: " << out_path << "\n";
            return 1;
        }
    }

    Printer pr;
    pr.a = &std::cout;
    pr.b = write_out ? (std::ostream*)&out : nullptr;

    try {
        const AnalysisService service(models, SourceRegistry::builtin(), cfg, scraper);
        const AnalysisResult r = url.empty() ? service.analyze_text(text, source, observer)
                                             : service.analyze(url, observer);
        pr << result_to_json(r).dump(2) << "\n";
        return 0;
    } catch (const AnalysisError& e) {
        pr << error_to_json(e).dump(2) << "\n";
        return exit_code_for(e.code());
    } catch (const std::exception& e) {
        pr << error_to_json("internal_error", e.what()).dump(2) << "\n";
        return 1;
    }
}
