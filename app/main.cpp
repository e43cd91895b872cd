#include "commands/analyze.hpp"
#include "commands/health.hpp"
#include "commands/sources.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  newscheckr analyze (--url <u> | --text <t> | --file <path>) [options]\n"
        << "  newscheckr sources\n"
        << "  newscheckr health [--models <dir>] [--config <path>] [--show_config]\n"
        << "  newscheckr help\n"
        << "  newscheckr <command> --help\n";
    return 1;
}

static int print_analyze_help() {
    std::cerr
        << "usage:\n"
        << "  newscheckr analyze (--url <u> | --text <t> | --file <path>) [options]\n"
        << "\n"
        << "input:\n"
        << "  --url <u>                    scrape and analyze an http(s) article\n"
        << "  --text <t>                   analyze raw text\n"
        << "  --file <path>                analyze raw text read from a file\n"
        << "  --source <domain>            publication the text came from (text/file only)\n"
        << "\n"
        << "pipeline:\n"
        << "  --models <dir>               default: models\n"
        << "  --config <path>              JSON overrides for pipeline settings\n"
        << "  --max_sentences <n>          default: 2\n"
        << "  --timeout <s>                scrape timeout, default: 10\n"
        << "  --scrape_mock <file>         serve URLs from a JSON fixture instead of curl\n"
        << "\n"
        << "output:\n"
        << "  --out <path>                 optional: mirror the result JSON to a file\n"
        << "  --verbose                    log pipeline stages to stderr\n"
        << "\n"
        << "exit codes: 0 ok, 2 input, 3 scrape, 4 timeout, 5 models unavailable, 1 other\n";
    return 0;
}

static int print_sources_help() {
    std::cerr
        << "usage:\n"
        << "  newscheckr sources           print the source reputation table as JSON\n";
    return 0;
}

static int print_health_help() {
    std::cerr
        << "usage:\n"
        << "  newscheckr health [options]\n"
        << "\n"
        << "options:\n"
        << "  --models <dir>               default: models\n"
        << "  --config <path>              JSON overrides for pipeline settings\n"
        << "  --show_config                include the effective settings in the output\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        print_usage();
        return 0;
    }

    // subcommand help
    const bool wants_help = (argc >= 3 && std::string(argv[2]) == "--help");
    if (cmd == "analyze" && wants_help) return print_analyze_help();
    if (cmd == "sources" && wants_help) return print_sources_help();
    if (cmd == "health"  && wants_help) return print_health_help();

    if (cmd == "analyze") return cmd_analyze(argc - 1, argv + 1);
    if (cmd == "sources") return cmd_sources(argc - 1, argv + 1);
    if (cmd == "health")  return cmd_health(argc - 1, argv + 1);

    std::cerr << "unknown command: " << cmd << "\n";
    return print_usage();
}
