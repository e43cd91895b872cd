#include "commands/sources.hpp"

#include "news/ResultJson.hpp"
#include "news/SourceRegistry.hpp"

#include <iostream>

using namespace newscheckr;

int cmd_sources(int, char**) {
    std::cout << sources_to_json(SourceRegistry::builtin().list()).dump(2) << "\n";
    return 0;
}
