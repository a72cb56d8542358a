#include "commands.h"
#include "runner_utils.h"

#include "toolgate/discovery.h"

#include <iostream>

using namespace toolgate;

// Usage: toolgate_cli discover <config> [server]
// Exit code 1 when any server could not be discovered.
int cmd_discover(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: toolgate_cli discover <config> [server]\n";
        return 2;
    }
    auto config = load_config_or_report(argv[2]);
    if (!config) return 1;
    prepare_runtime();

    std::vector<DiscoveryResult> results;
    if (argc >= 4) {
        results.push_back(discover_server(*config, argv[3]));
    } else {
        results = discover_all(*config);
    }

    for (const auto& dt : flatten_tools(results)) {
        std::cout << dt.server << "." << dt.tool.name;
        if (dt.tool.description) std::cout << "\t" << *dt.tool.description;
        std::cout << "\n";
    }
    print_summary(results, std::cout);

    for (const auto& r : results) {
        if (!r.ok()) return 1;
    }
    return 0;
}
