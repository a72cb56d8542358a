#include "commands.h"
#include "runner_utils.h"

#include <iostream>

using namespace toolgate;

// Usage: toolgate_cli servers <config>
int cmd_servers(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: toolgate_cli servers <config>\n";
        return 2;
    }
    auto config = load_config_or_report(argv[2]);
    if (!config) return 1;

    for (const auto& d : config->servers()) {
        std::cout << d.label << "\t" << transport_kind_name(d.transport);
        if (d.transport == TransportKind::STDIO) std::cout << "\t" << d.command;
        else std::cout << "\t" << d.url;
        std::cout << "\n";
    }
    return 0;
}
