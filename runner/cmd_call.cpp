#include "commands.h"
#include "runner_utils.h"

#include "toolgate/client.h"
#include "toolgate/errors.h"

#include <iostream>

using namespace toolgate;

// Usage: toolgate_cli call <config> <server> <tool> [args_json]
// Prints the first content item of the result as JSON.
int cmd_call(int argc, char** argv) {
    if (argc < 5) {
        std::cerr << "usage: toolgate_cli call <config> <server> <tool> [args_json]\n";
        return 2;
    }
    const std::string server = argv[3];
    const std::string tool = argv[4];
    auto args = parse_args_object(argc >= 6 ? argv[5] : "");
    if (!args) {
        std::cerr << "args_json must be a JSON object\n";
        return 2;
    }

    auto config = load_config_or_report(argv[2]);
    if (!config) return 1;
    if (!config->contains(server)) {
        std::cerr << "[error] Server \"" << server << "\" not found in config\n";
        return 1;
    }
    prepare_runtime();

    std::shared_ptr<Client> client = Client::create(server);
    int rc = 0;
    try {
        client->connect(config->get(server));
        json::Value result = client->call_tool(tool, *args);
        std::cout << result.dump_pretty() << "\n";
    } catch (const Error& e) {
        rc = report_failure(e);
    }

    try {
        client->close();
    } catch (const ConnectionError& e) {
        if (rc == 0) rc = report_failure(e);
    }
    return rc;
}
