#include "toolgate/discovery.h"
#include "toolgate/errors.h"

#include <iostream>

namespace toolgate {

DiscoveryResult discover_server(const ServerConfigSet& config, const std::string& name) {
    return discover_server(config, name, ClientRuntime::global(), ClientOptions{});
}

DiscoveryResult discover_server(const ServerConfigSet& config, const std::string& name,
                                ClientRuntime& rt, const ClientOptions& opt) {
    DiscoveryResult r;
    r.server = name;
    if (!config.contains(name)) {
        r.error = "Server \"" + name + "\" not found in config";
        return r;
    }

    std::cerr << "[discover] connecting to " << name << "...\n";
    std::shared_ptr<Client> client = Client::create(name, rt, opt);
    try {
        client->connect(config.get(name));
        r.tools = client->list_tools();
        std::cerr << "[discover] " << name << ": " << r.tools.size() << " tool(s)\n";
    } catch (const std::exception& e) {
        std::cerr << "[discover] " << name << " failed: " << e.what() << "\n";
        r.tools.clear();
        r.error = e.what();
    }

    try {
        client->close();
    } catch (const ConnectionError& e) {
        if (!r.error) r.error = e.what();
    }
    return r;
}

std::vector<DiscoveryResult> discover_all(const ServerConfigSet& config) {
    return discover_all(config, ClientRuntime::global(), ClientOptions{});
}

std::vector<DiscoveryResult> discover_all(const ServerConfigSet& config,
                                          ClientRuntime& rt, const ClientOptions& opt) {
    std::cerr << "[discover] " << config.size() << " server(s)\n";
    std::vector<DiscoveryResult> out;
    out.reserve(config.size());
    for (const auto& name : config.server_names()) {
        out.push_back(discover_server(config, name, rt, opt));
    }
    return out;
}

std::vector<DiscoveredTool> flatten_tools(const std::vector<DiscoveryResult>& results) {
    std::vector<DiscoveredTool> out;
    for (const auto& r : results) {
        for (const auto& t : r.tools) out.push_back({r.server, t});
    }
    return out;
}

void print_summary(const std::vector<DiscoveryResult>& results, std::ostream& out) {
    const std::string rule(50, '=');
    out << rule << "\n" << "Discovery Summary\n" << rule << "\n";

    size_t total_tools = 0;
    size_t ok_servers = 0;
    size_t failed_servers = 0;
    for (const auto& r : results) {
        if (r.error) {
            out << "FAIL " << r.server << ": " << *r.error << "\n";
            failed_servers++;
        } else {
            out << "OK   " << r.server << ": " << r.tools.size() << " tool(s)\n";
            total_tools += r.tools.size();
            ok_servers++;
        }
    }

    out << rule << "\n";
    out << "Total: " << total_tools << " tool(s) from " << ok_servers << " server(s)\n";
    if (failed_servers > 0) out << "Failed servers: " << failed_servers << "\n";
    out << rule << "\n";
}

} // namespace toolgate
