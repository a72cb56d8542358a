#pragma once
#include "client.h"
#include "config_loader.h"

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace toolgate {

struct DiscoveryResult {
    std::string server;
    std::vector<ToolInfo> tools;
    std::optional<std::string> error;

    bool ok() const { return !error.has_value(); }
};

struct DiscoveredTool {
    std::string server;
    ToolInfo tool;
};

// Connects a fresh client, lists its tools and closes it again. Failures
// land in DiscoveryResult::error; the client is closed on every path.
// Progress lines go to stderr.
DiscoveryResult discover_server(const ServerConfigSet& config, const std::string& name);
DiscoveryResult discover_server(const ServerConfigSet& config, const std::string& name,
                                ClientRuntime& rt, const ClientOptions& opt);

// Every configured server, one after another, in config order.
std::vector<DiscoveryResult> discover_all(const ServerConfigSet& config);
std::vector<DiscoveryResult> discover_all(const ServerConfigSet& config,
                                          ClientRuntime& rt, const ClientOptions& opt);

std::vector<DiscoveredTool> flatten_tools(const std::vector<DiscoveryResult>& results);

void print_summary(const std::vector<DiscoveryResult>& results, std::ostream& out);

} // namespace toolgate
