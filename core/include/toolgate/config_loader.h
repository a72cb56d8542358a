#pragma once

// Loader for the {"mcpServers": {name: entry}} configuration format.
//
// Entry shapes:
//   stdio     {"command": "...", "args": [...], "env": {...}, "type": "stdio"?}
//   http/sse  {"type": "http"|"sse", "url": "...", "headers": {...}?}
//   url-only  {"url": "...", "headers": {...}?}        (treated as http)

#include "descriptor.h"

#include <cstddef>
#include <string>
#include <vector>

namespace toolgate {

constexpr size_t MAX_URL_LENGTH = 2048;

class ServerConfigSet {
public:
    ServerConfigSet() = default;
    explicit ServerConfigSet(std::vector<ConnectionDescriptor> servers) : servers_(std::move(servers)) {}

    // Names in file order.
    std::vector<std::string> server_names() const;

    bool contains(const std::string& name) const;

    // Throws ConfigError when the name is not configured.
    const ConnectionDescriptor& get(const std::string& name) const;

    const std::vector<ConnectionDescriptor>& servers() const { return servers_; }
    size_t size() const { return servers_.size(); }
    bool empty() const { return servers_.empty(); }

private:
    std::vector<ConnectionDescriptor> servers_;
};

// Throws ConfigError listing every problem found ("mcpServers.NAME.FIELD: ...").
ServerConfigSet parse_config(const std::string& json_text);
ServerConfigSet load_config_file(const std::string& path);

} // namespace toolgate
