#include "toolgate/config_loader.h"
#include "toolgate/errors.h"
#include "toolgate/json.h"
#include "toolgate/validator.h"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>

namespace toolgate {

std::vector<std::string> ServerConfigSet::server_names() const {
    std::vector<std::string> out;
    out.reserve(servers_.size());
    for (const auto& s : servers_) out.push_back(s.label);
    return out;
}

bool ServerConfigSet::contains(const std::string& name) const {
    for (const auto& s : servers_) {
        if (s.label == name) return true;
    }
    return false;
}

const ConnectionDescriptor& ServerConfigSet::get(const std::string& name) const {
    for (const auto& s : servers_) {
        if (s.label == name) return s;
    }
    throw ConfigError("Server \"" + name + "\" not found in config", name);
}

namespace {

struct Issues {
    std::vector<std::string> messages;
    std::string first_server;

    void add(const std::string& server, const std::string& path, const std::string& msg) {
        if (first_server.empty()) first_server = server;
        std::string m = path.empty() ? msg : path + ": " + msg;
        for (const auto& existing : messages) {
            if (existing == m) return;
        }
        messages.push_back(std::move(m));
    }
};

bool looks_like_url(const std::string& url) {
    size_t p = url.find("://");
    if (p == std::string::npos || p == 0) return false;
    for (size_t i = 0; i < p; i++) {
        char c = url[i];
        bool ok = std::isalnum((unsigned char)c) || c == '+' || c == '-' || c == '.';
        if (!ok || (i == 0 && !std::isalpha((unsigned char)c))) return false;
    }
    return p + 3 < url.size();
}

// String map member; records an issue for anything that is not an object
// of strings.
std::map<std::string, std::string> string_map(const json::Value& v, const std::string& server,
                                              const std::string& path, Issues& issues) {
    std::map<std::string, std::string> out;
    if (!v.is_object()) {
        issues.add(server, path, "Expected an object of strings");
        return out;
    }
    for (const auto& k : v.keys()) {
        auto s = v.at(k).as_string();
        if (!s) {
            issues.add(server, path + "." + k, "Expected string");
            continue;
        }
        out[k] = *s;
    }
    return out;
}

void parse_url_entry(const json::Value& entry, ConnectionDescriptor& d, const std::string& path, Issues& issues) {
    auto url = entry.at("url").as_string();
    if (!url) {
        issues.add(d.label, path + ".url", "Expected string");
        return;
    }
    const std::string u = trim(*url);
    if (u.empty()) {
        issues.add(d.label, path + ".url", "URL must not be empty");
    } else if (u.size() > MAX_URL_LENGTH) {
        issues.add(d.label, path + ".url", "URL must be <= " + std::to_string(MAX_URL_LENGTH) + " characters");
    } else if (!looks_like_url(u)) {
        issues.add(d.label, path + ".url", "Invalid URL format");
    }
    d.url = u;
    if (entry.has("headers")) d.headers = string_map(entry.at("headers"), d.label, path + ".headers", issues);
}

void parse_stdio_entry(const json::Value& entry, ConnectionDescriptor& d, const std::string& path, Issues& issues) {
    d.transport = TransportKind::STDIO;

    auto command = entry.at("command").as_string();
    if (!command) {
        issues.add(d.label, path + ".command", "Expected string");
        return;
    }
    d.command = *command;

    if (entry.has("args")) {
        json::Value args = entry.at("args");
        if (!args.is_array()) {
            issues.add(d.label, path + ".args", "Expected array");
        } else {
            for (size_t i = 0; i < args.size(); i++) {
                auto a = args.at(i).as_string();
                if (!a) {
                    issues.add(d.label, path + ".args." + std::to_string(i), "Expected string");
                    continue;
                }
                d.args.push_back(*a);
            }
        }
    }
    if (entry.has("env")) d.env = string_map(entry.at("env"), d.label, path + ".env", issues);

    // Same checks connect() applies, reported at load time.
    try {
        (void)validate(d);
    } catch (const ValidationError& e) {
        std::string field = e.field();
        if (field.rfind("args[", 0) == 0) {
            field = "args." + field.substr(5, field.size() - 6);
        }
        issues.add(d.label, path + "." + field, e.what());
    }
}

} // namespace

ServerConfigSet parse_config(const std::string& json_text) {
    json::Value root = json::Value::parse(json_text);
    if (!root) {
        throw ConfigError("Invalid JSON in config file");
    }
    if (!root.is_object()) {
        throw ConfigError("Invalid MCP configuration: expected a JSON object");
    }
    json::Value servers = root.at("mcpServers");
    if (!servers.is_object()) {
        throw ConfigError("Invalid MCP configuration: mcpServers: Required object");
    }

    Issues issues;
    std::vector<ConnectionDescriptor> out;
    for (const auto& raw_name : servers.keys()) {
        const std::string name = trim(raw_name);
        const std::string path = "mcpServers." + raw_name;

        if (name.empty()) {
            issues.add(raw_name, path, "Server name must not be empty");
            continue;
        }
        if (!is_valid_label(name)) {
            issues.add(raw_name, path, "Server names may only contain letters, numbers, \".\", \"-\", and \"_\"");
            continue;
        }
        bool duplicate = false;
        for (const auto& prev : out) duplicate = duplicate || prev.label == name;
        if (duplicate) {
            issues.add(name, path, "Duplicate server name \"" + name + "\"");
            continue;
        }

        json::Value entry = servers.at(raw_name);
        if (!entry.is_object()) {
            issues.add(name, path, "Server config must be an object");
            continue;
        }

        ConnectionDescriptor d;
        d.label = name;

        const auto type = entry.at("type").as_string();
        if (entry.has("type") && !type) {
            issues.add(name, path + ".type", "Expected string");
            continue;
        }

        if (type && (*type == "http" || *type == "sse")) {
            d.transport = *type == "sse" ? TransportKind::SSE : TransportKind::HTTP;
            parse_url_entry(entry, d, path, issues);
        } else if (type && *type != "stdio") {
            issues.add(name, path + ".type", "Unknown transport type \"" + *type + "\"");
            continue;
        } else if (entry.has("command")) {
            parse_stdio_entry(entry, d, path, issues);
        } else if (entry.has("url") && !type) {
            d.transport = TransportKind::HTTP;
            parse_url_entry(entry, d, path, issues);
        } else {
            issues.add(name, path,
                       "Server config must have either \"command\" (for STDIO) or \"url\" (for HTTP/SSE)");
            continue;
        }
        out.push_back(std::move(d));
    }

    if (!issues.messages.empty()) {
        std::string msg = "Invalid MCP configuration: ";
        for (size_t i = 0; i < issues.messages.size(); i++) {
            if (i > 0) msg += "; ";
            msg += issues.messages[i];
        }
        throw ConfigError(msg, issues.first_server);
    }
    return ServerConfigSet(std::move(out));
}

ServerConfigSet load_config_file(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw ConfigError("Config file not found: " + path);
    }
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        throw ConfigError("Cannot read config file: " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return parse_config(ss.str());
}

} // namespace toolgate
