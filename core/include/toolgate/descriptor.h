#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace toolgate {

enum class TransportKind { STDIO, HTTP, SSE };

const char* transport_kind_name(TransportKind k);

using EnvMap = std::map<std::string, std::string>;

// Raw, untrusted description of how to reach one tool-provider server.
// Nothing here has been checked; see validate() in validator.h.
struct ConnectionDescriptor {
    std::string label;                  // diagnostics only
    TransportKind transport{TransportKind::STDIO};

    // STDIO
    std::string command;
    std::vector<std::string> args;
    std::optional<EnvMap> env;          // values may hold ${NAME} placeholders

    // HTTP / SSE (recognized, never connected)
    std::string url;
    std::map<std::string, std::string> headers;
};

} // namespace toolgate
