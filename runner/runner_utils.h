#pragma once

#include "toolgate/config_loader.h"
#include "toolgate/json.h"

#include <exception>
#include <optional>
#include <string>

namespace toolgate {

// Applies the profile defaults and installs the shutdown hook before any
// client is created.
void prepare_runtime();

// Loads the config, printing a diagnostic on failure.
std::optional<ServerConfigSet> load_config_or_report(const std::string& path);

// Prints a tagged diagnostic for e (error kind, server, tool) and returns 1.
int report_failure(const std::exception& e);

// Parses a command-line JSON object; empty text means {}.
std::optional<json::Value> parse_args_object(const std::string& text);

} // namespace toolgate
