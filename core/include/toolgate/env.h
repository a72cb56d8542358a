#pragma once
#include "descriptor.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace toolgate {

// Source of environment values. The default reads the live process
// environment; tests substitute a map.
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

EnvLookup process_env_lookup();
EnvLookup map_env_lookup(EnvMap vars);

// Replace every ${NAME} in value with lookup(NAME). Unknown or empty names
// expand to "". An unterminated "${" and "${}" are left as-is.
std::string expand_placeholders(const std::string& value, const EnvLookup& lookup);

// Variables a spawned server inherits from the parent regardless of its
// declared overlay. Everything else in the parent environment is withheld.
const std::vector<std::string>& inherited_env_names();

// Inherited subset of the parent environment, overlaid with `overlay`.
// Values that start with "()" (exported shell functions) are not inherited.
EnvMap build_child_environment(const EnvMap& overlay, const EnvLookup& lookup);

// "KEY=VALUE" strings in map order, ready for execve().
std::vector<std::string> to_envp(const EnvMap& env);

// Integer environment value with a default for unset/unparseable input.
int64_t getenv_i64(const char* key, int64_t defv);
bool getenv_flag(const char* key, bool defv);

} // namespace toolgate
