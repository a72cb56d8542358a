#pragma once

// Trust boundary: nothing from a ConnectionDescriptor reaches process
// spawning except through a ValidatedCommand.

#include "descriptor.h"
#include "env.h"

#include <cstddef>
#include <string>
#include <vector>

namespace toolgate {

constexpr size_t MAX_COMMAND_LENGTH = 256;
constexpr size_t MAX_ARG_LENGTH = 2048;
constexpr size_t MAX_ARGS = 64;

class ValidatedCommand;

// Throws ValidationError naming the offending field and the server label.
ValidatedCommand validate(const ConnectionDescriptor& d);
ValidatedCommand validate(const ConnectionDescriptor& d, const EnvLookup& lookup);

class ValidatedCommand {
public:
    const std::string& label() const { return label_; }
    const std::string& command() const { return command_; }
    const std::vector<std::string>& args() const { return args_; }

    // Declared overlay with ${NAME} placeholders already expanded.
    const EnvMap& env() const { return env_; }

private:
    ValidatedCommand() = default;
    friend ValidatedCommand validate(const ConnectionDescriptor& d, const EnvLookup& lookup);

    std::string label_;
    std::string command_;
    std::vector<std::string> args_;
    EnvMap env_;
};

// Helpers shared with the resolver and the config loader.
bool is_valid_label(const std::string& label);
bool has_control_chars(const std::string& s);
bool has_path_separator(const std::string& s);
bool has_parent_segment(const std::string& command);
bool is_absolute_command(const std::string& command);
std::string trim(const std::string& s);

} // namespace toolgate
