#include "toolgate/validator.h"
#include "toolgate/errors.h"

#include <cctype>
#include <filesystem>

namespace toolgate {

bool is_valid_label(const std::string& label) {
    if (label.empty()) return false;
    for (char c : label) {
        unsigned char u = (unsigned char)c;
        if (std::isalnum(u) || c == '.' || c == '_' || c == '-') continue;
        return false;
    }
    return true;
}

bool has_control_chars(const std::string& s) {
    for (char c : s) {
        if (c == '\0' || c == '\r' || c == '\n') return true;
    }
    return false;
}

bool has_path_separator(const std::string& s) {
    return s.find_first_of("/\\") != std::string::npos;
}

bool has_parent_segment(const std::string& command) {
    size_t start = 0;
    while (start <= command.size()) {
        size_t end = command.find_first_of("/\\", start);
        if (end == std::string::npos) end = command.size();
        if (end - start == 2 && command.compare(start, 2, "..") == 0) return true;
        start = end + 1;
    }
    return false;
}

bool is_absolute_command(const std::string& command) {
    return std::filesystem::path(command).is_absolute();
}

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) b++;
    while (e > b && std::isspace((unsigned char)s[e - 1])) e--;
    return s.substr(b, e - b);
}

ValidatedCommand validate(const ConnectionDescriptor& d) {
    return validate(d, process_env_lookup());
}

ValidatedCommand validate(const ConnectionDescriptor& d, const EnvLookup& lookup) {
    const std::string& label = d.label;
    const std::string who = "Server \"" + label + "\"";

    // Control characters are checked before trimming: trimming would
    // otherwise strip a trailing CR/LF and hide it.
    if (has_control_chars(label)) {
        throw ValidationError("Server label contains invalid control characters", label, "label");
    }
    if (!is_valid_label(label)) {
        throw ValidationError("Server label \"" + label +
                              "\" may only contain letters, numbers, \".\", \"-\", and \"_\"",
                              label, "label");
    }

    if (has_control_chars(d.command)) {
        throw ValidationError(who + " command contains invalid control characters", label, "command");
    }
    const std::string command = trim(d.command);
    if (command.empty() || command.size() > MAX_COMMAND_LENGTH) {
        throw ValidationError(who + " command must be between 1 and " +
                              std::to_string(MAX_COMMAND_LENGTH) + " characters",
                              label, "command");
    }
    if (has_parent_segment(command)) {
        throw ValidationError(who + " command must not include parent directory segments",
                              label, "command");
    }
    if (has_path_separator(command) && !is_absolute_command(command) &&
        command.rfind("./", 0) != 0 && command.rfind(".\\", 0) != 0) {
        throw ValidationError(who + " command path must be absolute or start with \"./\"",
                              label, "command");
    }

    if (d.args.size() > MAX_ARGS) {
        throw ValidationError(who + " has too many arguments (" + std::to_string(d.args.size()) +
                              ", max " + std::to_string(MAX_ARGS) + ")",
                              label, "args");
    }

    std::vector<std::string> args;
    args.reserve(d.args.size());
    for (size_t i = 0; i < d.args.size(); i++) {
        const std::string field = "args[" + std::to_string(i) + "]";
        if (has_control_chars(d.args[i])) {
            throw ValidationError("Argument " + std::to_string(i) + " for server \"" + label +
                                  "\" contains control characters",
                                  label, field);
        }
        std::string a = trim(d.args[i]);
        if (a.size() > MAX_ARG_LENGTH) {
            throw ValidationError("Argument " + std::to_string(i) + " for server \"" + label +
                                  "\" exceeds " + std::to_string(MAX_ARG_LENGTH) + " characters",
                                  label, field);
        }
        args.push_back(std::move(a));
    }

    EnvMap env;
    if (d.env) {
        for (const auto& kv : *d.env) {
            const std::string field = "env." + kv.first;
            if (kv.first.empty() || kv.first.find('=') != std::string::npos ||
                has_control_chars(kv.first)) {
                throw ValidationError(who + " declares an invalid environment variable name \"" +
                                      kv.first + "\"",
                                      label, field);
            }
            if (kv.second.find('\0') != std::string::npos) {
                throw ValidationError(who + " environment variable " + kv.first +
                                      " contains a NUL character",
                                      label, field);
            }
            env[kv.first] = expand_placeholders(kv.second, lookup);
        }
    }

    ValidatedCommand out;
    out.label_ = label;
    out.command_ = command;
    out.args_ = std::move(args);
    out.env_ = std::move(env);
    return out;
}

} // namespace toolgate
