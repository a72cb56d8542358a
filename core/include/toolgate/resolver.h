#pragma once

// Executable lookup. Read-only: existence and permission checks only.

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace toolgate {

struct ResolveOptions {
    std::optional<std::string> search_path;   // PATH
    std::optional<std::string> pathext;       // PATHEXT, consulted only with suffix_convention
    std::filesystem::path cwd;
    bool suffix_convention{false};            // Windows-style .exe/.cmd/... lookup
    char list_delimiter{':'};

    // Snapshot of the host process: PATH, PATHEXT, current directory and
    // the host platform's conventions.
    static ResolveOptions from_environment();
};

// Suffixes to try for a bare command name: {""} on platforms without a
// suffix convention, or when the command already carries one of them.
std::vector<std::string> executable_suffixes(const std::string& command,
                                             bool suffix_convention,
                                             const std::optional<std::string>& pathext);

// Existence plus execute permission where the platform has one.
bool is_executable_file(const std::filesystem::path& p);

// Absolute path of the executable `command` refers to.
// Throws NotFoundError naming the command and the server label.
std::string resolve_executable(const std::string& command,
                               const std::string& label,
                               const ResolveOptions& opt);
std::string resolve_executable(const std::string& command, const std::string& label);

} // namespace toolgate
