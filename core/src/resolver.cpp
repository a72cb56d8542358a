#include "toolgate/resolver.h"
#include "toolgate/errors.h"
#include "toolgate/validator.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <system_error>

#ifndef _WIN32
  #include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace toolgate {

static std::string to_lower(std::string s) {
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

static bool ends_with(const std::string& s, const std::string& suf) {
    return s.size() >= suf.size() && s.compare(s.size() - suf.size(), suf.size(), suf) == 0;
}

ResolveOptions ResolveOptions::from_environment() {
    ResolveOptions o;
    if (const char* p = std::getenv("PATH")) o.search_path = std::string(p);
    if (const char* p = std::getenv("PATHEXT")) o.pathext = std::string(p);
    std::error_code ec;
    o.cwd = fs::current_path(ec);
#ifdef _WIN32
    o.suffix_convention = true;
    o.list_delimiter = ';';
#else
    o.suffix_convention = false;
    o.list_delimiter = ':';
#endif
    return o;
}

std::vector<std::string> executable_suffixes(const std::string& command,
                                             bool suffix_convention,
                                             const std::optional<std::string>& pathext) {
    if (!suffix_convention) return {""};

    std::vector<std::string> exts;
    if (pathext) {
        size_t start = 0;
        while (start <= pathext->size()) {
            size_t end = pathext->find(';', start);
            if (end == std::string::npos) end = pathext->size();
            std::string e = trim(pathext->substr(start, end - start));
            if (!e.empty()) {
                e = to_lower(e);
                if (e[0] != '.') e = "." + e;
                exts.push_back(e);
            }
            start = end + 1;
        }
    }
    if (exts.empty()) exts = {".exe", ".cmd", ".bat", ".com"};

    const std::string lower = to_lower(command);
    for (const auto& e : exts) {
        if (ends_with(lower, e)) return {""};
    }
    return exts;
}

bool is_executable_file(const fs::path& p) {
    std::error_code ec;
    if (!fs::is_regular_file(p, ec)) return false;
#ifdef _WIN32
    return true;
#else
    return ::access(p.c_str(), X_OK) == 0;
#endif
}

std::string resolve_executable(const std::string& command,
                               const std::string& label,
                               const ResolveOptions& opt) {
    if (has_path_separator(command)) {
        fs::path candidate = is_absolute_command(command) ? fs::path(command)
                                                          : (opt.cwd / command);
        candidate = candidate.lexically_normal();
        if (is_executable_file(candidate)) return candidate.string();
        throw NotFoundError("Executable \"" + command + "\" for server \"" + label +
                            "\" not found or not executable",
                            label, command);
    }

    if (!opt.search_path || opt.search_path->empty()) {
        throw NotFoundError("Unable to resolve command \"" + command + "\" for server \"" + label +
                            "\" because PATH is not defined",
                            label, command);
    }

    std::vector<std::string> dirs;
    {
        const std::string& sp = *opt.search_path;
        size_t start = 0;
        while (start <= sp.size()) {
            size_t end = sp.find(opt.list_delimiter, start);
            if (end == std::string::npos) end = sp.size();
            if (end > start) dirs.push_back(sp.substr(start, end - start));
            start = end + 1;
        }
    }

    const auto suffixes = executable_suffixes(command, opt.suffix_convention, opt.pathext);
    for (const auto& dir : dirs) {
        fs::path base(dir);
        if (base.is_relative()) base = opt.cwd / base;
        for (const auto& suf : suffixes) {
            fs::path candidate = (base / (command + suf)).lexically_normal();
            if (is_executable_file(candidate)) return candidate.string();
        }
    }

    throw NotFoundError("Executable \"" + command + "\" for server \"" + label +
                        "\" was not found in PATH",
                        label, command);
}

std::string resolve_executable(const std::string& command, const std::string& label) {
    return resolve_executable(command, label, ResolveOptions::from_environment());
}

} // namespace toolgate
