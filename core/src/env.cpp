#include "toolgate/env.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace toolgate {

EnvLookup process_env_lookup() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* v = std::getenv(name.c_str());
        if (!v) return std::nullopt;
        return std::string(v);
    };
}

EnvLookup map_env_lookup(EnvMap vars) {
    return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

std::string expand_placeholders(const std::string& value, const EnvLookup& lookup) {
    std::string out;
    out.reserve(value.size());
    size_t i = 0;
    while (i < value.size()) {
        if (value[i] == '$' && i + 1 < value.size() && value[i + 1] == '{') {
            size_t close = value.find('}', i + 2);
            if (close != std::string::npos && close > i + 2) {
                std::string name = value.substr(i + 2, close - (i + 2));
                if (auto v = lookup(name)) out += *v;
                i = close + 1;
                continue;
            }
        }
        out.push_back(value[i]);
        i++;
    }
    return out;
}

const std::vector<std::string>& inherited_env_names() {
#ifdef _WIN32
    static const std::vector<std::string> names = {
        "APPDATA", "HOMEDRIVE", "HOMEPATH", "LOCALAPPDATA", "PATH", "PROCESSOR_ARCHITECTURE",
        "SYSTEMDRIVE", "SYSTEMROOT", "TEMP", "USERNAME", "USERPROFILE", "PROGRAMFILES",
    };
#else
    static const std::vector<std::string> names = {
        "HOME", "LOGNAME", "PATH", "SHELL", "TERM", "USER",
    };
#endif
    return names;
}

EnvMap build_child_environment(const EnvMap& overlay, const EnvLookup& lookup) {
    EnvMap env;
    for (const auto& name : inherited_env_names()) {
        auto v = lookup(name);
        if (!v) continue;
        if (v->rfind("()", 0) == 0) continue;
        env[name] = *v;
    }
    for (const auto& kv : overlay) env[kv.first] = kv.second;
    return env;
}

std::vector<std::string> to_envp(const EnvMap& env) {
    std::vector<std::string> out;
    out.reserve(env.size());
    for (const auto& kv : env) out.push_back(kv.first + "=" + kv.second);
    return out;
}

int64_t getenv_i64(const char* key, int64_t defv) {
    if (const char* e = std::getenv(key)) {
        try {
            return std::stoll(e);
        } catch (const std::exception&) {
            return defv;
        }
    }
    return defv;
}

bool getenv_flag(const char* key, bool defv) {
    const char* v = std::getenv(key);
    if (!v) return defv;
    std::string s = v;
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return defv;
}

} // namespace toolgate
