#include "toolgate/config.h"
#include "toolgate/env.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace toolgate {

Profile detect_profile() {
    const char* env = std::getenv("TOOLGATE_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: Must be called before any worker threads are created.
    // setenv() is not thread-safe with getenv() on some platforms.
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("TOOLGATE_HANDSHAKE_TIMEOUT_MS", "30000", NO_OVERWRITE);
            setenv("TOOLGATE_MAX_CONCURRENT",       "8",     NO_OVERWRITE);
            setenv("TOOLGATE_KILL_GRACE_MS",        "2000",  NO_OVERWRITE);
            setenv("TOOLGATE_NO_NEW_PRIVS",         "0",     NO_OVERWRITE);
            setenv("TOOLGATE_RLIMIT_NOFILE",        "1024",  NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("TOOLGATE_HANDSHAKE_TIMEOUT_MS", "30000", NO_OVERWRITE);
            setenv("TOOLGATE_MAX_CONCURRENT",       "8",     NO_OVERWRITE);
            setenv("TOOLGATE_KILL_GRACE_MS",        "1000",  NO_OVERWRITE);
            setenv("TOOLGATE_NO_NEW_PRIVS",         "1",     NO_OVERWRITE);
            setenv("TOOLGATE_RLIMIT_NOFILE",        "256",   NO_OVERWRITE);
            break;
    }
}

template <typename T>
static T clamp_env(const char* key, T defv, T lo, T hi) {
    int64_t v = getenv_i64(key, static_cast<int64_t>(defv));
    if (v < static_cast<int64_t>(lo)) v = static_cast<int64_t>(lo);
    if (v > static_cast<int64_t>(hi)) v = static_cast<int64_t>(hi);
    return static_cast<T>(v);
}

RuntimeOptions load_runtime_options() {
    RuntimeOptions o;
    o.handshake_timeout_ms = clamp_env<int>("TOOLGATE_HANDSHAKE_TIMEOUT_MS", o.handshake_timeout_ms, 100, 600000);
    o.max_concurrent = clamp_env<int>("TOOLGATE_MAX_CONCURRENT", o.max_concurrent, 1, 256);
    o.kill_grace_ms = clamp_env<int>("TOOLGATE_KILL_GRACE_MS", o.kill_grace_ms, 0, 60000);
    o.no_new_privs = getenv_flag("TOOLGATE_NO_NEW_PRIVS", o.no_new_privs);
    o.rlimit_nofile = clamp_env<int>("TOOLGATE_RLIMIT_NOFILE", o.rlimit_nofile, 0, 1 << 20);
    o.rlimit_fsize_mb = clamp_env<size_t>("TOOLGATE_RLIMIT_FSIZE_MB", o.rlimit_fsize_mb, 0, 1 << 20);
    o.rlimit_as_mb = clamp_env<size_t>("TOOLGATE_RLIMIT_AS_MB", o.rlimit_as_mb, 0, 1 << 24);
    o.install_shutdown_hook = getenv_flag("TOOLGATE_SHUTDOWN_HOOK", o.install_shutdown_hook);
    return o;
}

} // namespace toolgate
