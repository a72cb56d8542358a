#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace toolgate {

enum class Profile { DEV, PROD };

// Detect profile from TOOLGATE_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: generous kill grace, no no_new_privs, roomy fd limit
// PROD: short kill grace, no_new_privs on, tight fd limit
void apply_profile_defaults(Profile p);

constexpr int DEFAULT_HANDSHAKE_TIMEOUT_MS = 30000;

// Knobs read from the environment (TOOLGATE_*), clamped to sane ranges.
struct RuntimeOptions {
    int handshake_timeout_ms{DEFAULT_HANDSHAKE_TIMEOUT_MS};
    int max_concurrent{8};
    int kill_grace_ms{2000};

    // Child process limits; 0 leaves the inherited limit untouched.
    bool no_new_privs{false};
    int rlimit_nofile{1024};
    size_t rlimit_fsize_mb{0};
    size_t rlimit_as_mb{0};

    // Install the SIGINT/SIGTERM drain hook when a client is created.
    bool install_shutdown_hook{true};
};

RuntimeOptions load_runtime_options();

} // namespace toolgate
