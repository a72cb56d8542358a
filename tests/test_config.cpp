#include "test_common.h"
#include "toolgate/config.h"
#include <cstdlib>

int main() {
    // Test 1: Default profile is DEV
    unsetenv("TOOLGATE_PROFILE");
    auto p = toolgate::detect_profile();
    expect_true(p == toolgate::Profile::DEV, "default should be DEV");

    // Test 2: PROD detection, case insensitive
    setenv("TOOLGATE_PROFILE", "PROD", 1);
    p = toolgate::detect_profile();
    expect_true(p == toolgate::Profile::PROD, "should detect PROD case-insensitive");

    // Test 3: Apply defaults (won't override existing)
    setenv("TOOLGATE_KILL_GRACE_MS", "42", 1);
    toolgate::apply_profile_defaults(toolgate::Profile::PROD);
    std::string val = std::getenv("TOOLGATE_KILL_GRACE_MS") ? std::getenv("TOOLGATE_KILL_GRACE_MS") : "";
    expect_eq_str(val, "42", "should NOT override pre-existing env var");

    // Test 4: Apply sets missing vars
    unsetenv("TOOLGATE_NO_NEW_PRIVS");
    unsetenv("TOOLGATE_RLIMIT_NOFILE");
    toolgate::apply_profile_defaults(toolgate::Profile::PROD);
    val = std::getenv("TOOLGATE_NO_NEW_PRIVS") ? std::getenv("TOOLGATE_NO_NEW_PRIVS") : "";
    expect_eq_str(val, "1", "PROD should set NO_NEW_PRIVS=1");

    // Test 5: Options pick up the profile values
    auto o = toolgate::load_runtime_options();
    expect_true(o.no_new_privs, "no_new_privs from env");
    expect_eq_ll(o.rlimit_nofile, 256, "PROD fd limit");
    expect_eq_ll(o.kill_grace_ms, 42, "kill grace from env");
    expect_eq_ll(o.handshake_timeout_ms, toolgate::DEFAULT_HANDSHAKE_TIMEOUT_MS, "default handshake timeout");
    expect_eq_ll(o.max_concurrent, 8, "default max concurrent");

    // Test 6: Clamping and garbage
    setenv("TOOLGATE_HANDSHAKE_TIMEOUT_MS", "5", 1);
    setenv("TOOLGATE_MAX_CONCURRENT", "100000", 1);
    o = toolgate::load_runtime_options();
    expect_eq_ll(o.handshake_timeout_ms, 100, "timeout clamped up");
    expect_eq_ll(o.max_concurrent, 256, "max concurrent clamped down");
    setenv("TOOLGATE_HANDSHAKE_TIMEOUT_MS", "soon", 1);
    o = toolgate::load_runtime_options();
    expect_eq_ll(o.handshake_timeout_ms, toolgate::DEFAULT_HANDSHAKE_TIMEOUT_MS, "unparseable timeout falls back");

    // Test 7: Profile name
    expect_eq_str(toolgate::profile_name(toolgate::Profile::DEV), "dev", "dev name");
    expect_eq_str(toolgate::profile_name(toolgate::Profile::PROD), "prod", "prod name");

    // Cleanup
    unsetenv("TOOLGATE_PROFILE");
    unsetenv("TOOLGATE_KILL_GRACE_MS");
    unsetenv("TOOLGATE_NO_NEW_PRIVS");
    unsetenv("TOOLGATE_RLIMIT_NOFILE");
    unsetenv("TOOLGATE_HANDSHAKE_TIMEOUT_MS");
    unsetenv("TOOLGATE_MAX_CONCURRENT");

    std::cerr << "test_config: ALL PASSED" << std::endl;
    return 0;
}
