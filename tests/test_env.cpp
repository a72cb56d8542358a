#include "test_common.h"
#include "toolgate/env.h"

#include <algorithm>

using namespace toolgate;

int main() {
    auto lookup = map_env_lookup({{"HOME", "/home/u"}, {"EMPTY", ""}});

    // Test 1: Placeholder expansion
    expect_eq_str(expand_placeholders("${HOME}/bin", lookup), "/home/u/bin", "known name");
    expect_eq_str(expand_placeholders("${NOPE}/bin", lookup), "/bin", "unknown name is empty");
    expect_eq_str(expand_placeholders("${EMPTY}x", lookup), "x", "empty value");
    expect_eq_str(expand_placeholders("a${HOME}b${HOME}", lookup), "a/home/ub/home/u", "repeated");
    expect_eq_str(expand_placeholders("${HOME", lookup), "${HOME", "unterminated stays literal");
    expect_eq_str(expand_placeholders("${}", lookup), "${}", "empty name stays literal");
    expect_eq_str(expand_placeholders("$$", lookup), "$$", "plain dollars");

    // Test 2: Child environment is the safe subset plus the overlay
    {
        auto parent = map_env_lookup({
            {"PATH", "/usr/bin"},
            {"HOME", "/home/u"},
            {"SECRET_KEY", "hunter2"},
            {"SHELL", "() { :; }; echo pwned"},
        });
        EnvMap env = build_child_environment({{"API", "1"}, {"PATH", "/opt/bin"}}, parent);
        expect_true(env.count("SECRET_KEY") == 0, "non-allowlisted variable withheld");
        expect_true(env.count("SHELL") == 0, "function export withheld");
        expect_eq_str(env.at("HOME"), "/home/u", "HOME inherited");
        expect_eq_str(env.at("PATH"), "/opt/bin", "overlay wins");
        expect_eq_str(env.at("API"), "1", "overlay added");

        auto envp = to_envp(env);
        expect_true(std::find(envp.begin(), envp.end(), "API=1") != envp.end(), "envp entry");
    }

    // Test 3: Integer and flag helpers
    setenv("TOOLGATE_TEST_INT", "123", 1);
    expect_eq_ll(getenv_i64("TOOLGATE_TEST_INT", 7), 123, "parsed int");
    setenv("TOOLGATE_TEST_INT", "abc", 1);
    expect_eq_ll(getenv_i64("TOOLGATE_TEST_INT", 7), 7, "garbage int uses default");
    unsetenv("TOOLGATE_TEST_INT");
    expect_eq_ll(getenv_i64("TOOLGATE_TEST_INT", 7), 7, "unset int uses default");

    setenv("TOOLGATE_TEST_FLAG", "Yes", 1);
    expect_true(getenv_flag("TOOLGATE_TEST_FLAG", false), "yes is true");
    setenv("TOOLGATE_TEST_FLAG", "off", 1);
    expect_true(!getenv_flag("TOOLGATE_TEST_FLAG", true), "off is false");
    unsetenv("TOOLGATE_TEST_FLAG");

    std::cerr << "test_env: ALL PASSED" << std::endl;
    return 0;
}
