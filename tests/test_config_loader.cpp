#include "test_common.h"
#include "toolgate/config_loader.h"
#include "toolgate/errors.h"

#include <filesystem>
#include <fstream>

#include <unistd.h>

using namespace toolgate;

int main() {
    // Test 1: All entry shapes, file order kept
    {
        auto cfg = parse_config(R"({
          "mcpServers": {
            "zeta": {"command": "node", "args": ["server.js"], "env": {"TOKEN": "${API_TOKEN}"}},
            "alpha": {"type": "sse", "url": "https://example.com/sse", "headers": {"X-Key": "v"}},
            "context7": {"url": "https://mcp.example.com/mcp"},
            "plain": {"type": "stdio", "command": "/usr/bin/tool"}
          }
        })");
        auto names = cfg.server_names();
        expect_eq_ll((long long)names.size(), 4, "four servers");
        expect_eq_str(names[0], "zeta", "file order 0");
        expect_eq_str(names[1], "alpha", "file order 1");
        expect_eq_str(names[3], "plain", "file order 3");

        const auto& z = cfg.get("zeta");
        expect_true(z.transport == TransportKind::STDIO, "zeta is stdio");
        expect_eq_str(z.command, "node", "command");
        expect_eq_ll((long long)z.args.size(), 1, "args");
        expect_true(z.env && z.env->at("TOKEN") == "${API_TOKEN}", "env kept unexpanded");

        const auto& a = cfg.get("alpha");
        expect_true(a.transport == TransportKind::SSE, "alpha is sse");
        expect_eq_str(a.headers.at("X-Key"), "v", "headers");

        expect_true(cfg.get("context7").transport == TransportKind::HTTP, "url-only is http");
        expect_true(cfg.get("plain").args.empty(), "args default to empty");

        auto e = expect_throws<ConfigError>([&] { cfg.get("missing"); }, "unknown server");
        expect_true(contains(e.what(), "not found in config"), "missing message");
    }

    // Test 2: Structural errors
    {
        auto e = expect_throws<ConfigError>([] { parse_config("{not json"); }, "bad JSON");
        expect_true(contains(e.what(), "Invalid JSON"), "bad JSON message");

        e = expect_throws<ConfigError>([] { parse_config(R"({"mcpServers": {}} trailing)"); }, "trailing garbage");
        expect_true(contains(e.what(), "Invalid JSON"), "trailing garbage is invalid JSON");
        e = expect_throws<ConfigError>([] { parse_config(R"({"mcpServers": {}}{"mcpServers": {}})"); },
                                       "two documents");
        expect_true(contains(e.what(), "Invalid JSON"), "second document is invalid JSON");
        expect_true(parse_config("{\"mcpServers\": {}}\n  \n").empty(), "trailing whitespace accepted");

        expect_throws<ConfigError>([] { parse_config("{}"); }, "missing mcpServers");
        expect_throws<ConfigError>([] { parse_config(R"({"mcpServers": []})"); }, "mcpServers not an object");

        e = expect_throws<ConfigError>([] { parse_config(R"({"mcpServers": {"x": {"args": []}}})"); },
                                       "neither command nor url");
        expect_true(contains(e.what(), "mcpServers.x"), "names the server path");
        expect_eq_str(e.server(), "x", "server field");

        e = expect_throws<ConfigError>([] { parse_config(R"({"mcpServers": {"bad name": {"command": "node"}}})"); },
                                       "bad server name");
        expect_true(contains(e.what(), "letters, numbers"), "name rule message");

        expect_throws<ConfigError>([] { parse_config(R"({"mcpServers": {"x": {"command": 5}}})"); },
                                   "non-string command");
        expect_throws<ConfigError>([] { parse_config(R"({"mcpServers": {"x": {"command": "n", "args": [1]}}})"); },
                                   "non-string arg");
        expect_throws<ConfigError>([] { parse_config(R"({"mcpServers": {"x": {"command": "n", "env": {"A": 1}}}})"); },
                                   "non-string env value");
        expect_throws<ConfigError>([] { parse_config(R"({"mcpServers": {"x": {"command": "../evil"}}})"); },
                                   "parent segment rejected at load time");
        expect_throws<ConfigError>([] { parse_config(R"({"mcpServers": {"x": {"url": "not a url"}}})"); },
                                   "invalid url");
        expect_throws<ConfigError>([] { parse_config(R"({"mcpServers": {"x": {"type": "ws", "url": "ws://h"}}})"); },
                                   "unknown type");

        const std::string long_url = "https://h/" + std::string(2048, 'a');
        e = expect_throws<ConfigError>(
            [&] { parse_config(R"({"mcpServers": {"x": {"url": ")" + long_url + R"("}}})"); }, "url too long");
        expect_true(contains(e.what(), "2048"), "url limit message");
    }

    // Test 3: Every problem is reported in one error
    {
        auto e = expect_throws<ConfigError>(
            [] { parse_config(R"({"mcpServers": {"a": {}, "b": {"command": ""}}})"); }, "two bad entries");
        expect_true(contains(e.what(), "mcpServers.a"), "first issue");
        expect_true(contains(e.what(), "mcpServers.b"), "second issue");
        expect_true(contains(e.what(), "; "), "joined");
    }

    // Test 4: Files
    {
        namespace fs = std::filesystem;
        const fs::path p = fs::temp_directory_path() / ("toolgate_cfg_" + std::to_string(getpid()) + ".json");
        std::ofstream(p) << R"({"mcpServers": {"one": {"command": "cat"}}})";
        auto cfg = load_config_file(p.string());
        expect_eq_ll((long long)cfg.size(), 1, "loaded from file");
        fs::remove(p);

        auto e = expect_throws<ConfigError>([&] { load_config_file(p.string()); }, "missing file");
        expect_true(contains(e.what(), "Config file not found"), "missing file message");
    }

    std::cerr << "test_config_loader: ALL PASSED" << std::endl;
    return 0;
}
