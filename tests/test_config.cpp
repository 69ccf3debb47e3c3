#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace toolhost;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("HostConfig: default values", "[config]") {
    HostConfig cfg;
    REQUIRE(cfg.handshake_timeout_ms == 10000);
    REQUIRE(cfg.tool_timeout_ms == 60000);
    REQUIRE(cfg.startup_timeout_ms == 30000);
    REQUIRE(cfg.stop_grace_ms == 5000);
    REQUIRE(cfg.max_servers == 10);
    REQUIRE(cfg.log_level == "info");
    REQUIRE(cfg.servers.empty());
    REQUIRE(cfg.tool_timeout() == std::chrono::milliseconds(60000));
}

TEST_CASE("HostConfig: defaults_json matches the struct defaults", "[config]") {
    auto cfg = HostConfig::from_json(HostConfig::defaults_json());
    HostConfig plain;
    REQUIRE(cfg.handshake_timeout_ms == plain.handshake_timeout_ms);
    REQUIRE(cfg.tool_timeout_ms == plain.tool_timeout_ms);
    REQUIRE(cfg.max_servers == plain.max_servers);
    REQUIRE(cfg.servers.empty());
}

// ── parse_server_configs ─────────────────────────────────────────

TEST_CASE("parse_server_configs: reads every field", "[config]") {
    auto servers = parse_server_configs(nlohmann::json::parse(R"({
        "weather": {
            "command": "weather-server",
            "args": ["--units", "metric"],
            "env": {"API_KEY": "abc", "IGNORED": 5},
            "cwd": "/srv/weather",
            "autoStart": true,
            "name": "Weather",
            "description": "Forecasts"
        }
    })"));
    REQUIRE(servers.size() == 1);
    const auto& s = servers[0];
    REQUIRE(s.id == "weather");
    REQUIRE(s.command == "weather-server");
    REQUIRE(s.args == std::vector<std::string>{"--units", "metric"});
    REQUIRE(s.env.size() == 1);
    REQUIRE(s.env.at("API_KEY") == "abc");
    REQUIRE(s.cwd == "/srv/weather");
    REQUIRE(s.auto_start);
    REQUIRE(s.name == "Weather");
    REQUIRE(s.description == "Forecasts");
}

TEST_CASE("parse_server_configs: missing name is derived from the id", "[config]") {
    auto servers = parse_server_configs({{"duckduckgo-search", {{"command", "ddg"}}}});
    REQUIRE(servers.size() == 1);
    REQUIRE(servers[0].name == "Duckduckgo Search");
    REQUIRE_FALSE(servers[0].auto_start);
}

TEST_CASE("parse_server_configs: disabled and commandless entries are skipped", "[config]") {
    auto servers = parse_server_configs(nlohmann::json::parse(R"({
        "off": {"command": "x", "disabled": true},
        "broken": {"args": ["a"]},
        "empty": {"command": ""},
        "ok": {"command": "y"},
        "junk": 42
    })"));
    REQUIRE(servers.size() == 1);
    REQUIRE(servers[0].id == "ok");
}

TEST_CASE("parse_server_configs: non-object input yields nothing", "[config]") {
    REQUIRE(parse_server_configs(nlohmann::json::array()).empty());
    REQUIRE(parse_server_configs(nullptr).empty());
}

// ── HostConfig::from_json ────────────────────────────────────────

TEST_CASE("HostConfig::from_json: reads timeouts and servers", "[config]") {
    auto cfg = HostConfig::from_json({
        {"handshake_timeout_ms", 2500},
        {"tool_timeout_ms", 1000},
        {"startup_timeout_ms", 4000},
        {"stop_grace_ms", 100},
        {"max_servers", 2},
        {"log_level", "debug"},
        {"mcpServers", {{"a", {{"command", "a-server"}}}}}
    });
    REQUIRE(cfg.handshake_timeout_ms == 2500);
    REQUIRE(cfg.tool_timeout_ms == 1000);
    REQUIRE(cfg.startup_timeout_ms == 4000);
    REQUIRE(cfg.stop_grace_ms == 100);
    REQUIRE(cfg.max_servers == 2);
    REQUIRE(cfg.log_level == "debug");
    REQUIRE(cfg.servers.size() == 1);
}

TEST_CASE("HostConfig::from_json: wrong types keep defaults", "[config]") {
    auto cfg = HostConfig::from_json({
        {"handshake_timeout_ms", "fast"},
        {"max_servers", -1},
        {"log_level", 3}
    });
    REQUIRE(cfg.handshake_timeout_ms == 10000);
    REQUIRE(cfg.max_servers == 10);
    REQUIRE(cfg.log_level == "info");
}

// ── HostConfig::load ─────────────────────────────────────────────

// Helper: create a temp directory
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "toolhost_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("TOOLHOST_HANDSHAKE_TIMEOUT_MS");
        unsetenv("TOOLHOST_TOOL_TIMEOUT_MS");
        unsetenv("TOOLHOST_LOG_LEVEL");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        unsetenv("TOOLHOST_HANDSHAKE_TIMEOUT_MS");
        unsetenv("TOOLHOST_TOOL_TIMEOUT_MS");
        unsetenv("TOOLHOST_LOG_LEVEL");
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.toolhost/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.toolhost");
        std::ofstream f(config_path());
        f << content;
    }
};

TEST_CASE("HostConfig::load: reads config file from home", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({
        "tool_timeout_ms": 1234,
        "mcpServers": {
            "echo": {"command": "echo-tool-server", "autoStart": true}
        }
    })");

    auto cfg = HostConfig::load();
    REQUIRE(cfg.tool_timeout_ms == 1234);
    REQUIRE(cfg.servers.size() == 1);
    REQUIRE(cfg.servers[0].id == "echo");
    REQUIRE(cfg.servers[0].auto_start);
}

TEST_CASE("HostConfig::load: missing config file uses defaults", "[config]") {
    ConfigTestGuard g;
    auto cfg = HostConfig::load();
    REQUIRE(cfg.handshake_timeout_ms == 10000);
    REQUIRE(cfg.servers.empty());
}

TEST_CASE("HostConfig::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    g.write_config("{ not json");
    auto cfg = HostConfig::load();
    REQUIRE(cfg.tool_timeout_ms == 60000);
    REQUIRE(cfg.servers.empty());
}

TEST_CASE("HostConfig::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({"handshake_timeout_ms": 5000, "log_level": "warn"})");
    setenv("TOOLHOST_HANDSHAKE_TIMEOUT_MS", "750", 1);
    setenv("TOOLHOST_TOOL_TIMEOUT_MS", "9000", 1);
    setenv("TOOLHOST_LOG_LEVEL", "debug", 1);

    auto cfg = HostConfig::load();
    REQUIRE(cfg.handshake_timeout_ms == 750);
    REQUIRE(cfg.tool_timeout_ms == 9000);
    REQUIRE(cfg.log_level == "debug");
}

TEST_CASE("HostConfig::load: non-numeric env override is ignored", "[config]") {
    ConfigTestGuard g;
    setenv("TOOLHOST_TOOL_TIMEOUT_MS", "soon", 1);
    auto cfg = HostConfig::load();
    REQUIRE(cfg.tool_timeout_ms == 60000);
}

TEST_CASE("HostConfig::load_file: explicit path", "[config]") {
    ConfigTestGuard g;
    std::string path = g.dir + "/custom.json";
    {
        std::ofstream f(path);
        f << R"({"max_servers": 3})";
    }
    auto cfg = HostConfig::load_file(path);
    REQUIRE(cfg.max_servers == 3);
}
