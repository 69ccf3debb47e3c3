#include <catch2/catch_test_macros.hpp>
#include "commands.hpp"
#include "host.hpp"
#include "echo_server.hpp"

using namespace toolhost;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

// ── Read-only commands ───────────────────────────────────────────

TEST_CASE("cmd_servers: empty host", "[commands]") {
    Host host(fast_host_config());
    REQUIRE(cmd_servers(host) == "No servers configured.");
}

TEST_CASE("cmd_servers: shows status and last error", "[commands]") {
    Host host(fast_host_config());
    REQUIRE(host.add_server(echo_server("echo")).success);
    ServerConfig ghost;
    ghost.id = "ghost";
    ghost.command = "/nonexistent/tool-server";
    REQUIRE(host.add_server(ghost).success);
    REQUIRE_FALSE(host.start_server("ghost").success);

    auto out = cmd_servers(host);
    REQUIRE(contains(out, "echo [stopped] 0 tool(s)"));
    REQUIRE(contains(out, "ghost [error]"));
    REQUIRE(contains(out, "last error:"));
}

TEST_CASE("cmd_help: lists every command", "[commands]") {
    auto help = cmd_help();
    for (const char* c : {"/servers", "/tools", "/start", "/stop", "/refresh", "/call", "/quit"}) {
        REQUIRE(contains(help, c));
    }
}

// ── Commands against a running provider ──────────────────────────

TEST_CASE("run_command: start, tools, call, stop", "[commands]") {
    Host host(fast_host_config());
    REQUIRE(host.add_server(echo_server("echo", {"--tools", "ping,echo"})).success);

    REQUIRE(run_command(host, "/start echo") == "Started echo (2 tool(s))");
    REQUIRE(contains(run_command(host, "/servers"), "echo [running] 2 tool(s)"));

    auto tools = run_command(host, "/tools echo");
    REQUIRE(contains(tools, "echo/ping - Test tool ping"));
    REQUIRE(contains(tools, "echo/echo"));

    REQUIRE(run_command(host, "/call echo ping") == "pong");
    REQUIRE(run_command(host, "/call echo echo {\"text\": \"hi there\"}") == "hi there");
    REQUIRE(contains(run_command(host, "/refresh echo"), "echo/ping"));

    REQUIRE(run_command(host, "/stop echo") == "Stopped echo");
    REQUIRE(contains(run_command(host, "/call echo ping"), "not_running"));
}

TEST_CASE("cmd_call: argument errors are reported, not thrown", "[commands]") {
    Host host(fast_host_config());
    REQUIRE(cmd_call(host, "") == "Usage: /call SERVER TOOL [JSON]");
    REQUIRE(cmd_call(host, "echo") == "Usage: /call SERVER TOOL [JSON]");
    REQUIRE(contains(cmd_call(host, "echo ping {oops"), "Invalid JSON"));
    REQUIRE(cmd_call(host, "echo ping [1,2]") == "Tool arguments must be a JSON object");
    REQUIRE(contains(cmd_call(host, "nope ping"), "not_found"));
}

TEST_CASE("cmd_call: tool-level errors are labelled", "[commands]") {
    Host host(fast_host_config());
    REQUIRE(host.add_server(echo_server("echo", {"--tools", "fail"})).success);
    REQUIRE(host.start_server("echo").success);
    REQUIRE(cmd_call(host, "echo fail") == "Tool reported an error: tool failed on purpose");
}

TEST_CASE("run_command: usage hints and unknown commands", "[commands]") {
    Host host(fast_host_config());
    REQUIRE(run_command(host, "/start") == "Usage: /start ID");
    REQUIRE(run_command(host, "/stop") == "Usage: /stop ID");
    REQUIRE(run_command(host, "/refresh") == "Usage: /refresh ID");
    REQUIRE(contains(run_command(host, "/start nope"), "not_found"));
    REQUIRE(run_command(host, "/bogus") == "Unknown command: /bogus (try /help)");
    REQUIRE(run_command(host, "/tools") == "No tools available.");
}
