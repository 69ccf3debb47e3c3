#include <catch2/catch_test_macros.hpp>
#include "tool.hpp"
#include "error.hpp"
#include "log.hpp"

using namespace toolhost;
using nlohmann::json;

// ── parse_tool_descriptor ────────────────────────────────────────

TEST_CASE("parse_tool_descriptor: full entry", "[tool]") {
    ToolDescriptor t;
    REQUIRE(parse_tool_descriptor({
        {"name", "search"},
        {"description", "Web search"},
        {"inputSchema", {{"type", "object"}, {"required", json::array({"query"})}}}
    }, "ddg", t));
    REQUIRE(t.name == "search");
    REQUIRE(t.description == "Web search");
    REQUIRE(t.input_schema["required"][0] == "query");
    REQUIRE(t.server == "ddg");
}

TEST_CASE("parse_tool_descriptor: rejects missing or empty names", "[tool]") {
    ToolDescriptor t;
    REQUIRE_FALSE(parse_tool_descriptor({{"description", "x"}}, "s", t));
    REQUIRE_FALSE(parse_tool_descriptor({{"name", 12}}, "s", t));
    REQUIRE_FALSE(parse_tool_descriptor({{"name", ""}}, "s", t));
    REQUIRE_FALSE(parse_tool_descriptor("search", "s", t));
}

TEST_CASE("to_json: includes the owning server", "[tool]") {
    ToolDescriptor t{"ping", "Replies pong", {{"type", "object"}}, "echo"};
    auto j = to_json(t);
    REQUIRE(j["name"] == "ping");
    REQUIRE(j["inputSchema"]["type"] == "object");
    REQUIRE(j["server"] == "echo");
}

// ── Results ──────────────────────────────────────────────────────

TEST_CASE("tool_result_text: joins text blocks", "[tool]") {
    json result = {{"content", json::array({
        {{"type", "text"}, {"text", "line one"}},
        {{"type", "image"}, {"data", "..."}},
        {{"type", "text"}, {"text", "line two"}}
    })}};
    REQUIRE(tool_result_text(result) == "line one\nline two");
}

TEST_CASE("tool_result_text: falls back to JSON dump", "[tool]") {
    json result = {{"value", 42}};
    REQUIRE(tool_result_text(result) == "{\"value\":42}");
}

TEST_CASE("tool_result_is_error: reads isError", "[tool]") {
    REQUIRE(tool_result_is_error({{"isError", true}}));
    REQUIRE_FALSE(tool_result_is_error({{"isError", false}}));
    REQUIRE_FALSE(tool_result_is_error({{"isError", "yes"}}));
    REQUIRE_FALSE(tool_result_is_error(json::object()));
}

// ── Errors ───────────────────────────────────────────────────────

TEST_CASE("HostError: describe includes kind and message", "[error]") {
    auto e = make_error(ErrorKind::ToolNotFound, "Tool x not found on server y");
    REQUIRE(e.describe() == "tool_not_found: Tool x not found on server y");
}

TEST_CASE("HostError: remote errors show the code", "[error]") {
    HostError e;
    e.kind = ErrorKind::RemoteError;
    e.code = -32602;
    e.message = "bad params";
    REQUIRE(e.describe() == "remote_error (-32602): bad params");
}

TEST_CASE("Result: ok and fail carry their parts", "[error]") {
    auto ok = Result<int>::ok(7);
    REQUIRE(ok.success);
    REQUIRE(ok.value == 7);
    REQUIRE(ok.status().success);

    auto failed = Result<int>::fail(ErrorKind::Timeout, "slow");
    REQUIRE_FALSE(failed.success);
    REQUIRE(failed.status().error.kind == ErrorKind::Timeout);
    REQUIRE(failed.status().error.message == "slow");
}

TEST_CASE("error_kind_name: stable names", "[error]") {
    REQUIRE(std::string(error_kind_name(ErrorKind::SpawnFailure)) == "spawn_failure");
    REQUIRE(std::string(error_kind_name(ErrorKind::NotRunning)) == "not_running");
    REQUIRE(std::string(error_kind_name(ErrorKind::LimitReached)) == "limit_reached");
}

// ── Logging ──────────────────────────────────────────────────────

TEST_CASE("parse_log_level: accepts known names in any case", "[log]") {
    LogLevel level = LogLevel::Info;
    REQUIRE(parse_log_level("DEBUG", level));
    REQUIRE(level == LogLevel::Debug);
    REQUIRE(parse_log_level("warning", level));
    REQUIRE(level == LogLevel::Warn);
    REQUIRE_FALSE(parse_log_level("verbose", level));
    REQUIRE(level == LogLevel::Warn);
}

TEST_CASE("set_log_level: round-trips", "[log]") {
    LogLevel before = log_level();
    set_log_level(LogLevel::Error);
    REQUIRE(log_level() == LogLevel::Error);
    set_log_level(before);
}
