#include <catch2/catch_test_macros.hpp>
#include "util.hpp"
#include <cstdlib>

using namespace toolhost;

// ── trim ─────────────────────────────────────────────────────────

TEST_CASE("trim: strips surrounding whitespace", "[util]") {
    REQUIRE(trim("  hello \t\n") == "hello");
    REQUIRE(trim("a b") == "a b");
}

TEST_CASE("trim: whitespace-only and empty", "[util]") {
    REQUIRE(trim("   ").empty());
    REQUIRE(trim("").empty());
}

// ── split_first_word ─────────────────────────────────────────────

TEST_CASE("split_first_word: word and trimmed rest", "[util]") {
    auto [word, rest] = split_first_word("  /call  echo ping {\"a\": 1} ");
    REQUIRE(word == "/call");
    REQUIRE(rest == "echo ping {\"a\": 1}");
}

TEST_CASE("split_first_word: single word has empty rest", "[util]") {
    auto [word, rest] = split_first_word("/servers");
    REQUIRE(word == "/servers");
    REQUIRE(rest.empty());
}

// ── split ────────────────────────────────────────────────────────

TEST_CASE("split: basic delimiter", "[util]") {
    auto parts = split("a,b,c", ',');
    REQUIRE(parts.size() == 3);
    REQUIRE(parts[0] == "a");
    REQUIRE(parts[2] == "c");
}

TEST_CASE("split: keeps empty middle fields", "[util]") {
    auto parts = split("a,,b", ',');
    REQUIRE(parts.size() == 3);
    REQUIRE(parts[1].empty());
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: replaces leading tilde", "[util]") {
    const char* home = std::getenv("HOME");
    if (!home) return;
    REQUIRE(expand_home("~/.toolhost/config.json") == std::string(home) + "/.toolhost/config.json");
}

TEST_CASE("expand_home: other paths unchanged", "[util]") {
    REQUIRE(expand_home("/etc/toolhost.json") == "/etc/toolhost.json");
    REQUIRE(expand_home("relative/~path") == "relative/~path");
}

// ── name_from_id ─────────────────────────────────────────────────

TEST_CASE("name_from_id: title-cases dash-separated words", "[util]") {
    REQUIRE(name_from_id("duckduckgo-search") == "Duckduckgo Search");
    REQUIRE(name_from_id("echo") == "Echo");
}

TEST_CASE("name_from_id: degenerate ids", "[util]") {
    REQUIRE(name_from_id("a--b") == "A B");
    REQUIRE(name_from_id("---") == "---");
}
