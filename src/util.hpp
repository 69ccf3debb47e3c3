#pragma once
#include <string>
#include <utility>
#include <vector>

namespace toolhost {

// Trim whitespace
std::string trim(const std::string& s);

// Split off the first whitespace-delimited word: {"word", "rest"}.
// Both parts are trimmed.
std::pair<std::string, std::string> split_first_word(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// "duckduckgo-search" -> "Duckduckgo Search"
std::string name_from_id(const std::string& id);

} // namespace toolhost
