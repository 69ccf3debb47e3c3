#include "util.hpp"

#include <cctype>
#include <cstdlib>
#include <sstream>

namespace toolhost {

std::string trim(const std::string& s) {
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto end = s.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(start, end);
}

std::pair<std::string, std::string> split_first_word(const std::string& s) {
    std::string t = trim(s);
    size_t i = 0;
    while (i < t.size() && !std::isspace(static_cast<unsigned char>(t[i]))) ++i;
    return {t.substr(0, i), trim(t.substr(i))};
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> result;
    std::istringstream stream(s);
    std::string token;
    while (std::getline(stream, token, delim)) {
        result.push_back(token);
    }
    return result;
}

std::string expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

std::string name_from_id(const std::string& id) {
    std::string out;
    for (const auto& word : split(id, '-')) {
        if (word.empty()) continue;
        if (!out.empty()) out += ' ';
        out += static_cast<char>(std::toupper(static_cast<unsigned char>(word[0])));
        out += word.substr(1);
    }
    return out.empty() ? id : out;
}

} // namespace toolhost
