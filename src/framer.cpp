#include "framer.hpp"
#include "log.hpp"

namespace toolhost {

MessageFramer::MessageFramer(std::string tag) : tag_(std::move(tag)) {}

void MessageFramer::add_listener(FramerListener listener) {
    listeners_.push_back(std::move(listener));
}

void MessageFramer::feed(const std::string& chunk) {
    feed(chunk.data(), chunk.size());
}

void MessageFramer::feed(const char* data, size_t size) {
    buffer_.append(data, size);

    size_t pos = 0;
    while (true) {
        size_t newline = buffer_.find('\n', pos);
        if (newline == std::string::npos) break;
        std::string line = buffer_.substr(pos, newline - pos);
        pos = newline + 1;
        handle_line(std::move(line));
    }
    buffer_.erase(0, pos);
}

void MessageFramer::handle_line(std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (line.find_first_not_of(" \t") == std::string::npos) {
        return;
    }

    nlohmann::json value;
    try {
        value = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error&) {
        ++discarded_;
        constexpr size_t kPreview = 120;
        log_debug(tag_, "Discarding non-JSON line: " +
                  (line.size() > kPreview ? line.substr(0, kPreview) + "..." : line));
        return;
    }

    for (const auto& listener : listeners_) {
        listener(value);
    }
}

void MessageFramer::reset() {
    buffer_.clear();
    discarded_ = 0;
}

} // namespace toolhost
