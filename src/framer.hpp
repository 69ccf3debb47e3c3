#pragma once
#include <string>
#include <functional>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolhost {

// Receives each decoded JSON value, in arrival order.
using FramerListener = std::function<void(const nlohmann::json& value)>;

// Splits a chunked byte stream into newline-delimited JSON values.
// Lines that fail to parse are dropped with a debug diagnostic; many
// providers print plain log lines on the protocol stream.
class MessageFramer {
public:
    explicit MessageFramer(std::string tag = "framer");

    void add_listener(FramerListener listener);

    // Append a chunk and emit every complete line it finishes.
    // An unterminated tail stays buffered for the next call.
    void feed(const std::string& chunk);
    void feed(const char* data, size_t size);

    // Bytes of the incomplete trailing fragment.
    size_t buffered() const { return buffer_.size(); }

    // Number of lines discarded because they were not JSON.
    size_t discarded() const { return discarded_; }

    void reset();

private:
    void handle_line(std::string line);

    std::string tag_;
    std::string buffer_;
    std::vector<FramerListener> listeners_;
    size_t discarded_ = 0;
};

} // namespace toolhost
