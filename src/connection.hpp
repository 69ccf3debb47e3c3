#pragma once
#include "error.hpp"
#include "framer.hpp"
#include "protocol.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>

namespace toolhost {

using NotificationHandler = std::function<void(const NotificationMessage&)>;
using CloseHandler = std::function<void(const std::string& reason)>;

struct PendingRequest {
    int64_t id = 0;
    std::string method;
    std::chrono::steady_clock::time_point sent_at;
    std::promise<Result<nlohmann::json>> promise;
};

// Owns one child's stdio pipes. Outgoing messages are written as single
// JSON lines; a reader thread decodes the child's stdout and settles
// pending requests by id.
//
// Handlers run on the reader thread. They must not call close() on the
// connection that invoked them or block waiting for one of its responses.
class Connection {
public:
    // Takes ownership of the descriptors. stderr_fd may be -1.
    Connection(std::string tag, int stdin_fd, int stdout_fd, int stderr_fd = -1);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Set before start().
    void set_notification_handler(NotificationHandler handler);
    void set_close_handler(CloseHandler handler);

    void start();

    // Write one message, no response expected.
    Status send(const nlohmann::json& message);

    // Send a request with the next id and wait for the matching response.
    // A response that arrives after `timeout` is discarded.
    Result<nlohmann::json> request(const std::string& method,
                                   const nlohmann::json& params,
                                   std::chrono::milliseconds timeout);

    // Idempotent. Stops the reader, closes the pipes and rejects every
    // pending request with ConnectionLost.
    void close();

    bool is_open() const { return open_.load(); }
    size_t pending_count() const;
    const std::string& tag() const { return tag_; }

private:
    void reader_loop();
    void dispatch(const nlohmann::json& value);
    void handle_response(const ResponseMessage& response);
    void handle_request(const RequestMessage& request);
    void handle_stderr(const char* data, size_t size, bool flush);
    void fail_all_pending(const std::string& reason);
    bool write_all(const std::string& data);

    std::string tag_;
    int stdin_fd_;
    int stdout_fd_;
    int stderr_fd_;
    int wake_pipe_[2] = {-1, -1};

    MessageFramer framer_;
    std::string stderr_buffer_;
    std::thread reader_;
    std::atomic<bool> open_{true};
    std::atomic<bool> closing_{false};

    mutable std::mutex pending_mutex_;
    std::map<int64_t, PendingRequest> pending_;
    int64_t next_id_ = 1;

    std::mutex write_mutex_;
    NotificationHandler on_notification_;
    CloseHandler on_close_;
};

} // namespace toolhost
