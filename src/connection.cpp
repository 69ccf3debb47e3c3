#include "connection.hpp"
#include "log.hpp"
#include "process.hpp"
#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <unistd.h>

namespace toolhost {

Connection::Connection(std::string tag, int stdin_fd, int stdout_fd, int stderr_fd)
    : tag_(std::move(tag)), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd),
      stderr_fd_(stderr_fd), framer_(tag_) {
    ignore_sigpipe();
    if (pipe2(wake_pipe_, O_CLOEXEC) != 0) {
        throw std::runtime_error(std::string("Failed to create wake pipe: ") +
                                 std::strerror(errno));
    }
    framer_.add_listener([this](const nlohmann::json& value) { dispatch(value); });
}

Connection::~Connection() {
    close();
    if (wake_pipe_[0] >= 0) ::close(wake_pipe_[0]);
    if (wake_pipe_[1] >= 0) ::close(wake_pipe_[1]);
}

void Connection::set_notification_handler(NotificationHandler handler) {
    on_notification_ = std::move(handler);
}

void Connection::set_close_handler(CloseHandler handler) {
    on_close_ = std::move(handler);
}

void Connection::start() {
    reader_ = std::thread([this]() { reader_loop(); });
}

size_t Connection::pending_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

bool Connection::write_all(const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(stdin_fd_, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

Status Connection::send(const nlohmann::json& message) {
    if (!open_.load()) {
        return Status::fail(ErrorKind::ConnectionLost, "Connection to " + tag_ + " is closed");
    }
    std::string line = message.dump() + "\n";
    std::string reason;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (write_all(line)) return Status::ok();
        reason = std::string("write failed: ") + std::strerror(errno);
    }
    // A broken stdin pipe leaves the connection unusable.
    log_debug(tag_, "Input stream broken: " + reason);
    fail_all_pending(reason);
    return Status::fail(ErrorKind::ConnectionLost, "Write to " + tag_ + " failed: " + reason);
}

Result<nlohmann::json> Connection::request(const std::string& method,
                                           const nlohmann::json& params,
                                           std::chrono::milliseconds timeout) {
    using R = Result<nlohmann::json>;
    int64_t id = 0;
    std::future<R> future;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (!open_.load()) {
            return R::fail(ErrorKind::ConnectionLost, "Connection to " + tag_ + " is closed");
        }
        id = next_id_++;
        PendingRequest& pending = pending_[id];
        pending.id = id;
        pending.method = method;
        pending.sent_at = std::chrono::steady_clock::now();
        future = pending.promise.get_future();
    }

    Status sent = send(make_request(id, method, params));
    if (!sent.success) {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (pending_.erase(id) > 0) {
            return R::fail(sent.error);
        }
        // Already settled by fail_all_pending()
    }

    if (future.wait_for(timeout) == std::future_status::ready) {
        return future.get();
    }

    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (pending_.erase(id) > 0) {
            log_debug(tag_, "Request " + std::to_string(id) + " (" + method + ") timed out");
            return R::fail(ErrorKind::Timeout,
                           method + " timed out after " +
                           std::to_string(timeout.count()) + "ms");
        }
    }
    // Settled between the wait and the lock
    return future.get();
}

void Connection::dispatch(const nlohmann::json& value) {
    std::string why;
    auto message = classify_message(value, &why);
    if (!message) {
        log_debug(tag_, "Discarding malformed message (" + why + ")");
        return;
    }

    if (auto* response = std::get_if<ResponseMessage>(&*message)) {
        handle_response(*response);
    } else if (auto* notification = std::get_if<NotificationMessage>(&*message)) {
        if (on_notification_) on_notification_(*notification);
    } else if (auto* request = std::get_if<RequestMessage>(&*message)) {
        handle_request(*request);
    }
}

void Connection::handle_response(const ResponseMessage& response) {
    auto id = response.numeric_id();
    PendingRequest pending;
    bool found = false;
    if (id) {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(*id);
        if (it != pending_.end()) {
            pending = std::move(it->second);
            pending_.erase(it);
            found = true;
        }
    }
    if (!found) {
        log_debug(tag_, "Discarding response for unknown or expired id " + response.id.dump());
        return;
    }

    if (response.error) {
        HostError err;
        err.kind = ErrorKind::RemoteError;
        err.code = response.error->code;
        err.message = response.error->message.empty() ? "Server error"
                                                      : response.error->message;
        err.data = response.error->data;
        pending.promise.set_value(Result<nlohmann::json>::fail(std::move(err)));
    } else {
        pending.promise.set_value(Result<nlohmann::json>::ok(*response.result));
    }
}

void Connection::handle_request(const RequestMessage& request) {
    nlohmann::json reply;
    if (request.method == protocol::method::Ping) {
        reply = make_result_response(request.id, nlohmann::json::object());
    } else {
        log_debug(tag_, "Rejecting unsupported request: " + request.method);
        reply = make_error_response(request.id, protocol::kMethodNotFound,
                                    "Method not found: " + request.method);
    }
    Status st = send(reply);
    if (!st.success) {
        log_debug(tag_, "Failed to answer " + request.method + ": " + st.error.message);
    }
}

void Connection::handle_stderr(const char* data, size_t size, bool flush) {
    stderr_buffer_.append(data, size);
    size_t pos = 0;
    size_t newline;
    while ((newline = stderr_buffer_.find('\n', pos)) != std::string::npos) {
        std::string line = stderr_buffer_.substr(pos, newline - pos);
        pos = newline + 1;
        if (!line.empty()) log_debug(tag_, "stderr: " + line);
    }
    stderr_buffer_.erase(0, pos);
    if (flush && !stderr_buffer_.empty()) {
        log_debug(tag_, "stderr: " + stderr_buffer_);
        stderr_buffer_.clear();
    }
}

void Connection::fail_all_pending(const std::string& reason) {
    std::map<int64_t, PendingRequest> failed;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        open_.store(false);
        failed.swap(pending_);
    }
    for (auto& [id, pending] : failed) {
        pending.promise.set_value(
            Result<nlohmann::json>::fail(ErrorKind::ConnectionLost,
                                         pending.method + " aborted: " + reason));
    }
}

void Connection::reader_loop() {
    std::array<char, 4096> buffer;
    bool stderr_open = stderr_fd_ >= 0;
    std::string reason = "stream closed";

    while (true) {
        pollfd fds[3];
        nfds_t nfds = 0;
        fds[nfds++] = pollfd{wake_pipe_[0], POLLIN, 0};
        fds[nfds++] = pollfd{stdout_fd_, POLLIN, 0};
        if (stderr_open) {
            fds[nfds++] = pollfd{stderr_fd_, POLLIN, 0};
        }

        int ret = poll(fds, nfds, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            reason = std::string("poll failed: ") + std::strerror(errno);
            break;
        }

        if (fds[0].revents != 0) {
            break; // close() requested
        }

        if (stderr_open && fds[2].revents != 0) {
            ssize_t n = ::read(stderr_fd_, buffer.data(), buffer.size());
            if (n > 0) {
                handle_stderr(buffer.data(), static_cast<size_t>(n), false);
            } else if (n == 0 || errno != EINTR) {
                stderr_open = false;
                handle_stderr(nullptr, 0, true);
            }
        }

        if (fds[1].revents != 0) {
            ssize_t n = ::read(stdout_fd_, buffer.data(), buffer.size());
            if (n > 0) {
                framer_.feed(buffer.data(), static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            if (n < 0) reason = std::string("read failed: ") + std::strerror(errno);
            break;
        }
    }

    if (closing_.load()) return;

    log_debug(tag_, "Output stream ended: " + reason);
    fail_all_pending(reason);
    if (on_close_) on_close_(reason);
}

void Connection::close() {
    bool expected = false;
    if (!closing_.compare_exchange_strong(expected, true)) {
        return;
    }

    if (wake_pipe_[1] >= 0) {
        char byte = 1;
        ssize_t ignored = ::write(wake_pipe_[1], &byte, 1);
        (void)ignored;
    }
    if (reader_.joinable()) {
        if (reader_.get_id() == std::this_thread::get_id()) {
            reader_.detach();
        } else {
            reader_.join();
        }
    }

    fail_all_pending("connection closed");

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (stdin_fd_ >= 0) {
            ::close(stdin_fd_);
            stdin_fd_ = -1;
        }
    }
    for (int* fd : {&stdout_fd_, &stderr_fd_}) {
        if (*fd >= 0) {
            ::close(*fd);
            *fd = -1;
        }
    }
}

} // namespace toolhost
