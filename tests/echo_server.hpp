#pragma once
#include "config.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "server.hpp"
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>
#include <unistd.h>

#ifndef TOOLHOST_ECHO_SERVER_PATH
#define TOOLHOST_ECHO_SERVER_PATH "echo-tool-server"
#endif

// Launch config for the scriptable test provider.
inline toolhost::ServerConfig echo_server(const std::string& id,
                                          std::vector<std::string> args = {}) {
    toolhost::ServerConfig sc;
    sc.id = id;
    sc.name = id;
    sc.command = TOOLHOST_ECHO_SERVER_PATH;
    sc.args = std::move(args);
    return sc;
}

inline toolhost::SupervisorTimeouts fast_timeouts() {
    toolhost::SupervisorTimeouts t;
    t.handshake = std::chrono::milliseconds(3000);
    t.tool_call = std::chrono::milliseconds(3000);
    t.startup = std::chrono::milliseconds(5000);
    t.stop_grace = std::chrono::milliseconds(1000);
    return t;
}

inline toolhost::HostConfig fast_host_config() {
    toolhost::HostConfig cfg;
    cfg.handshake_timeout_ms = 3000;
    cfg.tool_timeout_ms = 3000;
    cfg.startup_timeout_ms = 5000;
    cfg.stop_grace_ms = 1000;
    return cfg;
}

// Collects "<tag>:<server>" for every event, from any thread.
class EventRecorder {
public:
    explicit EventRecorder(toolhost::EventBus& bus) : bus_(bus) {
        id_ = bus.subscribe_all([this](const toolhost::Event& e) {
            const auto& se = static_cast<const toolhost::ServerEvent&>(e);
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(std::string(e.type_tag) + ":" + se.server_id);
        });
    }

    ~EventRecorder() { bus_.unsubscribe(id_); }

    EventRecorder(const EventRecorder&) = delete;
    EventRecorder& operator=(const EventRecorder&) = delete;

    std::vector<std::string> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    size_t count(const std::string& entry) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& e : events_) {
            if (e == entry) n++;
        }
        return n;
    }

private:
    toolhost::EventBus& bus_;
    uint64_t id_ = 0;
    mutable std::mutex mutex_;
    std::vector<std::string> events_;
};

// A file the provider can append to; removed on destruction.
struct TempLog {
    std::string path;

    TempLog() {
        auto tmpl = (std::filesystem::temp_directory_path() / "toolhost_log_XXXXXX").string();
        int fd = mkstemp(tmpl.data());
        if (fd >= 0) ::close(fd);
        path = tmpl;
    }
    ~TempLog() { std::remove(path.c_str()); }

    std::vector<std::string> lines() const {
        std::vector<std::string> out;
        std::ifstream f(path);
        std::string line;
        while (std::getline(f, line)) out.push_back(line);
        return out;
    }
};
