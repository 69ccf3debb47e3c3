#pragma once
#include "config.hpp"
#include "connection.hpp"
#include "error.hpp"
#include "handshake.hpp"
#include "process.hpp"
#include "tool.hpp"
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolhost {

class EventBus;

enum class ServerStatus { Stopped, Starting, Running, Error };

const char* server_status_name(ServerStatus status);

// Read-only copy of a server's state; never aliases live data.
struct ServerSnapshot {
    std::string id;
    std::string name;
    std::string description;
    ServerStatus status = ServerStatus::Stopped;
    size_t tool_count = 0;
    std::optional<std::string> last_error;
    std::optional<int> pid;          // while a process is attached
    std::string protocol_version;    // negotiated during the handshake
    std::string server_name;         // as reported by the provider
};

struct SupervisorTimeouts {
    std::chrono::milliseconds handshake{10000};
    std::chrono::milliseconds tool_call{60000};
    std::chrono::milliseconds startup{30000};
    std::chrono::milliseconds stop_grace{5000};

    static SupervisorTimeouts from(const HostConfig& config);
};

// Owns one provider's lifecycle. Failures of this server are recorded as
// status Error + last_error and never escape to other servers.
//
// start/stop/remove are serialised against each other; execute and
// snapshot may run concurrently with them from any thread.
class ServerSupervisor {
public:
    ServerSupervisor(ServerConfig config, SupervisorTimeouts timeouts,
                     EventBus* bus = nullptr);
    ~ServerSupervisor();

    ServerSupervisor(const ServerSupervisor&) = delete;
    ServerSupervisor& operator=(const ServerSupervisor&) = delete;

    // Spawn, handshake, discover. No-op when already running.
    Status start();

    // SIGTERM, grace period, SIGKILL. No-op when already stopped.
    Status stop();

    // Stop, then refuse every further start.
    Status remove();

    // tools/call on a running server.
    Result<nlohmann::json> execute(const std::string& tool, const nlohmann::json& arguments);

    // Re-run tools/list without repeating initialize. On failure the
    // previous registry is kept.
    Status refresh_tools();

    ServerSnapshot snapshot() const;
    ServerStatus status() const;
    std::vector<ToolDescriptor> tools() const;
    std::optional<ToolDescriptor> find_tool(const std::string& name) const;
    const ServerConfig& config() const { return config_; }

private:
    // Everything a run holds on to, detached from the supervisor so it can
    // be torn down without holding state_mutex_.
    struct RunResources {
        std::unique_ptr<ChildProcess> process;
        std::shared_ptr<Connection> connection;
        std::future<void> refresh;
    };

    RunResources take_resources_locked();
    static TerminationPath release(RunResources& resources, std::chrono::milliseconds grace);

    Status stop_locked();
    Status abort_start(HostError error);
    void on_stream_closed(uint64_t generation, const std::string& reason);
    void on_notification(uint64_t generation, const NotificationMessage& notification);
    void schedule_refresh(uint64_t generation);
    // `deferred` posts instead of publishing; used on the reader thread.
    void publish_error(const std::string& message, bool deferred = false);

    const ServerConfig config_;
    const SupervisorTimeouts timeouts_;
    EventBus* bus_;

    std::mutex lifecycle_mutex_;
    mutable std::mutex state_mutex_;
    ServerStatus status_ = ServerStatus::Stopped;
    std::vector<ToolDescriptor> tools_;
    std::optional<std::string> last_error_;
    ServerInfo info_;
    std::unique_ptr<ChildProcess> process_;
    std::shared_ptr<Connection> connection_;
    uint64_t generation_ = 0; // bumped per start/stop; stale callbacks compare against it
    bool removed_ = false;
    std::future<void> refresh_;
};

} // namespace toolhost
