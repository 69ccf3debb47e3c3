#pragma once
#include "config.hpp"
#include "error.hpp"
#include "server.hpp"
#include "tool.hpp"
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolhost {

class EventBus;

// Registry of all tool providers. Routes lookups and tool calls to the
// owning server's supervisor. Every method is safe to call from any thread.
//
// Expected failures come back as Status/Result; invalid arguments
// (empty id, empty tool name, non-object parameters) throw
// std::invalid_argument.
//
// Events raised by a server's own threads (unexpected exit, provider
// notifications, tool list refreshes) are posted to the bus and delivered
// on its dispatch thread, so handlers may call any Host method. Events
// from a Host call are published on the caller's thread; handlers for
// those must not start or stop the same server.
class Host {
public:
    // The event bus, when given, must outlive the host.
    explicit Host(HostConfig config = HostConfig{}, EventBus* bus = nullptr);
    ~Host();

    Host(const Host&) = delete;
    Host& operator=(const Host&) = delete;

    // Register a server. With auto_start set the result is the start
    // outcome; the server stays registered either way.
    Status add_server(const ServerConfig& config);

    // Add every server listed in the host configuration. Returns the
    // number registered.
    size_t add_configured_servers();

    Status start_server(const std::string& id);
    Status stop_server(const std::string& id);
    Status remove_server(const std::string& id);
    Status refresh_tools(const std::string& id);

    std::vector<ServerSnapshot> list_servers() const;
    Result<ServerSnapshot> server(const std::string& id) const;

    // Flattened across all servers, or one server. An unknown id yields
    // an empty list.
    std::vector<ToolDescriptor> list_tools(
        const std::optional<std::string>& server_id = std::nullopt) const;

    // First match in server id order. Names are only unique per server.
    std::optional<ToolDescriptor> find_tool(
        const std::string& name,
        const std::optional<std::string>& server_id = std::nullopt) const;

    Result<nlohmann::json> execute_tool(const ToolCall& call);
    std::future<Result<nlohmann::json>> execute_tool_async(ToolCall call);

    // Stop every server. Called by the destructor.
    void shutdown();

    const HostConfig& config() const { return config_; }

private:
    std::shared_ptr<ServerSupervisor> lookup(const std::string& id) const;
    size_t running_count() const;

    HostConfig config_;
    EventBus* bus_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<ServerSupervisor>> servers_;
    std::mutex start_mutex_;
    size_t starts_in_flight_ = 0; // guarded by start_mutex_
};

} // namespace toolhost
