#include "host.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "log.hpp"
#include <stdexcept>

namespace toolhost {

namespace {

void require_server_id(const std::string& id) {
    if (id.empty()) {
        throw std::invalid_argument("Server id must not be empty");
    }
}

void check_call(const ToolCall& call) {
    require_server_id(call.server);
    if (call.tool.empty()) {
        throw std::invalid_argument("Tool name must not be empty");
    }
    if (!call.parameters.is_object()) {
        throw std::invalid_argument("Tool parameters must be a JSON object");
    }
}

} // namespace

Host::Host(HostConfig config, EventBus* bus)
    : config_(std::move(config)), bus_(bus) {}

Host::~Host() {
    shutdown();
}

std::shared_ptr<ServerSupervisor> Host::lookup(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(id);
    if (it == servers_.end()) return nullptr;
    return it->second;
}

size_t Host::running_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [id, supervisor] : servers_) {
        if (supervisor->status() == ServerStatus::Running) ++count;
    }
    return count;
}

Status Host::add_server(const ServerConfig& config) {
    require_server_id(config.id);
    if (config.command.empty()) {
        throw std::invalid_argument("Server " + config.id + " has no command");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (servers_.count(config.id)) {
            return Status::fail(ErrorKind::AlreadyExists,
                                "Server " + config.id + " already exists");
        }
        servers_.emplace(config.id, std::make_shared<ServerSupervisor>(
            config, SupervisorTimeouts::from(config_), bus_));
    }
    log_info("host", "Added server " + config.id);

    if (bus_) {
        ServerAddedEvent ev;
        ev.server_id = config.id;
        bus_->publish(ev);
    }

    if (config.auto_start) {
        return start_server(config.id);
    }
    return Status::ok();
}

size_t Host::add_configured_servers() {
    size_t added = 0;
    for (const auto& sc : config_.servers) {
        Status s = add_server(sc);
        if (s.success) {
            ++added;
        } else if (s.error.kind == ErrorKind::AlreadyExists) {
            log_warn("host", s.error.message);
        } else {
            // Registered, but auto start failed
            ++added;
        }
    }
    return added;
}

Status Host::start_server(const std::string& id) {
    require_server_id(id);
    auto supervisor = lookup(id);
    if (!supervisor) {
        return Status::fail(ErrorKind::NotFound, "Unknown server " + id);
    }

    if (supervisor->status() == ServerStatus::Running) {
        return Status::ok();
    }

    // Reserve a slot so concurrent starts cannot overshoot max_servers
    {
        std::lock_guard<std::mutex> lock(start_mutex_);
        if (running_count() + starts_in_flight_ >= config_.max_servers) {
            return Status::fail(ErrorKind::LimitReached,
                                "Cannot start " + id + ": " +
                                std::to_string(config_.max_servers) +
                                " servers already running");
        }
        ++starts_in_flight_;
    }
    Status started = supervisor->start();
    {
        std::lock_guard<std::mutex> lock(start_mutex_);
        --starts_in_flight_;
    }
    return started;
}

Status Host::stop_server(const std::string& id) {
    require_server_id(id);
    auto supervisor = lookup(id);
    if (!supervisor) {
        return Status::fail(ErrorKind::NotFound, "Unknown server " + id);
    }
    return supervisor->stop();
}

Status Host::remove_server(const std::string& id) {
    require_server_id(id);
    auto supervisor = lookup(id);
    if (!supervisor) {
        return Status::fail(ErrorKind::NotFound, "Unknown server " + id);
    }

    // Process is gone before the entry disappears
    Status stopped = supervisor->remove();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = servers_.find(id);
        if (it != servers_.end() && it->second == supervisor) {
            servers_.erase(it);
        }
    }
    log_info("host", "Removed server " + id);

    if (bus_) {
        ServerRemovedEvent ev;
        ev.server_id = id;
        bus_->publish(ev);
    }
    return stopped;
}

Status Host::refresh_tools(const std::string& id) {
    require_server_id(id);
    auto supervisor = lookup(id);
    if (!supervisor) {
        return Status::fail(ErrorKind::NotFound, "Unknown server " + id);
    }
    return supervisor->refresh_tools();
}

std::vector<ServerSnapshot> Host::list_servers() const {
    std::vector<ServerSnapshot> out;
    std::lock_guard<std::mutex> lock(mutex_);
    out.reserve(servers_.size());
    for (const auto& [id, supervisor] : servers_) {
        out.push_back(supervisor->snapshot());
    }
    return out;
}

Result<ServerSnapshot> Host::server(const std::string& id) const {
    require_server_id(id);
    auto supervisor = lookup(id);
    if (!supervisor) {
        return Result<ServerSnapshot>::fail(ErrorKind::NotFound, "Unknown server " + id);
    }
    return Result<ServerSnapshot>::ok(supervisor->snapshot());
}

std::vector<ToolDescriptor> Host::list_tools(const std::optional<std::string>& server_id) const {
    if (server_id) {
        auto supervisor = lookup(*server_id);
        if (!supervisor) return {};
        return supervisor->tools();
    }

    std::vector<ToolDescriptor> out;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, supervisor] : servers_) {
        auto tools = supervisor->tools();
        out.insert(out.end(), tools.begin(), tools.end());
    }
    return out;
}

std::optional<ToolDescriptor> Host::find_tool(const std::string& name,
                                              const std::optional<std::string>& server_id) const {
    if (server_id) {
        auto supervisor = lookup(*server_id);
        if (!supervisor) return std::nullopt;
        return supervisor->find_tool(name);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, supervisor] : servers_) {
        if (auto found = supervisor->find_tool(name)) return found;
    }
    return std::nullopt;
}

Result<nlohmann::json> Host::execute_tool(const ToolCall& call) {
    check_call(call);

    auto supervisor = lookup(call.server);
    if (!supervisor) {
        return Result<nlohmann::json>::fail(ErrorKind::NotFound, "Unknown server " + call.server);
    }
    return supervisor->execute(call.tool, call.parameters);
}

std::future<Result<nlohmann::json>> Host::execute_tool_async(ToolCall call) {
    check_call(call);
    return std::async(std::launch::async, [this, c = std::move(call)]() {
        return execute_tool(c);
    });
}

void Host::shutdown() {
    std::vector<std::shared_ptr<ServerSupervisor>> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, supervisor] : servers_) all.push_back(supervisor);
    }
    for (auto& supervisor : all) {
        supervisor->stop();
    }
}

} // namespace toolhost
