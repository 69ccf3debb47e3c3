#include "server.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include <stdexcept>
#include <thread>
#include <unistd.h>

namespace toolhost {

const char* server_status_name(ServerStatus status) {
    switch (status) {
        case ServerStatus::Stopped:  return "stopped";
        case ServerStatus::Starting: return "starting";
        case ServerStatus::Running:  return "running";
        case ServerStatus::Error:    return "error";
    }
    return "unknown";
}

SupervisorTimeouts SupervisorTimeouts::from(const HostConfig& config) {
    SupervisorTimeouts t;
    t.handshake = config.handshake_timeout();
    t.tool_call = config.tool_timeout();
    t.startup = config.startup_timeout();
    t.stop_grace = config.stop_grace();
    return t;
}

ServerSupervisor::ServerSupervisor(ServerConfig config, SupervisorTimeouts timeouts,
                                   EventBus* bus)
    : config_(std::move(config)), timeouts_(timeouts), bus_(bus) {}

ServerSupervisor::~ServerSupervisor() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    stop_locked();
}

ServerSupervisor::RunResources ServerSupervisor::take_resources_locked() {
    RunResources r;
    r.process = std::move(process_);
    r.connection = std::move(connection_);
    r.refresh = std::move(refresh_);
    ++generation_;
    return r;
}

TerminationPath ServerSupervisor::release(RunResources& resources,
                                          std::chrono::milliseconds grace) {
    // Closing first rejects pending calls and gives the child EOF on stdin.
    if (resources.connection) resources.connection->close();
    if (resources.refresh.valid()) resources.refresh.wait();
    if (resources.process) return resources.process->terminate(grace);
    return TerminationPath::AlreadyExited;
}

void ServerSupervisor::publish_error(const std::string& message, bool deferred) {
    if (!bus_) return;
    ServerErrorEvent ev;
    ev.server_id = config_.id;
    ev.message = message;
    if (deferred) {
        bus_->post(std::move(ev));
    } else {
        bus_->publish(ev);
    }
}

Status ServerSupervisor::abort_start(HostError error) {
    RunResources leftovers;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        leftovers = take_resources_locked();
    }
    release(leftovers, timeouts_.stop_grace);
    if (leftovers.process) {
        if (auto ws = leftovers.process->wait_status()) {
            error.message += " (process " + describe_wait_status(*ws) + ")";
        }
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        status_ = ServerStatus::Error;
        last_error_ = error.message;
        tools_.clear();
        info_ = ServerInfo{};
    }
    log_warn(config_.id, "Start failed: " + error.describe());
    publish_error(error.message);
    return Status::fail(std::move(error));
}

Status ServerSupervisor::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    RunResources leftovers;
    uint64_t gen = 0;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (removed_) {
            return Status::fail(ErrorKind::NotFound, "Server " + config_.id + " was removed");
        }
        if (status_ == ServerStatus::Running) {
            return Status::ok();
        }
        // A crashed run may still hold a connection
        leftovers = take_resources_locked();
        status_ = ServerStatus::Starting;
        last_error_.reset();
        tools_.clear();
        info_ = ServerInfo{};
        gen = generation_;
    }
    release(leftovers, std::chrono::milliseconds(0));

    log_info(config_.id, "Starting " + config_.command);
    if (bus_) {
        ServerStartingEvent ev;
        ev.server_id = config_.id;
        bus_->publish(ev);
    }

    auto deadline = std::chrono::steady_clock::now() + timeouts_.startup;

    SpawnOptions options;
    options.command = config_.command;
    options.args = config_.args;
    options.env = config_.env;
    options.cwd = config_.cwd;

    ProcessPipes pipes;
    auto spawned = ChildProcess::spawn(options, pipes);
    if (!spawned.success) {
        return abort_start(spawned.error);
    }

    std::shared_ptr<Connection> conn;
    try {
        conn = std::make_shared<Connection>(config_.id, pipes.stdin_fd, pipes.stdout_fd,
                                            pipes.stderr_fd);
    } catch (const std::runtime_error& e) {
        for (int fd : {pipes.stdin_fd, pipes.stdout_fd, pipes.stderr_fd}) {
            if (fd >= 0) ::close(fd);
        }
        spawned.value->terminate(std::chrono::milliseconds(0));
        return abort_start(make_error(ErrorKind::SpawnFailure, e.what()));
    }
    conn->set_notification_handler([this, gen](const NotificationMessage& n) {
        on_notification(gen, n);
    });
    conn->set_close_handler([this, gen](const std::string& reason) {
        on_stream_closed(gen, reason);
    });

    int pid = spawned.value->pid();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        process_ = std::move(spawned.value);
        connection_ = conn;
    }
    conn->start();

    Handshake handshake(*conn, config_.id);
    Status shaken = handshake.run(timeouts_.handshake, deadline);
    if (!shaken.success) {
        return abort_start(shaken.error);
    }

    bool lost = false;
    size_t tool_count = 0;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!conn->is_open()) {
            lost = true;
        } else {
            status_ = ServerStatus::Running;
            tools_ = handshake.tools();
            info_ = handshake.server_info();
            tool_count = tools_.size();
        }
    }
    if (lost) {
        return abort_start(make_error(ErrorKind::ConnectionLost,
                                      "Process exited during startup"));
    }

    log_info(config_.id, "Running (pid " + std::to_string(pid) + ", " +
             std::to_string(tool_count) + " tool(s))");
    if (bus_) {
        ServerStartedEvent started;
        started.server_id = config_.id;
        started.pid = pid;
        started.tool_count = tool_count;
        bus_->publish(started);

        ToolsDiscoveredEvent discovered;
        discovered.server_id = config_.id;
        discovered.tool_count = tool_count;
        bus_->publish(discovered);
    }
    return Status::ok();
}

Status ServerSupervisor::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    return stop_locked();
}

Status ServerSupervisor::stop_locked() {
    RunResources resources;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (status_ == ServerStatus::Stopped && !process_ && !connection_) {
            return Status::ok();
        }
        resources = take_resources_locked();
        status_ = ServerStatus::Stopped;
        tools_.clear();
        info_ = ServerInfo{};
    }

    TerminationPath path = release(resources, timeouts_.stop_grace);
    bool forced = path == TerminationPath::Forced;
    log_info(config_.id, forced ? "Stopped (killed after grace period)" : "Stopped");

    if (bus_) {
        ServerStoppedEvent ev;
        ev.server_id = config_.id;
        ev.forced = forced;
        bus_->publish(ev);
    }
    return Status::ok();
}

Status ServerSupervisor::remove() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    Status stopped = stop_locked();
    std::lock_guard<std::mutex> lock(state_mutex_);
    removed_ = true;
    return stopped;
}

void ServerSupervisor::on_stream_closed(uint64_t generation, const std::string& reason) {
    std::unique_ptr<ChildProcess> dead;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        // Stale run, deliberate stop, or still starting (start() reports it)
        if (generation != generation_ || status_ != ServerStatus::Running) return;
        dead = std::move(process_);
        status_ = ServerStatus::Error;
        tools_.clear();
        info_ = ServerInfo{};
        last_error_ = "Process exited unexpectedly";
    }

    std::string detail = reason;
    if (dead) {
        // stdout usually closes a moment before the exit is reapable
        for (int i = 0; i < 20 && dead->running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        if (auto ws = dead->wait_status()) detail = describe_wait_status(*ws);
    }
    dead.reset(); // kills a child that closed stdout but kept running

    std::string message = "Process exited unexpectedly (" + detail + ")";
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (generation == generation_ && status_ == ServerStatus::Error) {
            last_error_ = message;
        }
    }
    log_warn(config_.id, message);
    publish_error(message, true);
}

void ServerSupervisor::on_notification(uint64_t generation,
                                       const NotificationMessage& notification) {
    if (notification.method == protocol::method::ToolsListChanged) {
        schedule_refresh(generation);
        return;
    }
    log_debug(config_.id, "Notification: " + notification.method);
    if (bus_) {
        ServerNotificationEvent ev;
        ev.server_id = config_.id;
        ev.method = notification.method;
        ev.params = notification.params;
        bus_->post(std::move(ev));
    }
}

void ServerSupervisor::schedule_refresh(uint64_t generation) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (generation != generation_ || status_ != ServerStatus::Running) return;
    if (refresh_.valid() &&
        refresh_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        log_debug(config_.id, "Tool re-discovery already in progress");
        return;
    }
    // Runs off the reader thread: it has to wait for a response that the
    // reader itself delivers.
    refresh_ = std::async(std::launch::async, [this]() {
        Status refreshed = refresh_tools();
        if (!refreshed.success) {
            log_warn(config_.id, "Tool list refresh failed: " + refreshed.error.describe());
        }
    });
}

Status ServerSupervisor::refresh_tools() {
    std::shared_ptr<Connection> conn;
    uint64_t gen = 0;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (status_ != ServerStatus::Running || !connection_) {
            return Status::fail(ErrorKind::NotRunning, "Server " + config_.id + " is not running");
        }
        conn = connection_;
        gen = generation_;
    }

    auto discovered = discover_tools(*conn, config_.id, timeouts_.handshake,
                                     std::chrono::steady_clock::now() + timeouts_.startup);
    if (!discovered.success) {
        return discovered.status();
    }

    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (gen != generation_ || status_ != ServerStatus::Running) {
            return Status::fail(ErrorKind::NotRunning,
                                "Server " + config_.id + " stopped during tool discovery");
        }
        tools_ = std::move(discovered.value);
        count = tools_.size();
    }

    log_info(config_.id, "Tool list refreshed: " + std::to_string(count) + " tool(s)");
    if (bus_) {
        ToolsDiscoveredEvent ev;
        ev.server_id = config_.id;
        ev.tool_count = count;
        bus_->post(std::move(ev));
    }
    return Status::ok();
}

Result<nlohmann::json> ServerSupervisor::execute(const std::string& tool,
                                                 const nlohmann::json& arguments) {
    using R = Result<nlohmann::json>;
    if (tool.empty()) {
        throw std::invalid_argument("Tool name must not be empty");
    }
    if (!arguments.is_object() && !arguments.is_null()) {
        throw std::invalid_argument("Tool parameters must be a JSON object");
    }

    std::shared_ptr<Connection> conn;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (status_ != ServerStatus::Running || !connection_) {
            return R::fail(ErrorKind::NotRunning,
                           "Server " + config_.id + " is not running (" +
                           server_status_name(status_) + ")");
        }
        bool known = false;
        for (const auto& t : tools_) {
            if (t.name == tool) { known = true; break; }
        }
        if (!known) {
            return R::fail(ErrorKind::ToolNotFound,
                           "Tool " + tool + " not found on server " + config_.id);
        }
        conn = connection_;
    }

    nlohmann::json params = {
        {"name", tool},
        {"arguments", arguments.is_null() ? nlohmann::json::object() : arguments}
    };
    auto response = conn->request(protocol::method::ToolsCall, params, timeouts_.tool_call);
    if (!response.success) {
        log_debug(config_.id, "Tool " + tool + " failed: " + response.error.describe());
        return response;
    }
    if (!response.value.is_object()) {
        return R::fail(ErrorKind::InvalidResponse,
                       "Tool " + tool + " returned a non-object result");
    }
    return response;
}

ServerSnapshot ServerSupervisor::snapshot() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    ServerSnapshot snap;
    snap.id = config_.id;
    snap.name = config_.name;
    snap.description = config_.description;
    snap.status = status_;
    snap.tool_count = tools_.size();
    snap.last_error = last_error_;
    if (process_ && (status_ == ServerStatus::Starting || status_ == ServerStatus::Running)) {
        snap.pid = static_cast<int>(process_->pid());
    }
    snap.protocol_version = info_.protocol_version;
    snap.server_name = info_.name;
    return snap;
}

ServerStatus ServerSupervisor::status() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return status_;
}

std::vector<ToolDescriptor> ServerSupervisor::tools() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return tools_;
}

std::optional<ToolDescriptor> ServerSupervisor::find_tool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    for (const auto& t : tools_) {
        if (t.name == name) return t;
    }
    return std::nullopt;
}

} // namespace toolhost
