#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace toolhost {

// Tag-based event dispatch, no RTTI. Events are plain structs, either
// published from the stack or posted as a shared_ptr to the concrete type;
// never deleted through a base pointer.

struct Event {
    const char* type_tag;
};

namespace event_tags {
    constexpr const char* ServerAdded        = "ServerAdded";
    constexpr const char* ServerStarting     = "ServerStarting";
    constexpr const char* ServerStarted      = "ServerStarted";
    constexpr const char* ServerStopped      = "ServerStopped";
    constexpr const char* ServerError        = "ServerError";
    constexpr const char* ServerRemoved      = "ServerRemoved";
    constexpr const char* ToolsDiscovered    = "ToolsDiscovered";
    constexpr const char* ServerNotification = "ServerNotification";
} // namespace event_tags

// Every host event concerns exactly one server.
struct ServerEvent : Event {
    std::string server_id;
};

struct ServerAddedEvent : ServerEvent {
    static constexpr const char* TAG = event_tags::ServerAdded;
    ServerAddedEvent() { type_tag = TAG; }
};

struct ServerStartingEvent : ServerEvent {
    static constexpr const char* TAG = event_tags::ServerStarting;
    ServerStartingEvent() { type_tag = TAG; }
};

struct ServerStartedEvent : ServerEvent {
    static constexpr const char* TAG = event_tags::ServerStarted;
    int pid = 0;
    size_t tool_count = 0;
    ServerStartedEvent() { type_tag = TAG; }
};

struct ServerStoppedEvent : ServerEvent {
    static constexpr const char* TAG = event_tags::ServerStopped;
    bool forced = false; // needed SIGKILL
    ServerStoppedEvent() { type_tag = TAG; }
};

struct ServerErrorEvent : ServerEvent {
    static constexpr const char* TAG = event_tags::ServerError;
    std::string message;
    ServerErrorEvent() { type_tag = TAG; }
};

struct ServerRemovedEvent : ServerEvent {
    static constexpr const char* TAG = event_tags::ServerRemoved;
    ServerRemovedEvent() { type_tag = TAG; }
};

struct ToolsDiscoveredEvent : ServerEvent {
    static constexpr const char* TAG = event_tags::ToolsDiscovered;
    size_t tool_count = 0;
    ToolsDiscoveredEvent() { type_tag = TAG; }
};

// A provider notification the host does not act on itself.
struct ServerNotificationEvent : ServerEvent {
    static constexpr const char* TAG = event_tags::ServerNotification;
    std::string method;
    nlohmann::json params;
    ServerNotificationEvent() { type_tag = TAG; }
};

} // namespace toolhost
