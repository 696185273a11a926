#pragma once
#include <any>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace TierCache {

enum class EventPriority {
    Low = 0,
    Normal = 1,
    High = 2,
    Critical = 3
};

const char* ToString(EventPriority priority);

// One published message. Never modified after Emit builds it.
struct EventEnvelope {
    std::string type;
    std::any data;
    EventPriority priority = EventPriority::Normal;
    std::chrono::system_clock::time_point timestamp;
    uint64_t id = 0;
};

// Typed topic descriptor; T is the payload carried in EventEnvelope::data.
template <typename T>
struct EventType {
    const char* name;
};

struct Connection {
    std::string id;
    std::string name;
    std::string type;
    std::string host;
    int port = 0;
    std::optional<std::string> database;
    std::string environment = "dev";
    bool is_connected = false;
};

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Error
};

struct ConnectionStateChange {
    std::string connection_id;
    ConnectionState old_state = ConnectionState::Disconnected;
    ConnectionState new_state = ConnectionState::Disconnected;
    std::optional<std::string> error;
};

struct QueryResult {
    std::string connection_id;
    std::string query;
    double duration_ms = 0.0;
    std::optional<int64_t> rows_affected;
    std::optional<std::string> error;
};

struct AIRequest {
    std::string type;
    std::optional<std::string> query;
    bool anonymized = false;
    int64_t timestamp_ms = 0;
};

struct AIResponse {
    std::string type;
    double duration_ms = 0.0;
    bool success = false;
    std::optional<std::string> error;
};

namespace Events {
    inline constexpr EventType<Connection> kConnectionAdded{"connection.added"};
    inline constexpr EventType<std::string> kConnectionRemoved{"connection.removed"};
    inline constexpr EventType<ConnectionStateChange> kConnectionStateChanged{"connection.stateChanged"};
    inline constexpr EventType<QueryResult> kQueryExecuted{"query.executed"};
    inline constexpr EventType<AIRequest> kAIRequestSent{"ai.requestSent"};
    inline constexpr EventType<AIResponse> kAIResponseReceived{"ai.responseReceived"};
}

}
