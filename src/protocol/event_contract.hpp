#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace conductor::protocol {

    // The five critical kinds describe a run's lifecycle; the rest are
    // transport-health and non-business messages.
    enum class EventType {
        AgentStarted,
        AgentThinking,
        ToolExecuting,
        ToolCompleted,
        AgentCompleted,
        Error,
        Echo,
        Pong,
        ConnectionEstablished
    };

    // Ephemeral, never persisted.
    struct Event {
        EventType type = EventType::Echo;
        std::string thread_id;
        std::string run_id;
        nlohmann::json payload = nlohmann::json::object();
        std::int64_t timestamp = 0;
        // Assigned by the notifier, per thread, starting at 1.
        std::uint64_t sequence_number = 0;
    };

    inline bool is_critical(const EventType type) {
        switch (type) {
            case EventType::AgentStarted:
            case EventType::AgentThinking:
            case EventType::ToolExecuting:
            case EventType::ToolCompleted:
            case EventType::AgentCompleted:
                return true;
            default:
                return false;
        }
    }

    inline std::string to_string(const EventType type) {
        switch (type) {
            case EventType::AgentStarted:          return "agent_started";
            case EventType::AgentThinking:         return "agent_thinking";
            case EventType::ToolExecuting:         return "tool_executing";
            case EventType::ToolCompleted:         return "tool_completed";
            case EventType::AgentCompleted:        return "agent_completed";
            case EventType::Error:                 return "error";
            case EventType::Echo:                  return "echo";
            case EventType::Pong:                  return "pong";
            case EventType::ConnectionEstablished: return "connection_established";
            default: return "unknown";
        }
    }

    inline std::optional<EventType> parse_event_type(const std::string& text) {
        for (const auto type : {EventType::AgentStarted, EventType::AgentThinking,
                                EventType::ToolExecuting, EventType::ToolCompleted,
                                EventType::AgentCompleted, EventType::Error,
                                EventType::Echo, EventType::Pong,
                                EventType::ConnectionEstablished}) {
            if (to_string(type) == text) {
                return type;
            }
        }
        return std::nullopt;
    }

    // Wire frame sent on the thread's channel.
    inline nlohmann::json to_json(const Event& event) {
        nlohmann::json frame;
        frame["type"] = to_string(event.type);
        frame["thread_id"] = event.thread_id;
        frame["run_id"] = event.run_id;
        frame["payload"] = event.payload;
        frame["timestamp"] = event.timestamp;
        frame["sequence_number"] = event.sequence_number;
        return frame;
    }

} // namespace conductor::protocol
