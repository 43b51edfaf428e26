#include "events/event_validator.hpp"

#include <cstdint>
#include <unordered_map>
#include "protocol/event_contract.hpp"

namespace conductor::events {

using nlohmann::json;
using protocol::EventType;

namespace {

std::string string_field(const json& object, const char* key) {
    if (!object.is_object()) {
        return "";
    }
    const auto it = object.find(key);
    return (it != object.end() && it->is_string()) ? it->get<std::string>() : "";
}

}  // namespace

SequenceReport validate_run_events(const std::vector<json>& frames,
                                   const std::string& run_id) {
    SequenceReport report;
    auto violate = [&report](const std::string& what) {
        report.valid = false;
        report.violations.push_back(what);
    };

    std::uint64_t last_sequence = 0;
    bool started = false;
    bool completed = false;
    std::unordered_map<std::string, std::string> open_tools;  // call id -> tool

    for (const auto& frame : frames) {
        if (!frame.is_object()) {
            violate("frame is not a JSON object");
            continue;
        }
        const auto sequence = frame.find("sequence_number");
        if (sequence == frame.end() || !sequence->is_number_unsigned()) {
            violate("frame without sequence_number");
        } else {
            const auto value = sequence->get<std::uint64_t>();
            if (value <= last_sequence) {
                violate("sequence_number " + std::to_string(value) +
                        " does not increase");
            }
            last_sequence = value;
        }

        if (string_field(frame, "run_id") != run_id) {
            continue;
        }
        const std::string type_name = string_field(frame, "type");
        const auto type = protocol::parse_event_type(type_name);
        if (!type.has_value()) {
            violate("unknown event type '" + type_name + "'");
            continue;
        }
        ++report.counts[type_name];
        if (!protocol::is_critical(type.value())) {
            continue;
        }

        if (completed) {
            violate(type_name + " after agent_completed");
            continue;
        }

        const json& payload = frame.contains("payload") ? frame["payload"] : json();
        switch (type.value()) {
            case EventType::AgentStarted:
                if (started) {
                    violate("duplicate agent_started");
                }
                started = true;
                break;
            case EventType::ToolExecuting: {
                if (!started) {
                    violate("tool_executing before agent_started");
                }
                const std::string call_id = string_field(payload, "tool_call_id");
                if (open_tools.count(call_id) != 0) {
                    violate("tool call " + call_id + " started twice");
                }
                open_tools[call_id] = string_field(payload, "tool_name");
                break;
            }
            case EventType::ToolCompleted: {
                const std::string call_id = string_field(payload, "tool_call_id");
                const auto open = open_tools.find(call_id);
                if (open == open_tools.end()) {
                    violate("tool_completed without tool_executing for " + call_id);
                } else {
                    if (open->second != string_field(payload, "tool_name")) {
                        violate("tool_completed names a different tool for " + call_id);
                    }
                    open_tools.erase(open);
                    ++report.tool_pairs;
                }
                break;
            }
            case EventType::AgentCompleted:
                if (!started) {
                    violate("agent_completed before agent_started");
                }
                if (!open_tools.empty()) {
                    violate("agent_completed with " + std::to_string(open_tools.size()) +
                            " unfinished tool call(s)");
                }
                completed = true;
                break;
            default:
                if (!started) {
                    violate(type_name + " before agent_started");
                }
                break;
        }
    }

    if (!started) {
        violate("missing agent_started");
    }
    if (!completed) {
        violate("missing agent_completed");
    }
    return report;
}

}  // namespace conductor::events
