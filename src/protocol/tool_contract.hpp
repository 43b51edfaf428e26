#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace conductor::protocol {

    // A tool invocation made by a stage on behalf of a run
    struct ToolCall {
        std::string id;
        std::string name;            // e.g. "fetch_usage_metrics"
        nlohmann::json arguments = nlohmann::json::object();
    };

    // Reported back on the matching tool_completed event
    struct ToolResult {
        std::string tool_call_id;
        bool success = false;
        nlohmann::json output;
        std::string error_message;
        double duration_ms = 0.0;
    };

} // namespace conductor::protocol
