#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace conductor::protocol {

enum class RequestStatus {
    Pending,
    Running,
    Completed,
    Failed
};

// One in-flight user request. Owned by the single active run with run_id.
struct RequestState {
    std::string user_id;
    std::string thread_id;
    std::string run_id;
    std::string user_request;
    std::map<std::string, nlohmann::json> stage_results;
    RequestStatus status = RequestStatus::Pending;
    std::int64_t created_at = 0;
    std::int64_t updated_at = 0;

    // Stages that completed, in execution order.
    std::vector<std::string> execution_order;
    std::map<std::string, std::string> stage_failures;
    std::optional<std::string> failure_reason;

    bool has_result(const std::string& stage_name) const {
        return stage_results.find(stage_name) != stage_results.end();
    }

    bool has_completed(const std::string& stage_name) const {
        for (const auto& name : execution_order) {
            if (name == stage_name) {
                return true;
            }
        }
        return false;
    }
};

inline bool operator==(const RequestState& lhs, const RequestState& rhs) {
    return lhs.user_id == rhs.user_id && lhs.thread_id == rhs.thread_id &&
           lhs.run_id == rhs.run_id && lhs.user_request == rhs.user_request &&
           lhs.stage_results == rhs.stage_results && lhs.status == rhs.status &&
           lhs.created_at == rhs.created_at && lhs.updated_at == rhs.updated_at &&
           lhs.execution_order == rhs.execution_order &&
           lhs.stage_failures == rhs.stage_failures &&
           lhs.failure_reason == rhs.failure_reason;
}

inline bool operator!=(const RequestState& lhs, const RequestState& rhs) {
    return !(lhs == rhs);
}

inline std::string to_string(const RequestStatus status) {
    switch (status) {
        case RequestStatus::Pending:
            return "pending";
        case RequestStatus::Running:
            return "running";
        case RequestStatus::Completed:
            return "completed";
        case RequestStatus::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

inline std::optional<RequestStatus> parse_request_status(const std::string& text) {
    if (text == "pending") return RequestStatus::Pending;
    if (text == "running") return RequestStatus::Running;
    if (text == "completed") return RequestStatus::Completed;
    if (text == "failed") return RequestStatus::Failed;
    return std::nullopt;
}

}  // namespace conductor::protocol
