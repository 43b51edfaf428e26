#include "session/state_codec.hpp"

#include <string>

namespace conductor::session {

using core::errors::ErrorCategory;
using core::errors::OrchestrationError;
using nlohmann::json;
using protocol::RequestState;

namespace {

OrchestrationError corrupt(const std::string& what) {
    return OrchestrationError{ErrorCategory::Internal,
                              "Stored run state is malformed: " + what,
                              "corrupt_snapshot"};
}

bool read_string(const json& document, const char* key, std::string& out) {
    const auto it = document.find(key);
    if (it == document.end() || !it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool read_int(const json& document, const char* key, std::int64_t& out) {
    const auto it = document.find(key);
    if (it == document.end() || !it->is_number_integer()) {
        return false;
    }
    out = it->get<std::int64_t>();
    return true;
}

}  // namespace

json state_to_json(const RequestState& state) {
    json document;
    document["user_id"] = state.user_id;
    document["thread_id"] = state.thread_id;
    document["run_id"] = state.run_id;
    document["user_request"] = state.user_request;
    document["status"] = protocol::to_string(state.status);
    document["created_at"] = state.created_at;
    document["updated_at"] = state.updated_at;

    json results = json::object();
    for (const auto& [stage, result] : state.stage_results) {
        results[stage] = result;
    }
    document["stage_results"] = results;
    document["execution_order"] = state.execution_order;

    json failures = json::object();
    for (const auto& [stage, message] : state.stage_failures) {
        failures[stage] = message;
    }
    document["stage_failures"] = failures;
    document["failure_reason"] =
        state.failure_reason.has_value() ? json(state.failure_reason.value()) : json();
    return document;
}

core::errors::Result<RequestState> state_from_json(const json& document) {
    if (!document.is_object()) {
        return corrupt("expected an object");
    }

    RequestState state;
    if (!read_string(document, "user_id", state.user_id) ||
        !read_string(document, "thread_id", state.thread_id) ||
        !read_string(document, "run_id", state.run_id) ||
        !read_string(document, "user_request", state.user_request)) {
        return corrupt("missing identity fields");
    }

    std::string status_text;
    if (!read_string(document, "status", status_text)) {
        return corrupt("missing status");
    }
    const auto status = protocol::parse_request_status(status_text);
    if (!status.has_value()) {
        return corrupt("unknown status '" + status_text + "'");
    }
    state.status = status.value();

    if (!read_int(document, "created_at", state.created_at) ||
        !read_int(document, "updated_at", state.updated_at)) {
        return corrupt("missing timestamps");
    }

    const auto results = document.find("stage_results");
    if (results == document.end() || !results->is_object()) {
        return corrupt("missing stage_results");
    }
    for (const auto& [stage, result] : results->items()) {
        state.stage_results[stage] = result;
    }

    const auto order = document.find("execution_order");
    if (order == document.end() || !order->is_array()) {
        return corrupt("missing execution_order");
    }
    for (const auto& name : *order) {
        if (!name.is_string()) {
            return corrupt("execution_order entries must be strings");
        }
        state.execution_order.push_back(name.get<std::string>());
    }

    const auto failures = document.find("stage_failures");
    if (failures == document.end() || !failures->is_object()) {
        return corrupt("missing stage_failures");
    }
    for (const auto& [stage, message] : failures->items()) {
        if (!message.is_string()) {
            return corrupt("stage_failures values must be strings");
        }
        state.stage_failures[stage] = message.get<std::string>();
    }

    const auto reason = document.find("failure_reason");
    if (reason != document.end() && reason->is_string()) {
        state.failure_reason = reason->get<std::string>();
    }
    return state;
}

}  // namespace conductor::session
