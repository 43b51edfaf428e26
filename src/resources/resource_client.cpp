#include "resources/resource_client.hpp"

#include <utility>

namespace conductor::resources {

using core::errors::ErrorCategory;
using core::errors::OrchestrationError;
using nlohmann::json;

void AnalyticsBackend::set_available(const bool available) {
    std::lock_guard<std::mutex> lock(mutex_);
    available_ = available;
}

bool AnalyticsBackend::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_;
}

void AnalyticsBackend::refuse_next_connections(const std::size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    refusals_ = count;
}

bool AnalyticsBackend::accept_connection() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!available_) {
        return false;
    }
    if (refusals_ > 0) {
        --refusals_;
        return false;
    }
    return true;
}

void AnalyticsBackend::insert(const std::string& user_id, json row) {
    std::lock_guard<std::mutex> lock(mutex_);
    rows_[user_id].push_back(std::move(row));
}

std::vector<json> AnalyticsBackend::rows_for(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = rows_.find(user_id);
    if (it == rows_.end()) {
        return {};
    }
    return it->second;
}

std::size_t AnalyticsBackend::total_rows() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t total = 0;
    for (const auto& [user_id, rows] : rows_) {
        total += rows.size();
    }
    return total;
}

AnalyticsClient::AnalyticsClient(std::shared_ptr<AnalyticsBackend> backend)
    : backend_(std::move(backend)) {}

core::errors::Status AnalyticsClient::connect() {
    if (!backend_ || !backend_->accept_connection()) {
        return OrchestrationError{ErrorCategory::Connection,
                                  "Analytics backend refused the connection.",
                                  "resource_connect_failed"};
    }
    connected_ = true;
    return core::errors::ok();
}

core::errors::Status AnalyticsClient::ping() {
    if (!connected_ || !backend_->available()) {
        return OrchestrationError{ErrorCategory::Connection,
                                  "Analytics backend health probe failed.",
                                  "resource_unhealthy"};
    }
    return core::errors::ok();
}

core::errors::Result<json> AnalyticsClient::execute(const std::string& user_id,
                                                    const std::string& operation,
                                                    const json& params) {
    if (!connected_ || !backend_->available()) {
        return OrchestrationError{ErrorCategory::Connection,
                                  "Analytics backend is unavailable.",
                                  "resource_unavailable"};
    }
    if (user_id.empty()) {
        return OrchestrationError{ErrorCategory::Validation,
                                  "Analytics operations must be tagged with a user.",
                                  "untagged_operation"};
    }

    if (operation == "insert") {
        if (!params.is_object() || !params.contains("row")) {
            return OrchestrationError{ErrorCategory::Validation,
                                      "insert requires a 'row' parameter.",
                                      "invalid_operation"};
        }
        json row = params["row"];
        if (row.is_object()) {
            row["user_id"] = user_id;
        }
        backend_->insert(user_id, std::move(row));
        json result;
        result["inserted"] = 1;
        return result;
    }
    if (operation == "query") {
        return json(backend_->rows_for(user_id));
    }
    if (operation == "count") {
        json result;
        result["count"] = backend_->rows_for(user_id).size();
        return result;
    }
    return OrchestrationError{ErrorCategory::Validation,
                              "Unknown analytics operation: " + operation,
                              "invalid_operation"};
}

ClientConnector make_analytics_connector(std::shared_ptr<AnalyticsBackend> backend) {
    return [backend]() -> std::unique_ptr<ResourceClient> {
        return std::make_unique<AnalyticsClient>(backend);
    };
}

}  // namespace conductor::resources
