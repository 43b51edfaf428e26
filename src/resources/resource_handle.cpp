#include "resources/resource_handle.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace conductor::resources {

using core::errors::ErrorCategory;
using core::errors::OrchestrationError;
using nlohmann::json;

ResourceHandle::ResourceHandle(std::string user_id, std::string request_id,
                               std::string thread_id, ClientConnector connector,
                               SteadyClock clock)
    : user_id_(std::move(user_id)),
      request_id_(std::move(request_id)),
      thread_id_(std::move(thread_id)),
      connector_(std::move(connector)),
      clock_(std::move(clock)),
      created_at_(clock_()),
      last_used_ticks_(created_at_.time_since_epoch().count()) {}

void ResourceHandle::touch() {
    last_used_ticks_.store(clock_().time_since_epoch().count());
}

core::errors::Status ResourceHandle::ensure_connected() {
    if (client_) {
        return core::errors::ok();
    }
    if (!connector_) {
        return OrchestrationError{ErrorCategory::Internal,
                                  "Resource handle has no client connector.",
                                  "missing_connector"};
    }

    auto client = connector_();
    if (!client) {
        return OrchestrationError{ErrorCategory::Connection,
                                  "Client connector produced no client.",
                                  "resource_connect_failed"};
    }
    auto connected = client->connect();
    if (core::errors::is_error(connected)) {
        return connected;
    }
    auto healthy = client->ping();
    if (core::errors::is_error(healthy)) {
        return healthy;
    }
    client_ = std::move(client);
    LOG_DEBUG("ResourceHandle: connected client for user " + user_id_ +
              " request " + request_id_);
    return core::errors::ok();
}

core::errors::Result<json> ResourceHandle::execute(const std::string& operation,
                                                   const json& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (released_) {
        return OrchestrationError{ErrorCategory::Validation,
                                  "Resource handle for request " + request_id_ +
                                      " has been released.",
                                  "handle_released",
                                  "Acquire a new handle from the factory."};
    }
    touch();

    auto connected = ensure_connected();
    if (core::errors::is_error(connected)) {
        ++error_count_;
        const auto& cause = core::errors::get_error(connected);
        return OrchestrationError{ErrorCategory::Connection,
                                  "Resource connection failed for user " + user_id_ +
                                      ": " + cause.message,
                                  cause.code, "The handle stays usable; retry later."};
    }

    auto result = client_->execute(user_id_, operation, params);
    ++operation_count_;
    if (core::errors::is_error(result)) {
        ++error_count_;
    }
    touch();
    return result;
}

std::chrono::steady_clock::time_point ResourceHandle::last_used_at() const {
    return std::chrono::steady_clock::time_point(
        std::chrono::steady_clock::duration(last_used_ticks_.load()));
}

std::uint64_t ResourceHandle::operation_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return operation_count_;
}

std::uint64_t ResourceHandle::error_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_count_;
}

bool ResourceHandle::is_initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_ != nullptr;
}

bool ResourceHandle::is_released() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return released_;
}

void ResourceHandle::mark_released() {
    std::lock_guard<std::mutex> lock(mutex_);
    released_ = true;
    client_.reset();
}

}  // namespace conductor::resources
