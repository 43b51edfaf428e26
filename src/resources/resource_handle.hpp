#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/orchestration_errors.hpp"
#include "resources/resource_client.hpp"

namespace conductor::resources {

using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

// A per-(user, request) lease on an underlying client. The client is created,
// connected and health-probed on first use, not at creation.
class ResourceHandle {
public:
    ResourceHandle(std::string user_id, std::string request_id,
                   std::string thread_id, ClientConnector connector,
                   SteadyClock clock);

    ResourceHandle(const ResourceHandle&) = delete;
    ResourceHandle& operator=(const ResourceHandle&) = delete;

    // Runs one operation tagged with the owning user.
    core::errors::Result<nlohmann::json> execute(const std::string& operation,
                                                 const nlohmann::json& params =
                                                     nlohmann::json::object());

    const std::string& user_id() const { return user_id_; }
    const std::string& request_id() const { return request_id_; }
    const std::string& thread_id() const { return thread_id_; }
    std::chrono::steady_clock::time_point created_at() const { return created_at_; }

    std::chrono::steady_clock::time_point last_used_at() const;
    std::uint64_t operation_count() const;
    std::uint64_t error_count() const;
    bool is_initialized() const;
    bool is_released() const;

private:
    friend class ResourceFactory;

    void mark_released();
    core::errors::Status ensure_connected();
    void touch();

    const std::string user_id_;
    const std::string request_id_;
    const std::string thread_id_;
    ClientConnector connector_;
    SteadyClock clock_;
    const std::chrono::steady_clock::time_point created_at_;

    // Read by the factory's sweep without taking the handle's mutex.
    std::atomic<std::chrono::steady_clock::rep> last_used_ticks_;

    mutable std::mutex mutex_;
    std::uint64_t operation_count_ = 0;
    std::uint64_t error_count_ = 0;
    bool released_ = false;
    std::unique_ptr<ResourceClient> client_;
};

}  // namespace conductor::resources
