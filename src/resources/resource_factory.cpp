#include "resources/resource_factory.hpp"

#include <iterator>
#include <utility>
#include "core/logging/logger.hpp"

namespace conductor::resources {

using core::errors::ErrorCategory;
using core::errors::OrchestrationError;

ResourceFactory::ResourceFactory(core::config::ResourceConfig config,
                                 ClientConnector connector, SteadyClock clock)
    : config_(std::move(config)),
      connector_(std::move(connector)),
      clock_(std::move(clock)) {}

ResourceFactory::~ResourceFactory() {
    stop();
}

std::string ResourceFactory::make_key(const std::string& user_id,
                                      const std::string& request_id) {
    return user_id + '\x1f' + request_id;
}

core::errors::Result<std::shared_ptr<ResourceHandle>> ResourceFactory::create_handle(
    const std::string& user_id, const std::string& request_id,
    const std::string& thread_id) {
    if (user_id.empty() || request_id.empty() || thread_id.empty()) {
        return OrchestrationError{ErrorCategory::Validation,
                                  "Handle requires user_id, request_id and thread_id.",
                                  "invalid_handle_request"};
    }

    std::vector<std::shared_ptr<ResourceHandle>> reclaimed;
    std::shared_ptr<ResourceHandle> handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const std::string key = make_key(user_id, request_id);
        if (handles_.find(key) != handles_.end()) {
            return OrchestrationError{ErrorCategory::Validation,
                                      "A live handle already exists for request " +
                                          request_id,
                                      "handle_already_exists"};
        }

        if (user_counts_[user_id] >= config_.max_clients_per_user) {
            reclaimed = detach_idle_locked(&user_id, clock_());
        }
        if (user_counts_[user_id] >= config_.max_clients_per_user) {
            ++stats_.quota_rejections;
            const std::size_t held = user_counts_[user_id];
            LOG_WARN("ResourceFactory: quota exceeded for user " + user_id + " (" +
                     std::to_string(held) + "/" +
                     std::to_string(config_.max_clients_per_user) + ")");
            return OrchestrationError{
                ErrorCategory::QuotaExceeded,
                "User " + user_id + " already holds " + std::to_string(held) +
                    " live handles (limit " +
                    std::to_string(config_.max_clients_per_user) + ").",
                "quota_exceeded",
                "Release handles, call cleanup_user, or wait for idle expiry."};
        }

        handle = std::make_shared<ResourceHandle>(user_id, request_id, thread_id,
                                                  connector_, clock_);
        handles_.emplace(key, handle);
        ++user_counts_[user_id];
        ++stats_.handles_created;
    }

    mark_all_released(reclaimed);
    LOG_DEBUG("ResourceFactory: created handle for user " + user_id + " request " +
              request_id);
    return handle;
}

core::errors::Result<std::shared_ptr<ResourceHandle>> ResourceFactory::get_handle(
    const std::string& user_id, const std::string& request_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = handles_.find(make_key(user_id, request_id));
    if (it == handles_.end()) {
        return OrchestrationError{ErrorCategory::Validation,
                                  "No live handle for this user and request.",
                                  "handle_not_found"};
    }
    return it->second;
}

core::errors::Status ResourceFactory::release_handle(const std::string& user_id,
                                                     const std::string& request_id) {
    std::shared_ptr<ResourceHandle> handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handles_.find(make_key(user_id, request_id));
        if (it == handles_.end()) {
            return OrchestrationError{ErrorCategory::Validation,
                                      "No live handle for this user and request.",
                                      "handle_not_found"};
        }
        handle = it->second;
        detach_locked(it);
        ++stats_.handles_released;
    }
    handle->mark_released();
    return core::errors::ok();
}

core::errors::Status ResourceFactory::release_handle(
    const std::shared_ptr<ResourceHandle>& handle) {
    if (!handle) {
        return OrchestrationError{ErrorCategory::Validation, "Handle is null.",
                                  "handle_not_found"};
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handles_.find(make_key(handle->user_id(), handle->request_id()));
        if (it == handles_.end() || it->second != handle) {
            return OrchestrationError{ErrorCategory::Validation,
                                      "Handle is no longer registered.",
                                      "handle_not_found"};
        }
        detach_locked(it);
        ++stats_.handles_released;
    }
    handle->mark_released();
    return core::errors::ok();
}

std::size_t ResourceFactory::cleanup_user(const std::string& user_id) {
    std::vector<std::shared_ptr<ResourceHandle>> released;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = handles_.begin(); it != handles_.end();) {
            if (it->second->user_id() == user_id) {
                released.push_back(it->second);
                auto next = std::next(it);
                detach_locked(it);
                it = next;
            } else {
                ++it;
            }
        }
        stats_.handles_released += released.size();
    }
    mark_all_released(released);
    if (!released.empty()) {
        LOG_INFO("ResourceFactory: cleaned up " + std::to_string(released.size()) +
                 " handle(s) for user " + user_id);
    }
    return released.size();
}

std::size_t ResourceFactory::sweep_idle() {
    std::vector<std::shared_ptr<ResourceHandle>> reclaimed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reclaimed = detach_idle_locked(nullptr, clock_());
    }
    mark_all_released(reclaimed);
    if (!reclaimed.empty()) {
        LOG_INFO("ResourceFactory: reclaimed " + std::to_string(reclaimed.size()) +
                 " idle handle(s)");
    }
    return reclaimed.size();
}

std::vector<std::shared_ptr<ResourceHandle>> ResourceFactory::detach_idle_locked(
    const std::string* only_user, const std::chrono::steady_clock::time_point now) {
    const auto ttl = std::chrono::seconds(config_.client_ttl_seconds);
    std::vector<std::shared_ptr<ResourceHandle>> idle;
    for (auto it = handles_.begin(); it != handles_.end();) {
        const auto& handle = it->second;
        const bool in_scope = only_user == nullptr || handle->user_id() == *only_user;
        if (in_scope && now - handle->last_used_at() > ttl) {
            idle.push_back(handle);
            auto next = std::next(it);
            detach_locked(it);
            it = next;
        } else {
            ++it;
        }
    }
    stats_.handles_reclaimed += idle.size();
    return idle;
}

void ResourceFactory::detach_locked(HandleMap::iterator it) {
    const std::string user_id = it->second->user_id();
    handles_.erase(it);
    auto count = user_counts_.find(user_id);
    if (count != user_counts_.end()) {
        if (count->second <= 1) {
            user_counts_.erase(count);
        } else {
            --count->second;
        }
    }
}

void ResourceFactory::mark_all_released(
    const std::vector<std::shared_ptr<ResourceHandle>>& handles) {
    for (const auto& handle : handles) {
        handle->mark_released();
    }
}

std::size_t ResourceFactory::live_handles(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = user_counts_.find(user_id);
    return it == user_counts_.end() ? 0 : it->second;
}

FactoryStats ResourceFactory::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    FactoryStats stats = stats_;
    stats.handles_active = handles_.size();
    stats.users_with_handles = user_counts_.size();
    return stats;
}

void ResourceFactory::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        LOG_WARN("ResourceFactory: reclamation already running");
        return;
    }
    running_ = true;
    reaper_ = std::thread(&ResourceFactory::reclamation_loop, this);
    LOG_INFO("ResourceFactory: reclamation started (interval " +
             std::to_string(config_.sweep_interval_ms) + " ms, ttl " +
             std::to_string(config_.client_ttl_seconds) + " s)");
}

void ResourceFactory::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    wakeup_.notify_all();
    if (reaper_.joinable()) {
        reaper_.join();
    }
    LOG_INFO("ResourceFactory: reclamation stopped");
}

bool ResourceFactory::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void ResourceFactory::reclamation_loop() {
    const auto interval = std::chrono::milliseconds(config_.sweep_interval_ms);
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            wakeup_.wait_for(lock, interval, [this] { return !running_; });
            if (!running_) {
                break;
            }
        }
        sweep_idle();
    }
}

// ---------------------------------------------------------------------------
// ScopedHandle
// ---------------------------------------------------------------------------

ScopedHandle::ScopedHandle(ResourceFactory& factory,
                           std::shared_ptr<ResourceHandle> handle)
    : factory_(&factory), handle_(std::move(handle)) {}

core::errors::Result<ScopedHandle> ScopedHandle::acquire(ResourceFactory& factory,
                                                         const std::string& user_id,
                                                         const std::string& request_id,
                                                         const std::string& thread_id) {
    auto created = factory.create_handle(user_id, request_id, thread_id);
    if (core::errors::is_error(created)) {
        return core::errors::get_error(created);
    }
    return ScopedHandle(factory, core::errors::get_value(created));
}

ScopedHandle::ScopedHandle(ScopedHandle&& other) noexcept
    : factory_(other.factory_), handle_(std::move(other.handle_)) {
    other.factory_ = nullptr;
}

ScopedHandle& ScopedHandle::operator=(ScopedHandle&& other) noexcept {
    if (this != &other) {
        release();
        factory_ = other.factory_;
        handle_ = std::move(other.handle_);
        other.factory_ = nullptr;
    }
    return *this;
}

ScopedHandle::~ScopedHandle() {
    release();
}

void ScopedHandle::release() {
    if (factory_ == nullptr || !handle_) {
        return;
    }
    // Already gone if the TTL sweep or cleanup_user got there first.
    if (!handle_->is_released()) {
        auto released = factory_->release_handle(handle_);
        if (core::errors::is_error(released)) {
            LOG_DEBUG("ScopedHandle: " + core::errors::get_error(released).message);
        }
    }
    handle_.reset();
    factory_ = nullptr;
}

}  // namespace conductor::resources
