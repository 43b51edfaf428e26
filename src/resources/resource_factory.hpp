#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "core/config/app_config.hpp"
#include "core/errors/orchestration_errors.hpp"
#include "resources/resource_client.hpp"
#include "resources/resource_handle.hpp"

namespace conductor::resources {

struct FactoryStats {
    std::uint64_t handles_created = 0;
    std::uint64_t handles_released = 0;
    std::uint64_t handles_reclaimed = 0;  // by idle TTL
    std::uint64_t quota_rejections = 0;
    std::size_t handles_active = 0;
    std::size_t users_with_handles = 0;
};

// Issues, tracks and reclaims per-(user, request) resource handles from a
// bounded per-user pool. All bookkeeping sits behind one mutex, held only for
// the bookkeeping itself.
class ResourceFactory {
public:
    ResourceFactory(core::config::ResourceConfig config, ClientConnector connector,
                    SteadyClock clock = [] { return std::chrono::steady_clock::now(); });
    ~ResourceFactory();

    ResourceFactory(const ResourceFactory&) = delete;
    ResourceFactory& operator=(const ResourceFactory&) = delete;

    core::errors::Result<std::shared_ptr<ResourceHandle>> create_handle(
        const std::string& user_id, const std::string& request_id,
        const std::string& thread_id);

    // Only the creating (user_id, request_id) pair can look its handle up.
    core::errors::Result<std::shared_ptr<ResourceHandle>> get_handle(
        const std::string& user_id, const std::string& request_id) const;

    core::errors::Status release_handle(const std::string& user_id,
                                        const std::string& request_id);
    // Releases this exact handle; a newer handle under the same key is left
    // alone.
    core::errors::Status release_handle(const std::shared_ptr<ResourceHandle>& handle);

    // Releases every handle of the user; returns how many.
    std::size_t cleanup_user(const std::string& user_id);

    // One reclamation pass over all users; returns handles reclaimed.
    std::size_t sweep_idle();

    std::size_t live_handles(const std::string& user_id) const;
    FactoryStats stats() const;

    // Background reclamation is owned by the process supervisor.
    void start();
    void stop();
    bool is_running() const;

private:
    using HandleMap = std::unordered_map<std::string, std::shared_ptr<ResourceHandle>>;

    static std::string make_key(const std::string& user_id,
                                const std::string& request_id);
    // Detaches handles from the registry; the caller marks them released
    // after dropping the lock.
    std::vector<std::shared_ptr<ResourceHandle>> detach_idle_locked(
        const std::string* only_user, std::chrono::steady_clock::time_point now);
    void detach_locked(HandleMap::iterator it);
    static void mark_all_released(
        const std::vector<std::shared_ptr<ResourceHandle>>& handles);
    void reclamation_loop();

    core::config::ResourceConfig config_;
    ClientConnector connector_;
    SteadyClock clock_;

    mutable std::mutex mutex_;
    HandleMap handles_;
    std::unordered_map<std::string, std::size_t> user_counts_;
    FactoryStats stats_;

    std::condition_variable wakeup_;
    bool running_ = false;
    std::thread reaper_;
};

// Acquires a handle and releases it on every exit path.
class ScopedHandle {
public:
    static core::errors::Result<ScopedHandle> acquire(ResourceFactory& factory,
                                                      const std::string& user_id,
                                                      const std::string& request_id,
                                                      const std::string& thread_id);

    ScopedHandle(ScopedHandle&& other) noexcept;
    ScopedHandle& operator=(ScopedHandle&& other) noexcept;
    ScopedHandle(const ScopedHandle&) = delete;
    ScopedHandle& operator=(const ScopedHandle&) = delete;
    ~ScopedHandle();

    ResourceHandle& get() const { return *handle_; }
    ResourceHandle* operator->() const { return handle_.get(); }
    void release();

private:
    ScopedHandle(ResourceFactory& factory, std::shared_ptr<ResourceHandle> handle);

    ResourceFactory* factory_;
    std::shared_ptr<ResourceHandle> handle_;
};

}  // namespace conductor::resources
