#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/orchestration_errors.hpp"

namespace conductor::session {

struct RunSnapshot {
    std::string snapshot_id;
    std::string run_id;
    std::string thread_id;
    std::string user_id;
    nlohmann::json state;
    std::int64_t saved_at = 0;
};

// Persistence backend behind the state-store bridge. One snapshot per run_id;
// a newer put replaces the older one.
class StateStore {
public:
    virtual ~StateStore() = default;

    virtual core::errors::Status put(const RunSnapshot& snapshot) = 0;
    virtual core::errors::Result<std::optional<RunSnapshot>> get(
        const std::string& run_id) const = 0;
    virtual core::errors::Result<std::vector<RunSnapshot>> list_thread(
        const std::string& thread_id) const = 0;
    // Removes snapshots saved before cutoff_unix_ms.
    virtual core::errors::Result<std::size_t> erase_older_than(
        std::int64_t cutoff_unix_ms) = 0;
};

class InMemoryStateStore : public StateStore {
public:
    core::errors::Status put(const RunSnapshot& snapshot) override;
    core::errors::Result<std::optional<RunSnapshot>> get(
        const std::string& run_id) const override;
    core::errors::Result<std::vector<RunSnapshot>> list_thread(
        const std::string& thread_id) const override;
    core::errors::Result<std::size_t> erase_older_than(
        std::int64_t cutoff_unix_ms) override;

    // Simulates the backend going away; every call then fails with a
    // connection error.
    void set_available(bool available);
    std::size_t size() const;

private:
    core::errors::Status check_available() const;

    mutable std::mutex mutex_;
    bool available_ = true;
    std::unordered_map<std::string, RunSnapshot> snapshots_;
};

// One JSON document per run under a directory.
class FileStateStore : public StateStore {
public:
    explicit FileStateStore(std::filesystem::path directory);

    core::errors::Status put(const RunSnapshot& snapshot) override;
    core::errors::Result<std::optional<RunSnapshot>> get(
        const std::string& run_id) const override;
    core::errors::Result<std::vector<RunSnapshot>> list_thread(
        const std::string& thread_id) const override;
    core::errors::Result<std::size_t> erase_older_than(
        std::int64_t cutoff_unix_ms) override;

private:
    core::errors::Result<std::filesystem::path> snapshot_path(
        const std::string& run_id) const;
    core::errors::Status ensure_directory() const;
    core::errors::Result<std::vector<RunSnapshot>> read_all() const;

    std::filesystem::path directory_;
    mutable std::mutex mutex_;
};

}  // namespace conductor::session
