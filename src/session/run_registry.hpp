#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include "core/errors/orchestration_errors.hpp"
#include "protocol/run_request.hpp"

namespace conductor::session {

enum class RunState {
    Running,
    Cancelling,  // cancel requested; the run has not reached a boundary yet
    Completed,
    Failed,
    Cancelled
};

struct RunRecord {
    std::string run_id;
    std::string user_id;
    std::string thread_id;
    RunState state = RunState::Running;
    std::optional<std::string> failure_reason;
    std::shared_ptr<std::atomic_bool> cancel_token;
    std::uint64_t generation = 0;
};

// Tracks which runs are active so at most one state exists per run_id.
// Only the newest `retained_terminal_runs` finished records are kept.
class RunRegistry {
public:
    explicit RunRegistry(std::size_t retained_terminal_runs = 1024);

    // Claims run_id for the caller. A terminal record under the same id may be
    // reclaimed by its owner (resume); an active one may not. A non-zero
    // max_active_per_user caps the user's Running and Cancelling runs.
    core::errors::Result<std::shared_ptr<std::atomic_bool>> start_run(
        const protocol::RunRequest& request, std::size_t max_active_per_user = 0);

    // Raises the run's cancel token and moves it to Cancelling. The record
    // stays active until the run itself calls mark_cancelled.
    core::errors::Result<RunState> cancel_run(const std::string& run_id,
                                              const std::string& user_id);
    core::errors::Result<RunState> mark_cancelled(const std::string& run_id);
    core::errors::Result<RunState> mark_completed(const std::string& run_id);
    core::errors::Result<RunState> mark_failed(const std::string& run_id,
                                               const std::string& reason);

    core::errors::Result<RunState> get_run_state(const std::string& run_id) const;
    core::errors::Result<std::shared_ptr<std::atomic_bool>> get_cancel_token(
        const std::string& run_id) const;

    bool is_active(const std::string& run_id) const;
    std::size_t active_count() const;
    std::size_t active_count(const std::string& user_id) const;
    std::size_t run_count() const;

    // Drops terminal records; returns how many were removed.
    std::size_t prune_terminal();

    static std::string to_string(RunState state);

private:
    core::errors::Result<RunState> transition_to_terminal(
        const std::string& run_id, RunState next_state,
        const std::optional<std::string>& failure_reason);
    std::size_t active_count_locked(const std::string& user_id) const;
    void evict_finished_locked();
    static bool is_terminal(RunState state);

    const std::size_t retained_terminal_runs_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, RunRecord> runs_;
    // (run_id, generation) in the order runs finished.
    std::deque<std::pair<std::string, std::uint64_t>> finished_;
    std::uint64_t next_generation_ = 1;
};

}  // namespace conductor::session
