#include "session/run_registry.hpp"
#include <utility>
#include "core/logging/logger.hpp"

namespace conductor::session {

using core::errors::ErrorCategory;
using core::errors::OrchestrationError;
using protocol::RunRequest;

RunRegistry::RunRegistry(const std::size_t retained_terminal_runs)
    : retained_terminal_runs_(retained_terminal_runs) {}

bool RunRegistry::is_terminal(const RunState state) {
    return state == RunState::Completed || state == RunState::Failed ||
           state == RunState::Cancelled;
}

std::string RunRegistry::to_string(const RunState state) {
    switch (state) {
        case RunState::Running:
            return "running";
        case RunState::Cancelling:
            return "cancelling";
        case RunState::Completed:
            return "completed";
        case RunState::Failed:
            return "failed";
        case RunState::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

core::errors::Result<std::shared_ptr<std::atomic_bool>> RunRegistry::start_run(
    const RunRequest& request, const std::size_t max_active_per_user) {
    if (request.run_id.empty() || request.user_id.empty() ||
        request.thread_id.empty()) {
        return OrchestrationError{ErrorCategory::Validation,
                                  "Run requires run_id, user_id and thread_id.",
                                  "invalid_run_request"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(request.run_id);
    if (it != runs_.end()) {
        if (it->second.user_id != request.user_id) {
            return OrchestrationError{ErrorCategory::Validation,
                                      "Run " + request.run_id +
                                          " belongs to another user.",
                                      "run_owner_mismatch"};
        }
        if (!is_terminal(it->second.state)) {
            return OrchestrationError{ErrorCategory::Validation,
                                      "Run is already active: " + request.run_id,
                                      "run_already_active"};
        }
    }

    if (max_active_per_user > 0) {
        const std::size_t active = active_count_locked(request.user_id);
        if (active >= max_active_per_user) {
            LOG_WARN("RunRegistry: user " + request.user_id + " is at its run limit (" +
                     std::to_string(active) + "/" +
                     std::to_string(max_active_per_user) + ")");
            return OrchestrationError{
                ErrorCategory::QuotaExceeded,
                "User " + request.user_id + " already has " + std::to_string(active) +
                    " active runs (limit " + std::to_string(max_active_per_user) + ").",
                "user_run_limit",
                "Wait for a running request to finish."};
        }
    }
    if (it != runs_.end()) {
        runs_.erase(it);
    }

    RunRecord record;
    record.run_id = request.run_id;
    record.user_id = request.user_id;
    record.thread_id = request.thread_id;
    record.state = RunState::Running;
    record.cancel_token = std::make_shared<std::atomic_bool>(false);
    record.generation = next_generation_++;
    auto token = record.cancel_token;
    runs_.emplace(request.run_id, std::move(record));
    LOG_DEBUG("RunRegistry: run " + request.run_id + " -> running");
    return token;
}

core::errors::Result<RunState> RunRegistry::cancel_run(const std::string& run_id,
                                                       const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        return OrchestrationError{ErrorCategory::Validation,
                                  "Run ID not found: " + run_id, "run_not_found"};
    }
    if (it->second.user_id != user_id) {
        LOG_WARN("RunRegistry: refused cancel of run " + run_id +
                 " from a user who does not own it");
        return OrchestrationError{ErrorCategory::Validation,
                                  "Run " + run_id + " belongs to another user.",
                                  "run_owner_mismatch"};
    }
    if (is_terminal(it->second.state)) {
        return OrchestrationError{ErrorCategory::Validation,
                                  "Run is already terminal: " +
                                      to_string(it->second.state),
                                  "invalid_state_transition"};
    }
    it->second.state = RunState::Cancelling;
    it->second.cancel_token->store(true);
    LOG_DEBUG("RunRegistry: run " + run_id + " -> cancelling");
    return it->second.state;
}

core::errors::Result<RunState> RunRegistry::mark_cancelled(const std::string& run_id) {
    return transition_to_terminal(run_id, RunState::Cancelled, std::nullopt);
}

core::errors::Result<RunState> RunRegistry::mark_completed(
    const std::string& run_id) {
    return transition_to_terminal(run_id, RunState::Completed, std::nullopt);
}

core::errors::Result<RunState> RunRegistry::mark_failed(
    const std::string& run_id, const std::string& reason) {
    return transition_to_terminal(run_id, RunState::Failed, reason);
}

core::errors::Result<RunState> RunRegistry::transition_to_terminal(
    const std::string& run_id, const RunState next_state,
    const std::optional<std::string>& failure_reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        return OrchestrationError{ErrorCategory::Validation,
                                  "Run ID not found: " + run_id, "run_not_found"};
    }

    if (is_terminal(it->second.state)) {
        return OrchestrationError{ErrorCategory::Validation,
                                  "Run is already terminal: " +
                                      to_string(it->second.state),
                                  "invalid_state_transition"};
    }

    const std::string prev = to_string(it->second.state);
    it->second.state = next_state;
    it->second.failure_reason = failure_reason;
    LOG_DEBUG("RunRegistry: run " + run_id + " transition " + prev + " -> " +
              to_string(next_state));
    finished_.emplace_back(run_id, it->second.generation);
    evict_finished_locked();
    return next_state;
}

void RunRegistry::evict_finished_locked() {
    // Every terminal record has one entry here; entries of records that were
    // reclaimed or pruned since are stale and skipped.
    while (finished_.size() > retained_terminal_runs_) {
        const auto [run_id, generation] = finished_.front();
        finished_.pop_front();
        const auto it = runs_.find(run_id);
        if (it != runs_.end() && it->second.generation == generation &&
            is_terminal(it->second.state)) {
            runs_.erase(it);
        }
    }
}

core::errors::Result<RunState> RunRegistry::get_run_state(
    const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        return OrchestrationError{ErrorCategory::Validation,
                                  "Run ID not found: " + run_id, "run_not_found"};
    }
    return it->second.state;
}

core::errors::Result<std::shared_ptr<std::atomic_bool>> RunRegistry::get_cancel_token(
    const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        return OrchestrationError{ErrorCategory::Validation,
                                  "Run ID not found: " + run_id, "run_not_found"};
    }
    return it->second.cancel_token;
}

bool RunRegistry::is_active(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    return it != runs_.end() && !is_terminal(it->second.state);
}

std::size_t RunRegistry::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& [id, record] : runs_) {
        if (!is_terminal(record.state)) {
            ++count;
        }
    }
    return count;
}

std::size_t RunRegistry::active_count(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_count_locked(user_id);
}

std::size_t RunRegistry::active_count_locked(const std::string& user_id) const {
    std::size_t count = 0;
    for (const auto& [id, record] : runs_) {
        if (record.user_id == user_id && !is_terminal(record.state)) {
            ++count;
        }
    }
    return count;
}

std::size_t RunRegistry::run_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runs_.size();
}

std::size_t RunRegistry::prune_terminal() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = runs_.begin(); it != runs_.end();) {
        if (is_terminal(it->second.state)) {
            it = runs_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    finished_.clear();
    return removed;
}

}  // namespace conductor::session
