#include "runtime/orchestrator.hpp"

#include <algorithm>
#include <exception>
#include <thread>
#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"

namespace conductor::runtime {

using core::errors::ErrorCategory;
using core::errors::OrchestrationError;
using nlohmann::json;
using protocol::RequestState;
using protocol::RequestStatus;
using protocol::RunRequest;

namespace {

bool same_identity(const RequestState& lhs, const RequestState& rhs) {
    return lhs.user_id == rhs.user_id && lhs.thread_id == rhs.thread_id &&
           lhs.run_id == rhs.run_id && lhs.user_request == rhs.user_request;
}

// Stages own stage_results only; lifecycle fields stay with the orchestrator.
RequestState commit_stage_result(const RequestState& before, RequestState after) {
    after.status = before.status;
    after.created_at = before.created_at;
    after.execution_order = before.execution_order;
    after.stage_failures = before.stage_failures;
    after.failure_reason = before.failure_reason;
    return after;
}

void log_registry_failure(const core::errors::Result<session::RunState>& result,
                          const std::string& run_id) {
    if (core::errors::is_error(result)) {
        LOG_WARN("Orchestrator: registry update failed for run " + run_id + ": " +
                 core::errors::get_error(result).message);
    }
}

}  // namespace

Orchestrator::Orchestrator(StagePipeline pipeline, events::EventNotifier& notifier,
                           session::StateStoreBridge& bridge,
                           resources::ResourceFactory& factory,
                           session::RunRegistry& registry,
                           core::config::OrchestratorConfig config)
    : pipeline_(std::move(pipeline)),
      notifier_(notifier),
      bridge_(bridge),
      factory_(factory),
      registry_(registry),
      config_(std::move(config)) {}

core::errors::Result<RequestState> Orchestrator::run(const std::string& user_request,
                                                     const std::string& thread_id,
                                                     const std::string& user_id,
                                                     const std::string& run_id) {
    RunRequest request;
    request.user_request = user_request;
    request.thread_id = thread_id;
    request.user_id = user_id;
    request.run_id = run_id;
    return run(request);
}

core::errors::Result<RequestState> Orchestrator::run(const RunRequest& request,
                                                     const protocol::RunOptions& options) {
    if (request.user_id.empty() || request.thread_id.empty() ||
        request.run_id.empty()) {
        return OrchestrationError{ErrorCategory::Validation,
                                  "Run requires user_id, thread_id and run_id.",
                                  "invalid_run_request"};
    }
    if (request.user_request.empty()) {
        return OrchestrationError{ErrorCategory::Validation,
                                  "User request cannot be empty.", "empty_request"};
    }

    auto claimed = registry_.start_run(request, config_.max_concurrent_runs_per_user);
    if (core::errors::is_error(claimed)) {
        const auto& err = core::errors::get_error(claimed);
        if (err.category == ErrorCategory::QuotaExceeded) {
            count_user_event(request.user_id, UserEvent::Rejected);
        }
        return err;
    }

    bool resumed = false;
    auto loaded = load_or_create(request, resumed);
    if (core::errors::is_error(loaded)) {
        const auto& err = core::errors::get_error(loaded);
        log_registry_failure(registry_.mark_failed(request.run_id, err.message),
                             request.run_id);
        return err;
    }
    RequestState state = core::errors::take_value(std::move(loaded));

    if (state.status == RequestStatus::Completed) {
        LOG_INFO("Orchestrator: run " + request.run_id +
                 " already completed, returning stored state");
        log_registry_failure(registry_.mark_completed(request.run_id), request.run_id);
        return state;
    }

    std::optional<std::chrono::steady_clock::time_point> deadline = options.deadline;
    if (!deadline.has_value() && config_.run_timeout_ms > 0) {
        deadline = std::chrono::steady_clock::now() +
                   std::chrono::milliseconds(config_.run_timeout_ms);
    }

    RunScope scope{request, notifier_, factory_, std::nullopt, RunUsage{},
                   core::errors::get_value(claimed), deadline};
    ++runs_started_;
    count_user_event(request.user_id, UserEvent::Started);
    try {
        return execute_pipeline(std::move(state), scope, resumed);
    } catch (const std::exception& e) {
        // The run still ends terminal so its run_id can be claimed again.
        scope.lease.reset();
        ++runs_failed_;
        count_user_event(request.user_id, UserEvent::Failed);
        OrchestrationError err{ErrorCategory::Internal,
                               "Run " + request.run_id + " aborted: " + e.what(),
                               "run_aborted"};
        LOG_ERROR("Orchestrator: " + err.message);
        notifier_.error(request.thread_id, request.run_id, err);
        json payload;
        payload["status"] = protocol::to_string(RequestStatus::Failed);
        payload["failure_reason"] = err.message;
        notifier_.agent_completed(request.thread_id, request.run_id, std::move(payload));
        log_registry_failure(registry_.mark_failed(request.run_id, err.message),
                             request.run_id);
        return err;
    }
}

core::errors::Result<session::RunState> Orchestrator::cancel(const std::string& run_id,
                                                             const std::string& user_id) {
    LOG_INFO("Orchestrator: cancellation requested for run " + run_id);
    return registry_.cancel_run(run_id, user_id);
}

core::errors::Result<RequestState> Orchestrator::load_or_create(const RunRequest& request,
                                                                bool& resumed) {
    auto loaded = bridge_.load(request.run_id);
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    const auto& stored = core::errors::get_value(loaded);
    if (stored.has_value()) {
        if (stored->user_id != request.user_id) {
            LOG_WARN("Orchestrator: run " + request.run_id +
                     " requested by a user who does not own it");
            return OrchestrationError{ErrorCategory::Validation,
                                      "Run " + request.run_id +
                                          " belongs to another user.",
                                      "run_owner_mismatch"};
        }
        if (stored->thread_id != request.thread_id) {
            return OrchestrationError{ErrorCategory::Validation,
                                      "Run " + request.run_id +
                                          " belongs to another thread.",
                                      "run_thread_mismatch"};
        }
        resumed = true;
        LOG_INFO("Orchestrator: resuming run " + request.run_id + " after " +
                 std::to_string(stored->execution_order.size()) +
                 " completed stage(s)");
        return stored.value();
    }

    RequestState state;
    state.user_id = request.user_id;
    state.thread_id = request.thread_id;
    state.run_id = request.run_id;
    state.user_request = request.user_request;
    state.status = RequestStatus::Pending;
    state.created_at = core::config::now_unix_ms();
    state.updated_at = state.created_at;
    return state;
}

std::optional<OrchestrationError> Orchestrator::interruption(const RunScope& scope) const {
    if (scope.cancel_token && scope.cancel_token->load()) {
        return OrchestrationError{ErrorCategory::Timeout,
                                  "Run " + scope.identity.run_id + " was cancelled.",
                                  "run_cancelled"};
    }
    if (scope.deadline.has_value() &&
        std::chrono::steady_clock::now() >= scope.deadline.value()) {
        return OrchestrationError{ErrorCategory::Timeout,
                                  "Run " + scope.identity.run_id +
                                      " exceeded its deadline.",
                                  "run_timeout",
                                  "Retry with a simpler request or a longer deadline."};
    }
    return std::nullopt;
}

void Orchestrator::checkpoint(RequestState& state) {
    state.updated_at = core::config::now_unix_ms();
    auto saved = bridge_.save(state.run_id, state.thread_id, state.user_id, state);
    if (core::errors::is_error(saved)) {
        ++checkpoint_failures_;
        LOG_WARN("Orchestrator: checkpoint failed for run " + state.run_id + ": " +
                 core::errors::get_error(saved).message);
    }
}

Orchestrator::StageOutcome Orchestrator::execute_stage(const StagePipeline::Entry& entry,
                                                       const RequestState& state,
                                                       RunScope& scope) {
    StageOutcome outcome{OrchestrationError{ErrorCategory::Internal,
                                            "Stage did not run.", "stage_not_run"},
                         0};
    const std::uint32_t max_attempts =
        std::min(config_.max_retries, core::config::OrchestratorConfig::kMaxRetries) + 1;

    while (outcome.attempts < max_attempts) {
        if (outcome.attempts > 0) {
            if (auto stop = interruption(scope)) {
                outcome.result = stop.value();
                return outcome;
            }
            ++stage_retries_;
            const auto backoff = retry_backoff(outcome.attempts);
            LOG_WARN("Orchestrator: retrying stage " + entry.name + " for run " +
                     state.run_id + " (attempt " +
                     std::to_string(outcome.attempts + 1) + "/" +
                     std::to_string(max_attempts) + ")");
            std::this_thread::sleep_for(backoff);
        }
        ++outcome.attempts;

        StageContext context(scope, entry.name);
        core::errors::Result<RequestState> result = OrchestrationError{
            ErrorCategory::Internal, "Stage produced no result.", "stage_not_run"};
        try {
            result = entry.stage->execute(state, context);
        } catch (const std::exception& e) {
            result = OrchestrationError{ErrorCategory::StageExecution,
                                        "Stage " + entry.name + " threw: " + e.what(),
                                        "stage_threw"};
        }

        if (!core::errors::is_error(result)) {
            if (!same_identity(state, core::errors::get_value(result))) {
                outcome.result = OrchestrationError{
                    ErrorCategory::StageExecution,
                    "Stage " + entry.name + " changed the run identity.",
                    "stage_mutated_identity"};
                return outcome;
            }
            outcome.result =
                commit_stage_result(state, core::errors::take_value(std::move(result)));
            return outcome;
        }

        outcome.result = core::errors::get_error(result);
        const auto& err = core::errors::get_error(outcome.result);
        LOG_WARN("Orchestrator: stage " + entry.name + " failed for run " +
                 state.run_id + " [" + err.code + "]: " + err.message);
        if (!core::errors::is_transient(err.category)) {
            return outcome;
        }
    }
    return outcome;
}

RequestState Orchestrator::execute_pipeline(RequestState state, RunScope& scope,
                                            const bool resumed) {
    const auto started_at = std::chrono::steady_clock::now();
    const std::string& run_id = scope.identity.run_id;
    const std::string& thread_id = scope.identity.thread_id;

    json started_payload;
    started_payload["user_request"] = state.user_request;
    started_payload["stages"] = pipeline_.names();
    started_payload["resumed"] = resumed;
    notifier_.agent_started(thread_id, run_id, std::move(started_payload));

    state.status = RequestStatus::Running;
    state.failure_reason.reset();
    checkpoint(state);
    LOG_INFO("Orchestrator: run " + run_id + " started for user " + state.user_id);

    for (const auto& entry : pipeline_.entries()) {
        if (state.has_completed(entry.name)) {
            continue;
        }
        if (auto stop = interruption(scope)) {
            notifier_.error(thread_id, run_id, stop.value(), json{{"stage", entry.name}});
            state.status = RequestStatus::Failed;
            state.failure_reason = stop->message;
            break;
        }

        bool enter = false;
        try {
            enter = entry.stage->check_entry_conditions(state);
        } catch (const std::exception& e) {
            LOG_WARN("Orchestrator: entry check of stage " + entry.name +
                     " threw: " + e.what());
        }
        if (!enter) {
            LOG_DEBUG("Orchestrator: skipping stage " + entry.name + " for run " + run_id);
            continue;
        }

        notifier_.agent_thinking(thread_id, run_id, "Running stage " + entry.name,
                                 entry.name);
        auto outcome = execute_stage(entry, state, scope);

        if (!core::errors::is_error(outcome.result)) {
            state = core::errors::take_value(std::move(outcome.result));
            state.execution_order.push_back(entry.name);
            state.stage_failures.erase(entry.name);
            ++scope.usage.stages_executed;
            checkpoint(state);
            continue;
        }

        const auto err = core::errors::get_error(outcome.result);
        json details;
        details["stage"] = entry.name;
        details["attempts"] = outcome.attempts;
        notifier_.error(thread_id, run_id, err, std::move(details));

        if (err.category == ErrorCategory::Timeout) {
            state.status = RequestStatus::Failed;
            state.failure_reason = err.message;
            break;
        }

        state.stage_failures[entry.name] = err.message;
        if (config_.halts_on_failure(entry.name)) {
            state.status = RequestStatus::Failed;
            state.failure_reason = "Stage '" + entry.name + "' failed after " +
                                   std::to_string(outcome.attempts) +
                                   " attempt(s): " + err.message;
            LOG_ERROR("Orchestrator: run " + run_id + " halted at stage " + entry.name);
            break;
        }
        LOG_WARN("Orchestrator: run " + run_id + " continues past failed stage " +
                 entry.name);
        checkpoint(state);
    }

    if (state.status == RequestStatus::Running) {
        state.status = RequestStatus::Completed;
    }

    std::uint64_t resource_operations = 0;
    if (scope.lease.has_value()) {
        resource_operations = scope.lease->get().operation_count();
        scope.lease.reset();
    }

    checkpoint(state);
    finish(state, scope, started_at, resource_operations);
    return state;
}

void Orchestrator::finish(const RequestState& state, const RunScope& scope,
                          const std::chrono::steady_clock::time_point started_at,
                          const std::uint64_t resource_operations) {
    const std::string& run_id = scope.identity.run_id;
    const auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - started_at)
                                 .count();

    json usage;
    usage["stages_executed"] = scope.usage.stages_executed;
    usage["tool_calls"] = scope.usage.tool_calls;
    usage["resource_operations"] = resource_operations;
    usage["duration_ms"] = duration_ms;

    json results = json::object();
    for (const auto& [stage, result] : state.stage_results) {
        results[stage] = result;
    }

    json payload;
    payload["status"] = protocol::to_string(state.status);
    payload["execution_order"] = state.execution_order;
    payload["stage_results"] = results;
    payload["stage_failures"] = state.stage_failures;
    if (state.failure_reason.has_value()) {
        payload["failure_reason"] = state.failure_reason.value();
    }
    payload["usage"] = usage;
    notifier_.agent_completed(scope.identity.thread_id, run_id, std::move(payload));

    const bool cancelled = scope.cancel_token && scope.cancel_token->load();
    const std::string& user_id = scope.identity.user_id;
    if (state.status == RequestStatus::Completed) {
        ++runs_completed_;
        count_user_event(user_id, UserEvent::Completed);
        log_registry_failure(registry_.mark_completed(run_id), run_id);
        LOG_INFO("Orchestrator: run " + run_id + " completed in " +
                 std::to_string(duration_ms) + " ms (" +
                 std::to_string(state.execution_order.size()) + " stage(s))");
        return;
    }

    ++runs_failed_;
    count_user_event(user_id, UserEvent::Failed);
    const bool timed_out = cancelled || (scope.deadline.has_value() &&
                                         std::chrono::steady_clock::now() >=
                                             scope.deadline.value());
    if (timed_out) {
        ++runs_timed_out_;
        count_user_event(user_id, UserEvent::TimedOut);
    }
    if (cancelled) {
        log_registry_failure(registry_.mark_cancelled(run_id), run_id);
    } else {
        log_registry_failure(
            registry_.mark_failed(run_id, state.failure_reason.value_or("run failed")),
            run_id);
    }
    LOG_ERROR("Orchestrator: run " + run_id + " failed: " +
              state.failure_reason.value_or("unknown reason"));
}

std::chrono::milliseconds Orchestrator::retry_backoff(
    const std::uint32_t attempts_made) const {
    constexpr std::uint32_t kMaxShift = 20;
    const std::uint32_t shift = std::min(attempts_made - 1, kMaxShift);
    const std::uint64_t delay =
        static_cast<std::uint64_t>(config_.retry_backoff_ms) << shift;
    return std::chrono::milliseconds(std::min<std::uint64_t>(
        delay, core::config::OrchestratorConfig::kMaxRetryBackoffMs));
}

void Orchestrator::count_user_event(const std::string& user_id, const UserEvent event) {
    std::lock_guard<std::mutex> lock(user_stats_mutex_);
    auto& stats = user_stats_[user_id];
    switch (event) {
        case UserEvent::Started:
            ++stats.runs_started;
            break;
        case UserEvent::Completed:
            ++stats.runs_completed;
            break;
        case UserEvent::Failed:
            ++stats.runs_failed;
            break;
        case UserEvent::TimedOut:
            ++stats.runs_timed_out;
            break;
        case UserEvent::Rejected:
            ++stats.runs_rejected;
            break;
    }
}

UserRunStats Orchestrator::user_stats(const std::string& user_id) const {
    UserRunStats stats;
    {
        std::lock_guard<std::mutex> lock(user_stats_mutex_);
        const auto it = user_stats_.find(user_id);
        if (it != user_stats_.end()) {
            stats = it->second;
        }
    }
    stats.runs_active = registry_.active_count(user_id);
    return stats;
}

OrchestratorStats Orchestrator::stats() const {
    OrchestratorStats stats;
    stats.runs_started = runs_started_.load();
    stats.runs_completed = runs_completed_.load();
    stats.runs_failed = runs_failed_.load();
    stats.runs_timed_out = runs_timed_out_.load();
    stats.stage_retries = stage_retries_.load();
    stats.checkpoint_failures = checkpoint_failures_.load();
    return stats;
}

}  // namespace conductor::runtime
