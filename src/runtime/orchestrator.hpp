#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/config/app_config.hpp"
#include "core/errors/orchestration_errors.hpp"
#include "events/event_notifier.hpp"
#include "protocol/request_state.hpp"
#include "protocol/run_request.hpp"
#include "resources/resource_factory.hpp"
#include "runtime/stage.hpp"
#include "runtime/stage_context.hpp"
#include "session/run_registry.hpp"
#include "session/state_store_bridge.hpp"

namespace conductor::runtime {

struct OrchestratorStats {
    std::uint64_t runs_started = 0;
    std::uint64_t runs_completed = 0;
    std::uint64_t runs_failed = 0;
    std::uint64_t runs_timed_out = 0;
    std::uint64_t stage_retries = 0;
    std::uint64_t checkpoint_failures = 0;
};

struct UserRunStats {
    std::uint64_t runs_started = 0;
    std::uint64_t runs_completed = 0;
    std::uint64_t runs_failed = 0;
    std::uint64_t runs_timed_out = 0;
    std::uint64_t runs_rejected = 0;  // over the per-user run cap
    std::size_t runs_active = 0;
};

// Sequences the fixed stage pipeline over one RequestState per run:
//   INIT -> for each stage: CHECK_ENTRY -> (skip) | EXECUTING -> CHECKPOINT
//        -> COMPLETED | FAILED
// Stage failures, notifier drops and checkpoint errors stay inside the run;
// run() only returns an error when the run could not be started.
class Orchestrator {
public:
    Orchestrator(StagePipeline pipeline, events::EventNotifier& notifier,
                 session::StateStoreBridge& bridge,
                 resources::ResourceFactory& factory, session::RunRegistry& registry,
                 core::config::OrchestratorConfig config = {});

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    core::errors::Result<protocol::RequestState> run(const std::string& user_request,
                                                     const std::string& thread_id,
                                                     const std::string& user_id,
                                                     const std::string& run_id);

    core::errors::Result<protocol::RequestState> run(
        const protocol::RunRequest& request, const protocol::RunOptions& options = {});

    // Cooperative: the run stops at its next stage boundary or retry. Only
    // the owning user may cancel.
    core::errors::Result<session::RunState> cancel(const std::string& run_id,
                                                   const std::string& user_id);

    std::vector<std::string> stage_names() const { return pipeline_.names(); }
    OrchestratorStats stats() const;
    UserRunStats user_stats(const std::string& user_id) const;

private:
    struct StageOutcome {
        core::errors::Result<protocol::RequestState> result;
        std::uint32_t attempts = 0;
    };

    core::errors::Result<protocol::RequestState> load_or_create(
        const protocol::RunRequest& request, bool& resumed);
    protocol::RequestState execute_pipeline(protocol::RequestState state,
                                            RunScope& scope, bool resumed);
    StageOutcome execute_stage(const StagePipeline::Entry& entry,
                               const protocol::RequestState& state, RunScope& scope);
    std::optional<core::errors::OrchestrationError> interruption(
        const RunScope& scope) const;
    void checkpoint(protocol::RequestState& state);
    void finish(const protocol::RequestState& state, const RunScope& scope,
                std::chrono::steady_clock::time_point started_at,
                std::uint64_t resource_operations);
    std::chrono::milliseconds retry_backoff(std::uint32_t attempts_made) const;

    enum class UserEvent { Started, Completed, Failed, TimedOut, Rejected };
    void count_user_event(const std::string& user_id, UserEvent event);

    StagePipeline pipeline_;
    events::EventNotifier& notifier_;
    session::StateStoreBridge& bridge_;
    resources::ResourceFactory& factory_;
    session::RunRegistry& registry_;
    core::config::OrchestratorConfig config_;

    std::atomic<std::uint64_t> runs_started_{0};
    std::atomic<std::uint64_t> runs_completed_{0};
    std::atomic<std::uint64_t> runs_failed_{0};
    std::atomic<std::uint64_t> runs_timed_out_{0};
    std::atomic<std::uint64_t> stage_retries_{0};
    std::atomic<std::uint64_t> checkpoint_failures_{0};

    mutable std::mutex user_stats_mutex_;
    std::unordered_map<std::string, UserRunStats> user_stats_;
};

}  // namespace conductor::runtime
