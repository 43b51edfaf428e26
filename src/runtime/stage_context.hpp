#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/orchestration_errors.hpp"
#include "events/event_notifier.hpp"
#include "protocol/run_request.hpp"
#include "resources/resource_factory.hpp"

namespace conductor::runtime {

struct RunUsage {
    std::uint32_t stages_executed = 0;
    std::uint32_t tool_calls = 0;
};

// Per-run facilities lent to the run's resources while one stage executes.
struct RunScope {
    protocol::RunRequest identity;
    events::EventNotifier& notifier;
    resources::ResourceFactory& factory;
    std::optional<resources::ScopedHandle> lease;
    RunUsage usage;
    std::shared_ptr<std::atomic_bool> cancel_token;
    std::optional<std::chrono::steady_clock::time_point> deadline;
};

using ToolFunction =
    std::function<core::errors::Result<nlohmann::json>(const nlohmann::json&)>;

// What a stage may touch while it executes: progress events, paired tool
// events and the run's resource handle.
class StageContext {
public:
    StageContext(RunScope& scope, std::string stage_name);

    const std::string& stage_name() const { return stage_name_; }
    const protocol::RunRequest& identity() const { return scope_.identity; }

    void think(const std::string& thought);

    // Emits tool_executing, runs the tool, then always emits exactly one
    // matching tool_completed.
    core::errors::Result<nlohmann::json> run_tool(const std::string& tool_name,
                                                  const nlohmann::json& arguments,
                                                  const ToolFunction& tool);

    // The run's handle, acquired from the factory on first request.
    core::errors::Result<resources::ResourceHandle*> resource();

    // True once the run was cancelled or passed its deadline.
    bool should_stop() const;

private:
    RunScope& scope_;
    std::string stage_name_;
};

}  // namespace conductor::runtime
