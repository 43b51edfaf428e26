#include "runtime/stage_context.hpp"

#include <exception>
#include <utility>
#include "core/config/ids.hpp"

namespace conductor::runtime {

using core::errors::ErrorCategory;
using core::errors::OrchestrationError;
using nlohmann::json;

StageContext::StageContext(RunScope& scope, std::string stage_name)
    : scope_(scope), stage_name_(std::move(stage_name)) {}

void StageContext::think(const std::string& thought) {
    scope_.notifier.agent_thinking(scope_.identity.thread_id, scope_.identity.run_id,
                                   thought, stage_name_);
}

core::errors::Result<json> StageContext::run_tool(const std::string& tool_name,
                                                  const json& arguments,
                                                  const ToolFunction& tool) {
    protocol::ToolCall call;
    call.id = core::config::generate_id("tool");
    call.name = tool_name;
    call.arguments = arguments;
    scope_.notifier.tool_executing(scope_.identity.thread_id, scope_.identity.run_id,
                                   call);
    ++scope_.usage.tool_calls;

    const auto started = std::chrono::steady_clock::now();
    core::errors::Result<json> outcome = OrchestrationError{
        ErrorCategory::StageExecution, "Tool " + tool_name + " is not callable.",
        "tool_unavailable"};
    if (tool) {
        try {
            outcome = tool(arguments);
        } catch (const std::exception& e) {
            outcome = OrchestrationError{ErrorCategory::StageExecution,
                                         "Tool " + tool_name + " threw: " + e.what(),
                                         "tool_threw"};
        }
    }

    protocol::ToolResult result;
    result.tool_call_id = call.id;
    result.duration_ms = std::chrono::duration<double, std::milli>(
                             std::chrono::steady_clock::now() - started)
                             .count();
    if (core::errors::is_error(outcome)) {
        result.success = false;
        result.error_message = core::errors::get_error(outcome).message;
    } else {
        result.success = true;
        result.output = core::errors::get_value(outcome);
    }
    scope_.notifier.tool_completed(scope_.identity.thread_id, scope_.identity.run_id,
                                   call, result);
    return outcome;
}

core::errors::Result<resources::ResourceHandle*> StageContext::resource() {
    if (scope_.lease.has_value() && !scope_.lease->get().is_released()) {
        return &scope_.lease->get();
    }
    // A reclaimed lease is dropped and replaced.
    scope_.lease.reset();

    auto acquired = resources::ScopedHandle::acquire(
        scope_.factory, scope_.identity.user_id, scope_.identity.run_id,
        scope_.identity.thread_id);
    if (core::errors::is_error(acquired)) {
        return core::errors::get_error(acquired);
    }
    scope_.lease.emplace(core::errors::take_value(std::move(acquired)));
    return &scope_.lease->get();
}

bool StageContext::should_stop() const {
    if (scope_.cancel_token && scope_.cancel_token->load()) {
        return true;
    }
    return scope_.deadline.has_value() &&
           std::chrono::steady_clock::now() >= scope_.deadline.value();
}

}  // namespace conductor::runtime
