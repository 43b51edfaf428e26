#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "events/event_notifier.hpp"
#include "protocol/request_state.hpp"
#include "runtime/orchestrator.hpp"

namespace conductor::app {

enum class FrameAction {
    Pong,
    RunExecuted,
    Echo,
    Rejected
};

struct RouteResult {
    FrameAction action = FrameAction::Rejected;
    std::optional<protocol::RequestState> state;
    std::optional<core::errors::OrchestrationError> error;
};

// One authenticated (user, thread) channel. Runs started from a frame execute
// on the calling thread.
class ChannelRouter {
public:
    ChannelRouter(runtime::Orchestrator& orchestrator, events::EventNotifier& notifier,
                  std::string user_id, std::string thread_id);

    // Emits connection_established.
    void open();
    // Drops the thread's notifier channel once the client is gone.
    void close();

    RouteResult handle_text(const std::string& text);
    RouteResult handle_frame(const nlohmann::json& frame);

    static std::string to_string(FrameAction action);

private:
    RouteResult reject(const std::string& reason);
    RouteResult start_run(const nlohmann::json& payload);

    runtime::Orchestrator& orchestrator_;
    events::EventNotifier& notifier_;
    const std::string user_id_;
    const std::string thread_id_;
};

}  // namespace conductor::app
