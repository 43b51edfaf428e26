#include "app/channel_router.hpp"

#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"

namespace conductor::app {

using core::errors::ErrorCategory;
using core::errors::OrchestrationError;
using nlohmann::json;

namespace {

bool starts_run(const std::string& type) {
    return type == "user_message" || type == "chat_message" || type == "start_agent";
}

std::string message_text(const json& payload) {
    if (!payload.is_object()) {
        return "";
    }
    for (const char* key : {"content", "text"}) {
        const auto it = payload.find(key);
        if (it != payload.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return "";
}

}  // namespace

ChannelRouter::ChannelRouter(runtime::Orchestrator& orchestrator,
                             events::EventNotifier& notifier, std::string user_id,
                             std::string thread_id)
    : orchestrator_(orchestrator),
      notifier_(notifier),
      user_id_(std::move(user_id)),
      thread_id_(std::move(thread_id)) {}

void ChannelRouter::open() {
    notifier_.connection_established(thread_id_, user_id_);
    LOG_INFO("ChannelRouter: channel opened for user " + user_id_ + " on thread " +
             thread_id_);
}

void ChannelRouter::close() {
    notifier_.close_thread(thread_id_);
    LOG_INFO("ChannelRouter: channel closed for user " + user_id_ + " on thread " +
             thread_id_);
}

RouteResult ChannelRouter::handle_text(const std::string& text) {
    const json frame = json::parse(text, nullptr, false);
    if (frame.is_discarded()) {
        return reject("Frame is not valid JSON.");
    }
    return handle_frame(frame);
}

RouteResult ChannelRouter::handle_frame(const json& frame) {
    if (!frame.is_object()) {
        return reject("Frame must be a JSON object.");
    }
    const auto type_it = frame.find("type");
    if (type_it == frame.end() || !type_it->is_string() ||
        type_it->get<std::string>().empty()) {
        return reject("Frame is missing a message type.");
    }

    const std::string type = type_it->get<std::string>();
    const json payload = frame.value("payload", json::object());

    if (type == "ping") {
        notifier_.pong(thread_id_, payload);
        RouteResult result;
        result.action = FrameAction::Pong;
        return result;
    }
    if (starts_run(type)) {
        return start_run(payload);
    }

    LOG_DEBUG("ChannelRouter: echoing unhandled frame type " + type);
    notifier_.echo(thread_id_, frame);
    RouteResult result;
    result.action = FrameAction::Echo;
    return result;
}

RouteResult ChannelRouter::start_run(const json& payload) {
    const std::string text = message_text(payload);
    if (text.empty()) {
        return reject("Message has no content.");
    }

    std::string run_id = core::config::generate_run_id();
    if (payload.contains("run_id") && payload.at("run_id").is_string() &&
        !payload.at("run_id").get<std::string>().empty()) {
        run_id = payload.at("run_id").get<std::string>();
    }

    RouteResult result;
    result.action = FrameAction::RunExecuted;
    auto ran = orchestrator_.run(text, thread_id_, user_id_, run_id);
    if (core::errors::is_error(ran)) {
        const auto& err = core::errors::get_error(ran);
        LOG_WARN("ChannelRouter: run " + run_id + " rejected [" + err.code + "]: " +
                 err.message);
        notifier_.error(thread_id_, run_id, err);
        result.error = err;
        return result;
    }
    result.state = core::errors::take_value(std::move(ran));
    return result;
}

RouteResult ChannelRouter::reject(const std::string& reason) {
    OrchestrationError err{ErrorCategory::Validation, reason, "invalid_frame"};
    notifier_.error(thread_id_, "", err);
    RouteResult result;
    result.action = FrameAction::Rejected;
    result.error = std::move(err);
    return result;
}

std::string ChannelRouter::to_string(const FrameAction action) {
    switch (action) {
        case FrameAction::Pong:
            return "pong";
        case FrameAction::RunExecuted:
            return "run_executed";
        case FrameAction::Echo:
            return "echo";
        case FrameAction::Rejected:
            return "rejected";
        default:
            return "unknown";
    }
}

}  // namespace conductor::app
