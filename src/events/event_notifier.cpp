#include "events/event_notifier.hpp"

#include <chrono>
#include <exception>
#include <thread>
#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"

namespace conductor::events {

using core::errors::ErrorCategory;
using core::errors::OrchestrationError;
using nlohmann::json;
using protocol::Event;
using protocol::EventType;

namespace {

Event make_event(const EventType type, const std::string& run_id, json payload) {
    Event event;
    event.type = type;
    event.run_id = run_id;
    event.payload = std::move(payload);
    return event;
}

}  // namespace

EventNotifier::EventNotifier(Transport& transport, core::config::NotifierConfig config)
    : transport_(transport), config_(std::move(config)) {
    if (config_.max_send_attempts == 0) {
        config_.max_send_attempts = 1;
    }
}

std::shared_ptr<EventNotifier::ThreadChannel> EventNotifier::channel_for(
    const std::string& thread_id) {
    std::lock_guard<std::mutex> lock(channels_mutex_);
    auto& channel = channels_[thread_id];
    if (!channel) {
        channel = std::make_shared<ThreadChannel>();
    }
    return channel;
}

DeliveryReport EventNotifier::emit(const std::string& thread_id, Event event) {
    DeliveryReport report;
    event.thread_id = thread_id;
    if (event.timestamp == 0) {
        event.timestamp = core::config::now_unix_ms();
    }

    auto channel = channel_for(thread_id);
    // Sequence assignment and hand-off happen under the thread's lock so
    // frames leave in generation order.
    std::lock_guard<std::mutex> lock(channel->mutex);
    event.sequence_number = channel->next_sequence++;
    report.sequence_number = event.sequence_number;
    ++emitted_;

    // Invalid UTF-8 from user text or stage output becomes U+FFFD.
    const std::string frame =
        protocol::to_json(event).dump(-1, ' ', false, json::error_handler_t::replace);
    const std::string type_name = protocol::to_string(event.type);
    const std::uint32_t max_attempts =
        protocol::is_critical(event.type) ? config_.max_send_attempts : 1;

    while (report.attempts < max_attempts) {
        if (report.attempts > 0) {
            ++retries_;
            std::this_thread::sleep_for(
                std::chrono::milliseconds(config_.retry_delay_ms));
        }
        ++report.attempts;

        if (!transport_.is_connected(thread_id)) {
            report.error = OrchestrationError{ErrorCategory::Connection,
                                              "No live connection for thread " +
                                                  thread_id,
                                              "transport_disconnected"};
            break;
        }

        core::errors::Status sent = core::errors::ok();
        try {
            sent = transport_.send(thread_id, frame);
        } catch (const std::exception& e) {
            sent = OrchestrationError{ErrorCategory::Connection,
                                      std::string("Transport threw: ") + e.what(),
                                      "transport_error"};
        }
        if (!core::errors::is_error(sent)) {
            report.delivered = true;
            report.error.reset();
            break;
        }
        report.error = core::errors::get_error(sent);
    }

    if (report.delivered) {
        ++delivered_;
    } else {
        ++failed_;
        LOG_WARN("EventNotifier: dropped " + type_name + " #" +
                 std::to_string(event.sequence_number) + " for thread " + thread_id +
                 " after " + std::to_string(report.attempts) + " attempt(s): " +
                 (report.error.has_value() ? report.error->message : "unknown"));
    }
    return report;
}

DeliveryReport EventNotifier::agent_started(const std::string& thread_id,
                                            const std::string& run_id,
                                            json payload) {
    return emit(thread_id, make_event(EventType::AgentStarted, run_id, std::move(payload)));
}

DeliveryReport EventNotifier::agent_thinking(const std::string& thread_id,
                                             const std::string& run_id,
                                             const std::string& thought,
                                             const std::string& stage_name) {
    json payload;
    payload["thought"] = thought;
    payload["stage"] = stage_name;
    return emit(thread_id, make_event(EventType::AgentThinking, run_id, std::move(payload)));
}

DeliveryReport EventNotifier::tool_executing(const std::string& thread_id,
                                             const std::string& run_id,
                                             const protocol::ToolCall& call) {
    json payload;
    payload["tool_name"] = call.name;
    payload["tool_call_id"] = call.id;
    payload["arguments"] = call.arguments;
    return emit(thread_id, make_event(EventType::ToolExecuting, run_id, std::move(payload)));
}

DeliveryReport EventNotifier::tool_completed(const std::string& thread_id,
                                             const std::string& run_id,
                                             const protocol::ToolCall& call,
                                             const protocol::ToolResult& result) {
    json payload;
    payload["tool_name"] = call.name;
    payload["tool_call_id"] = call.id;
    payload["success"] = result.success;
    payload["result"] = result.output;
    payload["duration_ms"] = result.duration_ms;
    if (!result.error_message.empty()) {
        payload["error"] = result.error_message;
    }
    return emit(thread_id, make_event(EventType::ToolCompleted, run_id, std::move(payload)));
}

DeliveryReport EventNotifier::agent_completed(const std::string& thread_id,
                                              const std::string& run_id,
                                              json payload) {
    return emit(thread_id,
                make_event(EventType::AgentCompleted, run_id, std::move(payload)));
}

DeliveryReport EventNotifier::error(const std::string& thread_id,
                                    const std::string& run_id,
                                    const OrchestrationError& error, json details) {
    json payload = details.is_object() ? std::move(details) : json::object();
    payload["category"] = core::errors::to_string(error.category);
    payload["code"] = error.code;
    payload["message"] = error.message;
    if (!error.hint.empty()) {
        payload["hint"] = error.hint;
    }
    return emit(thread_id, make_event(EventType::Error, run_id, std::move(payload)));
}

DeliveryReport EventNotifier::connection_established(const std::string& thread_id,
                                                     const std::string& user_id) {
    json payload;
    payload["user_id"] = user_id;
    return emit(thread_id,
                make_event(EventType::ConnectionEstablished, "", std::move(payload)));
}

DeliveryReport EventNotifier::pong(const std::string& thread_id, json payload) {
    return emit(thread_id, make_event(EventType::Pong, "", std::move(payload)));
}

DeliveryReport EventNotifier::echo(const std::string& thread_id, json frame) {
    return emit(thread_id, make_event(EventType::Echo, "", std::move(frame)));
}

NotifierStats EventNotifier::stats() const {
    NotifierStats stats;
    stats.emitted = emitted_.load();
    stats.delivered = delivered_.load();
    stats.failed = failed_.load();
    stats.retries = retries_.load();
    return stats;
}

bool EventNotifier::close_thread(const std::string& thread_id) {
    std::lock_guard<std::mutex> lock(channels_mutex_);
    return channels_.erase(thread_id) > 0;
}

std::size_t EventNotifier::channel_count() const {
    std::lock_guard<std::mutex> lock(channels_mutex_);
    return channels_.size();
}

std::uint64_t EventNotifier::last_sequence(const std::string& thread_id) const {
    std::shared_ptr<ThreadChannel> channel;
    {
        std::lock_guard<std::mutex> lock(channels_mutex_);
        const auto it = channels_.find(thread_id);
        if (it == channels_.end()) {
            return 0;
        }
        channel = it->second;
    }
    std::lock_guard<std::mutex> lock(channel->mutex);
    return channel->next_sequence - 1;
}

}  // namespace conductor::events
