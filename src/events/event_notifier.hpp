#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "core/config/app_config.hpp"
#include "core/errors/orchestration_errors.hpp"
#include "events/transport.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace conductor::events {

struct DeliveryReport {
    bool delivered = false;
    std::uint32_t attempts = 0;
    std::uint64_t sequence_number = 0;
    std::optional<core::errors::OrchestrationError> error;
};

struct NotifierStats {
    std::uint64_t emitted = 0;
    std::uint64_t delivered = 0;
    std::uint64_t failed = 0;
    std::uint64_t retries = 0;
};

// Turns orchestration transitions into an ordered, typed event stream per
// thread. emit() never throws and never blocks on another thread's channel.
class EventNotifier {
public:
    explicit EventNotifier(Transport& transport,
                           core::config::NotifierConfig config = {});

    EventNotifier(const EventNotifier&) = delete;
    EventNotifier& operator=(const EventNotifier&) = delete;

    DeliveryReport emit(const std::string& thread_id, protocol::Event event);

    DeliveryReport agent_started(const std::string& thread_id,
                                 const std::string& run_id,
                                 nlohmann::json payload);
    DeliveryReport agent_thinking(const std::string& thread_id,
                                  const std::string& run_id,
                                  const std::string& thought,
                                  const std::string& stage_name);
    DeliveryReport tool_executing(const std::string& thread_id,
                                  const std::string& run_id,
                                  const protocol::ToolCall& call);
    DeliveryReport tool_completed(const std::string& thread_id,
                                  const std::string& run_id,
                                  const protocol::ToolCall& call,
                                  const protocol::ToolResult& result);
    DeliveryReport agent_completed(const std::string& thread_id,
                                   const std::string& run_id,
                                   nlohmann::json payload);
    DeliveryReport error(const std::string& thread_id, const std::string& run_id,
                         const core::errors::OrchestrationError& error,
                         nlohmann::json details = nlohmann::json::object());
    DeliveryReport connection_established(const std::string& thread_id,
                                          const std::string& user_id);
    DeliveryReport pong(const std::string& thread_id, nlohmann::json payload);
    DeliveryReport echo(const std::string& thread_id, nlohmann::json frame);

    NotifierStats stats() const;
    // Forgets the thread's sequence counter once its channel is gone. A later
    // emit on the same thread starts again at sequence 1.
    bool close_thread(const std::string& thread_id);
    std::size_t channel_count() const;

    // Last sequence number handed out on the thread, 0 if none.
    std::uint64_t last_sequence(const std::string& thread_id) const;

private:
    struct ThreadChannel {
        std::mutex mutex;
        std::uint64_t next_sequence = 1;
    };

    std::shared_ptr<ThreadChannel> channel_for(const std::string& thread_id);

    Transport& transport_;
    core::config::NotifierConfig config_;

    mutable std::mutex channels_mutex_;
    std::unordered_map<std::string, std::shared_ptr<ThreadChannel>> channels_;

    std::atomic<std::uint64_t> emitted_{0};
    std::atomic<std::uint64_t> delivered_{0};
    std::atomic<std::uint64_t> failed_{0};
    std::atomic<std::uint64_t> retries_{0};
};

}  // namespace conductor::events
