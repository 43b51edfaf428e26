#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/app_config.hpp"
#include "events/event_notifier.hpp"
#include "events/transport.hpp"
#include "protocol/tool_contract.hpp"

namespace {

using conductor::core::config::NotifierConfig;
using conductor::core::errors::ErrorCategory;
using conductor::core::errors::OrchestrationError;
using conductor::events::EventNotifier;
using conductor::events::InMemoryTransport;
using conductor::protocol::ToolCall;
using conductor::protocol::ToolResult;
using nlohmann::json;

NotifierConfig fast_config() {
    NotifierConfig config;
    config.max_send_attempts = 3;
    config.retry_delay_ms = 0;
    return config;
}

TEST(EventNotifierTest, AssignsPerThreadSequenceStartingAtOne) {
    InMemoryTransport transport;
    EventNotifier notifier(transport, fast_config());

    notifier.agent_started("t1", "run-1", json::object());
    notifier.agent_thinking("t1", "run-1", "working", "triage");
    notifier.agent_started("t2", "run-2", json::object());

    const auto t1 = transport.events("t1");
    const auto t2 = transport.events("t2");
    ASSERT_EQ(t1.size(), 2u);
    ASSERT_EQ(t2.size(), 1u);
    EXPECT_EQ(t1[0]["sequence_number"], 1u);
    EXPECT_EQ(t1[1]["sequence_number"], 2u);
    EXPECT_EQ(t2[0]["sequence_number"], 1u);
    EXPECT_EQ(notifier.last_sequence("t1"), 2u);
    EXPECT_EQ(notifier.last_sequence("unknown"), 0u);
}

TEST(EventNotifierTest, FramesCarryTheWireFields) {
    InMemoryTransport transport;
    EventNotifier notifier(transport, fast_config());

    notifier.agent_thinking("t1", "run-1", "Classifying the request", "triage");

    const auto frame = transport.events("t1").at(0);
    EXPECT_EQ(frame["type"], "agent_thinking");
    EXPECT_EQ(frame["thread_id"], "t1");
    EXPECT_EQ(frame["run_id"], "run-1");
    EXPECT_EQ(frame["payload"]["stage"], "triage");
    EXPECT_EQ(frame["payload"]["thought"], "Classifying the request");
    EXPECT_GT(frame["timestamp"].get<std::int64_t>(), 0);
}

TEST(EventNotifierTest, RetriesCriticalEventsOnTransientFailure) {
    InMemoryTransport transport;
    EventNotifier notifier(transport, fast_config());
    transport.fail_next_sends(2);

    const auto report = notifier.agent_started("t1", "run-1", json::object());
    EXPECT_TRUE(report.delivered);
    EXPECT_EQ(report.attempts, 3u);
    EXPECT_EQ(notifier.stats().retries, 2u);
    EXPECT_EQ(transport.frames("t1").size(), 1u);
}

TEST(EventNotifierTest, DropsCriticalEventAfterMaxAttempts) {
    InMemoryTransport transport;
    EventNotifier notifier(transport, fast_config());
    transport.fail_next_sends(5);

    const auto report = notifier.agent_started("t1", "run-1", json::object());
    EXPECT_FALSE(report.delivered);
    EXPECT_EQ(report.attempts, 3u);
    ASSERT_TRUE(report.error.has_value());
    EXPECT_EQ(report.error->category, ErrorCategory::Connection);
    EXPECT_EQ(notifier.stats().failed, 1u);
}

TEST(EventNotifierTest, AuxiliaryEventsGetOneAttempt) {
    InMemoryTransport transport;
    EventNotifier notifier(transport, fast_config());
    transport.fail_next_sends(1);

    const auto report = notifier.pong("t1", json{{"n", 1}});
    EXPECT_FALSE(report.delivered);
    EXPECT_EQ(report.attempts, 1u);
    EXPECT_EQ(notifier.stats().retries, 0u);
}

TEST(EventNotifierTest, DisconnectedThreadDropsWithoutThrowing) {
    InMemoryTransport transport;
    EventNotifier notifier(transport, fast_config());
    transport.disconnect("t1");

    const auto report = notifier.agent_completed("t1", "run-1", json::object());
    EXPECT_FALSE(report.delivered);
    EXPECT_EQ(report.attempts, 1u);
    ASSERT_TRUE(report.error.has_value());
    EXPECT_EQ(report.error->code, "transport_disconnected");

    // Other threads are unaffected.
    EXPECT_TRUE(notifier.agent_started("t2", "run-2", json::object()).delivered);
    const auto stats = notifier.stats();
    EXPECT_EQ(stats.emitted, 2u);
    EXPECT_EQ(stats.delivered, 1u);
    EXPECT_EQ(stats.failed, 1u);
}

TEST(EventNotifierTest, ToolEventsShareTheCallId) {
    InMemoryTransport transport;
    EventNotifier notifier(transport, fast_config());

    ToolCall call;
    call.id = "tool-1";
    call.name = "collect_metrics";
    call.arguments = json{{"window", 5}};
    ToolResult result;
    result.tool_call_id = call.id;
    result.success = false;
    result.error_message = "backend down";

    notifier.tool_executing("t1", "run-1", call);
    notifier.tool_completed("t1", "run-1", call, result);

    const auto frames = transport.events("t1");
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0]["payload"]["tool_call_id"], "tool-1");
    EXPECT_EQ(frames[1]["payload"]["tool_call_id"], "tool-1");
    EXPECT_EQ(frames[1]["payload"]["tool_name"], "collect_metrics");
    EXPECT_FALSE(frames[1]["payload"]["success"].get<bool>());
    EXPECT_EQ(frames[1]["payload"]["error"], "backend down");
}

TEST(EventNotifierTest, ErrorEventCarriesCategoryCodeAndDetails) {
    InMemoryTransport transport;
    EventNotifier notifier(transport, fast_config());

    OrchestrationError err{ErrorCategory::Timeout, "Run exceeded its deadline.",
                           "run_timeout", "Retry later."};
    notifier.error("t1", "run-1", err, json{{"stage", "data"}});

    const auto payload = transport.events("t1").at(0)["payload"];
    EXPECT_EQ(payload["category"], "timeout");
    EXPECT_EQ(payload["code"], "run_timeout");
    EXPECT_EQ(payload["hint"], "Retry later.");
    EXPECT_EQ(payload["stage"], "data");
}

TEST(EventNotifierTest, ConcurrentEmittersKeepPerThreadOrder) {
    InMemoryTransport transport;
    EventNotifier notifier(transport, fast_config());

    std::vector<std::thread> workers;
    for (int w = 0; w < 4; ++w) {
        workers.emplace_back([&notifier, w] {
            const std::string thread_id = "t" + std::to_string(w);
            for (int i = 0; i < 50; ++i) {
                notifier.agent_thinking(thread_id, "run", std::to_string(i), "s");
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    for (int w = 0; w < 4; ++w) {
        const auto frames = transport.events("t" + std::to_string(w));
        ASSERT_EQ(frames.size(), 50u);
        for (std::size_t i = 0; i < frames.size(); ++i) {
            EXPECT_EQ(frames[i]["sequence_number"], i + 1);
            EXPECT_EQ(frames[i]["payload"]["thought"], std::to_string(i));
        }
    }
}

// Transport whose send always throws.
class ThrowingTransport : public conductor::events::Transport {
public:
    conductor::core::errors::Status send(const std::string&, const std::string&) override {
        throw std::runtime_error("socket exploded");
    }
    bool is_connected(const std::string&) const override { return true; }
};

TEST(EventNotifierTest, ThrowingTransportIsReportedNotRaised) {
    ThrowingTransport transport;
    EventNotifier notifier(transport, fast_config());

    const auto report = notifier.agent_started("t1", "run-1", json::object());
    EXPECT_FALSE(report.delivered);
    EXPECT_EQ(report.attempts, 3u);
    ASSERT_TRUE(report.error.has_value());
    EXPECT_EQ(report.error->code, "transport_error");
    EXPECT_EQ(notifier.stats().failed, 1u);
}

TEST(EventNotifierTest, InvalidUtf8PayloadIsStillDelivered) {
    InMemoryTransport transport;
    EventNotifier notifier(transport, fast_config());

    const auto report =
        notifier.agent_started("t1", "run-1", json{{"user_request", "GPU \xff\xfe"}});
    EXPECT_TRUE(report.delivered);
    const auto frame = transport.events("t1").at(0);
    EXPECT_EQ(frame["payload"]["user_request"], "GPU \xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST(EventNotifierTest, CloseThreadForgetsItsSequence) {
    InMemoryTransport transport;
    EventNotifier notifier(transport, fast_config());
    notifier.agent_started("t1", "run-1", json::object());
    notifier.agent_started("t2", "run-2", json::object());
    EXPECT_EQ(notifier.channel_count(), 2u);

    EXPECT_TRUE(notifier.close_thread("t1"));
    EXPECT_FALSE(notifier.close_thread("t1"));
    EXPECT_EQ(notifier.channel_count(), 1u);
    EXPECT_EQ(notifier.last_sequence("t1"), 0u);
    EXPECT_EQ(notifier.last_sequence("t2"), 1u);
}

}  // namespace
