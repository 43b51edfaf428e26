#include <memory>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "app/channel_router.hpp"
#include "core/config/app_config.hpp"
#include "events/event_notifier.hpp"
#include "events/event_validator.hpp"
#include "events/transport.hpp"
#include "resources/resource_client.hpp"
#include "resources/resource_factory.hpp"
#include "runtime/builtin_stages.hpp"
#include "runtime/orchestrator.hpp"
#include "session/run_registry.hpp"
#include "session/state_store.hpp"
#include "session/state_store_bridge.hpp"

namespace {

using conductor::app::ChannelRouter;
using conductor::app::FrameAction;
using conductor::core::config::NotifierConfig;
using conductor::core::config::OrchestratorConfig;
using conductor::core::config::ResourceConfig;
using conductor::core::errors::is_error;
using conductor::core::errors::take_value;
using conductor::events::EventNotifier;
using conductor::events::InMemoryTransport;
using conductor::protocol::RequestStatus;
using nlohmann::json;

class ChannelRouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto pipeline = conductor::runtime::make_default_pipeline();
        ASSERT_FALSE(is_error(pipeline));
        OrchestratorConfig config;
        config.retry_backoff_ms = 1;
        orchestrator = std::make_unique<conductor::runtime::Orchestrator>(
            take_value(std::move(pipeline)), notifier, bridge, factory, registry, config);
        router = std::make_unique<ChannelRouter>(*orchestrator, notifier, "u1", "t1");
    }

    std::vector<json> frames() const { return transport.events("t1"); }

    InMemoryTransport transport;
    EventNotifier notifier{transport, NotifierConfig{3, 0}};
    conductor::session::InMemoryStateStore store;
    conductor::session::StateStoreBridge bridge{store};
    std::shared_ptr<conductor::resources::AnalyticsBackend> backend =
        std::make_shared<conductor::resources::AnalyticsBackend>();
    conductor::resources::ResourceFactory factory{
        ResourceConfig{}, conductor::resources::make_analytics_connector(backend)};
    conductor::session::RunRegistry registry;
    std::unique_ptr<conductor::runtime::Orchestrator> orchestrator;
    std::unique_ptr<ChannelRouter> router;
};

TEST_F(ChannelRouterTest, OpenEmitsConnectionEstablished) {
    router->open();
    const auto sent = frames();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0]["type"], "connection_established");
    EXPECT_EQ(sent[0]["payload"]["user_id"], "u1");
    EXPECT_EQ(sent[0]["run_id"], "");
}

TEST_F(ChannelRouterTest, PingGetsPongWithSamePayload) {
    const auto result = router->handle_text(R"({"type": "ping", "payload": {"nonce": 7}})");
    EXPECT_EQ(result.action, FrameAction::Pong);
    const auto sent = frames();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0]["type"], "pong");
    EXPECT_EQ(sent[0]["payload"]["nonce"], 7);
}

TEST_F(ChannelRouterTest, UserMessageStartsARun) {
    const auto result = router->handle_text(
        R"({"type": "user_message", "payload": {"content": "Optimize my GPU utilization", "run_id": "run-7"}})");
    EXPECT_EQ(result.action, FrameAction::RunExecuted);
    ASSERT_TRUE(result.state.has_value());
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(result.state->status, RequestStatus::Completed);
    EXPECT_EQ(result.state->user_id, "u1");
    EXPECT_EQ(result.state->thread_id, "t1");
    EXPECT_EQ(result.state->run_id, "run-7");
    EXPECT_TRUE(conductor::events::validate_run_events(frames(), "run-7").valid);
}

TEST_F(ChannelRouterTest, ChatMessageAcceptsTextField) {
    const auto result =
        router->handle_text(R"({"type": "chat_message", "payload": {"text": "Reduce cost"}})");
    EXPECT_EQ(result.action, FrameAction::RunExecuted);
    ASSERT_TRUE(result.state.has_value());
    EXPECT_EQ(result.state->user_request, "Reduce cost");
    EXPECT_FALSE(result.state->run_id.empty());
}

TEST_F(ChannelRouterTest, MessageWithoutContentIsRejected) {
    const auto result = router->handle_text(R"({"type": "start_agent", "payload": {}})");
    EXPECT_EQ(result.action, FrameAction::Rejected);
    const auto sent = frames();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0]["type"], "error");
}

TEST_F(ChannelRouterTest, UnknownTypeIsEchoed) {
    const auto result = router->handle_text(R"({"type": "typing", "payload": {"on": true}})");
    EXPECT_EQ(result.action, FrameAction::Echo);
    const auto sent = frames();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0]["type"], "echo");
    EXPECT_EQ(sent[0]["payload"]["type"], "typing");
}

TEST_F(ChannelRouterTest, MalformedFramesYieldErrorEvents) {
    for (const std::string text : {"{not json", "[1, 2]", R"({"payload": {}})",
                                   R"({"type": ""})", R"({"type": 5})"}) {
        const auto result = router->handle_text(text);
        EXPECT_EQ(result.action, FrameAction::Rejected) << text;
        ASSERT_TRUE(result.error.has_value());
        EXPECT_EQ(result.error->code, "invalid_frame");
    }
    const auto sent = frames();
    ASSERT_EQ(sent.size(), 5u);
    for (const auto& frame : sent) {
        EXPECT_EQ(frame["type"], "error");
        EXPECT_FALSE(frame["payload"]["message"].get<std::string>().empty());
    }
}

TEST_F(ChannelRouterTest, RejectedRunIsReportedOnTheChannel) {
    conductor::protocol::RunRequest busy{"Reduce cost", "t1", "u1", "run-busy"};
    ASSERT_FALSE(is_error(registry.start_run(busy)));

    const auto result = router->handle_text(
        R"({"type": "user_message", "payload": {"content": "Reduce cost", "run_id": "run-busy"}})");
    EXPECT_EQ(result.action, FrameAction::RunExecuted);
    EXPECT_FALSE(result.state.has_value());
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, "run_already_active");
    const auto sent = frames();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0]["type"], "error");
    EXPECT_EQ(sent[0]["run_id"], "run-busy");
}

TEST_F(ChannelRouterTest, CloseReleasesTheThreadChannel) {
    router->open();
    router->handle_text(R"({"type": "ping", "payload": {}})");
    EXPECT_EQ(notifier.channel_count(), 1u);

    router->close();
    EXPECT_EQ(notifier.channel_count(), 0u);
    EXPECT_EQ(notifier.last_sequence("t1"), 0u);
}

}  // namespace
