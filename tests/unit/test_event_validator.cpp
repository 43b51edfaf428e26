#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "events/event_validator.hpp"

namespace {

using conductor::events::validate_run_events;
using nlohmann::json;

json frame(std::uint64_t sequence, const std::string& type,
           json payload = json::object(), const std::string& run_id = "run-1") {
    return json{{"type", type},
                {"thread_id", "t1"},
                {"run_id", run_id},
                {"payload", std::move(payload)},
                {"timestamp", 1700000000000},
                {"sequence_number", sequence}};
}

json tool(const std::string& id, const std::string& name) {
    return json{{"tool_call_id", id}, {"tool_name", name}};
}

TEST(EventValidatorTest, AcceptsWellFormedRun) {
    const std::vector<json> frames = {
        frame(1, "agent_started"),
        frame(2, "agent_thinking"),
        frame(3, "tool_executing", tool("c1", "classify")),
        frame(4, "tool_completed", tool("c1", "classify")),
        frame(5, "agent_completed"),
    };
    const auto report = validate_run_events(frames, "run-1");
    EXPECT_TRUE(report.valid);
    EXPECT_TRUE(report.violations.empty());
    EXPECT_EQ(report.tool_pairs, 1u);
    EXPECT_EQ(report.counts.at("agent_thinking"), 1u);
}

TEST(EventValidatorTest, FlagsMissingTerminalEvent) {
    const auto report = validate_run_events({frame(1, "agent_started")}, "run-1");
    EXPECT_FALSE(report.valid);
}

TEST(EventValidatorTest, FlagsUnpairedToolCall) {
    const std::vector<json> frames = {
        frame(1, "agent_started"),
        frame(2, "tool_executing", tool("c1", "classify")),
        frame(3, "agent_completed"),
    };
    EXPECT_FALSE(validate_run_events(frames, "run-1").valid);
}

TEST(EventValidatorTest, FlagsToolNameMismatch) {
    const std::vector<json> frames = {
        frame(1, "agent_started"),
        frame(2, "tool_executing", tool("c1", "classify")),
        frame(3, "tool_completed", tool("c1", "summarize")),
        frame(4, "agent_completed"),
    };
    EXPECT_FALSE(validate_run_events(frames, "run-1").valid);
}

TEST(EventValidatorTest, FlagsNonIncreasingSequence) {
    const std::vector<json> frames = {
        frame(2, "agent_started"),
        frame(2, "agent_completed"),
    };
    EXPECT_FALSE(validate_run_events(frames, "run-1").valid);
}

TEST(EventValidatorTest, FlagsCriticalEventAfterCompletion) {
    const std::vector<json> frames = {
        frame(1, "agent_started"),
        frame(2, "agent_completed"),
        frame(3, "agent_thinking"),
    };
    EXPECT_FALSE(validate_run_events(frames, "run-1").valid);
}

TEST(EventValidatorTest, IgnoresOtherRunsAndAuxiliaryFrames) {
    const std::vector<json> frames = {
        frame(1, "connection_established", json::object(), ""),
        frame(2, "agent_started"),
        frame(3, "agent_started", json::object(), "run-2"),
        frame(4, "pong", json::object(), ""),
        frame(5, "agent_completed"),
    };
    EXPECT_TRUE(validate_run_events(frames, "run-1").valid);
}

}  // namespace
