#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/app_config.hpp"
#include "core/config/ids.hpp"
#include "protocol/request_state.hpp"
#include "session/state_codec.hpp"
#include "session/state_store.hpp"
#include "session/state_store_bridge.hpp"

namespace {

using conductor::core::config::now_unix_ms;
using conductor::core::config::StateStoreConfig;
using conductor::core::errors::ErrorCategory;
using conductor::core::errors::get_error;
using conductor::core::errors::get_value;
using conductor::core::errors::is_error;
using conductor::protocol::RequestState;
using conductor::protocol::RequestStatus;
using conductor::session::FileStateStore;
using conductor::session::InMemoryStateStore;
using conductor::session::state_from_json;
using conductor::session::state_to_json;
using conductor::session::StateStoreBridge;
using nlohmann::json;

RequestState make_state(const std::string& run_id, const std::string& user_id = "u1",
                        const std::string& thread_id = "t1") {
    RequestState state;
    state.user_id = user_id;
    state.thread_id = thread_id;
    state.run_id = run_id;
    state.user_request = "Optimize my GPU utilization";
    state.status = RequestStatus::Running;
    state.created_at = 1700000000000;
    state.updated_at = 1700000000500;
    state.stage_results["triage"] = json{{"category", "gpu_optimization"},
                                         {"keywords", json::array({"gpu"})}};
    state.execution_order = {"triage"};
    state.stage_failures["data"] = "backend down";
    state.failure_reason = "Stage 'data' failed";
    return state;
}

class TempDir {
public:
    TempDir()
        : path_(std::filesystem::temp_directory_path() /
                conductor::core::config::generate_id("conductor-store")) {}
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

TEST(StateCodecTest, RoundTripKeepsEveryField) {
    const RequestState state = make_state("run-1");
    auto decoded = state_from_json(state_to_json(state));
    ASSERT_FALSE(is_error(decoded));
    EXPECT_EQ(get_value(decoded), state);
}

TEST(StateCodecTest, RejectsMissingIdentity) {
    json document = state_to_json(make_state("run-1"));
    document.erase("user_id");
    auto decoded = state_from_json(document);
    ASSERT_TRUE(is_error(decoded));
    EXPECT_EQ(get_error(decoded).code, "corrupt_snapshot");
}

TEST(StateCodecTest, RejectsUnknownStatus) {
    json document = state_to_json(make_state("run-1"));
    document["status"] = "paused";
    EXPECT_TRUE(is_error(state_from_json(document)));
}

TEST(StateStoreBridgeTest, LoadAfterSaveEqualsSavedState) {
    InMemoryStateStore store;
    StateStoreBridge bridge(store);
    const RequestState state = make_state("run-1");

    auto saved = bridge.save("run-1", "t1", "u1", state);
    ASSERT_FALSE(is_error(saved));
    EXPECT_FALSE(get_value(saved).empty());

    auto loaded = bridge.load("run-1");
    ASSERT_FALSE(is_error(loaded));
    ASSERT_TRUE(get_value(loaded).has_value());
    EXPECT_EQ(get_value(loaded).value(), state);
}

TEST(StateStoreBridgeTest, UnknownRunLoadsAsNone) {
    InMemoryStateStore store;
    StateStoreBridge bridge(store);
    auto loaded = bridge.load("run-missing");
    ASSERT_FALSE(is_error(loaded));
    EXPECT_FALSE(get_value(loaded).has_value());
}

TEST(StateStoreBridgeTest, OtherUsersCannotLoadOrOverwrite) {
    InMemoryStateStore store;
    StateStoreBridge bridge(store);
    ASSERT_FALSE(is_error(bridge.save("run-1", "t1", "u1", make_state("run-1"))));

    auto as_stranger = bridge.load("run-1", "u2");
    ASSERT_FALSE(is_error(as_stranger));
    EXPECT_FALSE(get_value(as_stranger).has_value());

    auto as_owner = bridge.load("run-1", "u1");
    ASSERT_FALSE(is_error(as_owner));
    EXPECT_TRUE(get_value(as_owner).has_value());

    auto overwrite = bridge.save("run-1", "t1", "u2", make_state("run-1", "u2"));
    ASSERT_TRUE(is_error(overwrite));
    EXPECT_EQ(get_error(overwrite).code, "run_owner_mismatch");
}

TEST(StateStoreBridgeTest, SaveRejectsKeysThatDoNotMatchState) {
    InMemoryStateStore store;
    StateStoreBridge bridge(store);
    auto saved = bridge.save("run-1", "t-other", "u1", make_state("run-1"));
    ASSERT_TRUE(is_error(saved));
    EXPECT_EQ(get_error(saved).code, "snapshot_identity_mismatch");
}

TEST(StateStoreBridgeTest, UnavailableBackendIsAConnectionError) {
    InMemoryStateStore store;
    StateStoreBridge bridge(store);
    store.set_available(false);

    auto saved = bridge.save("run-1", "t1", "u1", make_state("run-1"));
    ASSERT_TRUE(is_error(saved));
    EXPECT_EQ(get_error(saved).category, ErrorCategory::Connection);
    auto loaded = bridge.load("run-1");
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).category, ErrorCategory::Connection);
}

TEST(StateStoreBridgeTest, ThreadContextFollowsSaveOrder) {
    InMemoryStateStore store;
    StateStoreBridge bridge(store);
    ASSERT_FALSE(is_error(bridge.save("run-a", "t1", "u1", make_state("run-a"))));
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    RequestState second = make_state("run-b");
    second.status = RequestStatus::Completed;
    ASSERT_FALSE(is_error(bridge.save("run-b", "t1", "u1", second)));
    ASSERT_FALSE(is_error(bridge.save("run-c", "t2", "u1", make_state("run-c", "u1", "t2"))));

    auto context = bridge.get_thread_context("t1");
    ASSERT_FALSE(is_error(context));
    ASSERT_TRUE(get_value(context).has_value());
    const auto& ctx = get_value(context).value();
    EXPECT_EQ(ctx.user_id, "u1");
    ASSERT_EQ(ctx.run_ids.size(), 2u);
    EXPECT_EQ(ctx.run_ids[0], "run-a");
    EXPECT_EQ(ctx.latest_run_id, "run-b");
    EXPECT_EQ(ctx.latest_status, RequestStatus::Completed);

    auto none = bridge.get_thread_context("t-unknown");
    ASSERT_FALSE(is_error(none));
    EXPECT_FALSE(get_value(none).has_value());
}

TEST(StateStoreBridgeTest, CollectExpiredHonoursTtl) {
    InMemoryStateStore store;
    StateStoreConfig config;
    config.snapshot_ttl_seconds = 60;
    StateStoreBridge bridge(store, config);
    ASSERT_FALSE(is_error(bridge.save("run-1", "t1", "u1", make_state("run-1"))));

    auto kept = bridge.collect_expired(now_unix_ms());
    ASSERT_FALSE(is_error(kept));
    EXPECT_EQ(get_value(kept), 0u);

    auto removed = bridge.collect_expired(now_unix_ms() + 61000);
    ASSERT_FALSE(is_error(removed));
    EXPECT_EQ(get_value(removed), 1u);
    EXPECT_EQ(store.size(), 0u);
}

TEST(FileStateStoreTest, PersistsAcrossInstances) {
    TempDir dir;
    const RequestState state = make_state("run-1");
    {
        FileStateStore store(dir.path());
        StateStoreBridge bridge(store);
        ASSERT_FALSE(is_error(bridge.save("run-1", "t1", "u1", state)));
    }
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "run-1.json"));
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "run-1.json.tmp"));

    FileStateStore reopened(dir.path());
    StateStoreBridge bridge(reopened);
    auto loaded = bridge.load("run-1");
    ASSERT_FALSE(is_error(loaded));
    ASSERT_TRUE(get_value(loaded).has_value());
    EXPECT_EQ(get_value(loaded).value(), state);
}

TEST(FileStateStoreTest, RejectsRunIdsThatEscapeTheDirectory) {
    TempDir dir;
    FileStateStore store(dir.path());
    auto loaded = store.get("../etc/passwd");
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).code, "invalid_run_id");
}

TEST(FileStateStoreTest, CorruptSnapshotIsReported) {
    TempDir dir;
    std::filesystem::create_directories(dir.path());
    {
        std::ofstream out(dir.path() / "run-bad.json");
        out << "{ truncated";
    }
    FileStateStore store(dir.path());
    auto loaded = store.get("run-bad");
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).code, "corrupt_snapshot");
}

TEST(FileStateStoreTest, NonUtf8TextIsStoredWithReplacement) {
    TempDir dir;
    RequestState state = make_state("run-1");
    state.user_request = "Optimize my GPU \xff\xfe utilization";
    FileStateStore store(dir.path());
    StateStoreBridge bridge(store);
    ASSERT_FALSE(is_error(bridge.save("run-1", "t1", "u1", state)));

    auto loaded = bridge.load("run-1");
    ASSERT_FALSE(is_error(loaded));
    ASSERT_TRUE(get_value(loaded).has_value());
    EXPECT_EQ(get_value(loaded)->user_request,
              "Optimize my GPU \xEF\xBF\xBD\xEF\xBF\xBD utilization");
}

}  // namespace
