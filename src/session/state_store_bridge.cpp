#include "session/state_store_bridge.hpp"

#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"
#include "session/state_codec.hpp"

namespace conductor::session {

using core::errors::ErrorCategory;
using core::errors::OrchestrationError;
using protocol::RequestState;

StateStoreBridge::StateStoreBridge(StateStore& store,
                                   core::config::StateStoreConfig config)
    : store_(store), config_(std::move(config)) {}

core::errors::Result<std::string> StateStoreBridge::save(
    const std::string& run_id, const std::string& thread_id,
    const std::string& user_id, const RequestState& state) {
    if (run_id.empty() || thread_id.empty() || user_id.empty()) {
        return OrchestrationError{ErrorCategory::Validation,
                                  "Snapshot requires run_id, thread_id and user_id.",
                                  "invalid_snapshot_key"};
    }
    if (state.run_id != run_id || state.thread_id != thread_id ||
        state.user_id != user_id) {
        return OrchestrationError{ErrorCategory::Validation,
                                  "Snapshot key does not match state identity for run " +
                                      run_id,
                                  "snapshot_identity_mismatch"};
    }

    auto existing = store_.get(run_id);
    if (core::errors::is_error(existing)) {
        return core::errors::get_error(existing);
    }
    const auto& previous = core::errors::get_value(existing);
    if (previous.has_value() && previous->user_id != user_id) {
        LOG_WARN("StateStoreBridge: refusing to overwrite run " + run_id +
                 " owned by another user");
        return OrchestrationError{ErrorCategory::Validation,
                                  "Run " + run_id + " belongs to another user.",
                                  "run_owner_mismatch"};
    }

    RunSnapshot snapshot;
    snapshot.snapshot_id = core::config::generate_id("snap");
    snapshot.run_id = run_id;
    snapshot.thread_id = thread_id;
    snapshot.user_id = user_id;
    snapshot.state = state_to_json(state);
    snapshot.saved_at = core::config::now_unix_ms();

    auto status = store_.put(snapshot);
    if (core::errors::is_error(status)) {
        return core::errors::get_error(status);
    }
    LOG_DEBUG("StateStoreBridge: saved " + snapshot.snapshot_id + " for run " + run_id +
              " (" + protocol::to_string(state.status) + ")");
    return snapshot.snapshot_id;
}

core::errors::Result<std::optional<RequestState>> StateStoreBridge::load(
    const std::string& run_id) const {
    auto stored = store_.get(run_id);
    if (core::errors::is_error(stored)) {
        return core::errors::get_error(stored);
    }
    const auto& snapshot = core::errors::get_value(stored);
    if (!snapshot.has_value()) {
        return std::optional<RequestState>{};
    }
    auto decoded = state_from_json(snapshot->state);
    if (core::errors::is_error(decoded)) {
        return core::errors::get_error(decoded);
    }
    return std::optional<RequestState>{core::errors::take_value(std::move(decoded))};
}

core::errors::Result<std::optional<RequestState>> StateStoreBridge::load(
    const std::string& run_id, const std::string& user_id) const {
    auto loaded = load(run_id);
    if (core::errors::is_error(loaded)) {
        return loaded;
    }
    const auto& state = core::errors::get_value(loaded);
    if (state.has_value() && state->user_id != user_id) {
        return std::optional<RequestState>{};
    }
    return loaded;
}

core::errors::Result<std::optional<ThreadContext>> StateStoreBridge::get_thread_context(
    const std::string& thread_id) const {
    auto listed = store_.list_thread(thread_id);
    if (core::errors::is_error(listed)) {
        return core::errors::get_error(listed);
    }
    const auto& snapshots = core::errors::get_value(listed);
    if (snapshots.empty()) {
        return std::optional<ThreadContext>{};
    }

    ThreadContext context;
    context.thread_id = thread_id;
    for (const auto& snapshot : snapshots) {
        context.run_ids.push_back(snapshot.run_id);
    }
    const auto& latest = snapshots.back();
    context.user_id = latest.user_id;
    context.latest_run_id = latest.run_id;
    context.updated_at = latest.saved_at;

    auto decoded = state_from_json(latest.state);
    if (core::errors::is_error(decoded)) {
        return core::errors::get_error(decoded);
    }
    context.latest_status = core::errors::get_value(decoded).status;
    return std::optional<ThreadContext>{std::move(context)};
}

core::errors::Result<std::size_t> StateStoreBridge::collect_expired(
    const std::int64_t now_unix_ms) {
    const std::int64_t ttl_ms =
        static_cast<std::int64_t>(config_.snapshot_ttl_seconds) * 1000;
    auto removed = store_.erase_older_than(now_unix_ms - ttl_ms);
    if (!core::errors::is_error(removed) && core::errors::get_value(removed) > 0) {
        LOG_INFO("StateStoreBridge: collected " +
                 std::to_string(core::errors::get_value(removed)) +
                 " expired snapshots");
    }
    return removed;
}

core::errors::Result<std::size_t> StateStoreBridge::collect_expired() {
    return collect_expired(core::config::now_unix_ms());
}

}  // namespace conductor::session
