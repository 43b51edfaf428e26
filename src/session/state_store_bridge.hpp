#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/config/app_config.hpp"
#include "core/errors/orchestration_errors.hpp"
#include "protocol/request_state.hpp"
#include "session/state_store.hpp"

namespace conductor::session {

struct ThreadContext {
    std::string thread_id;
    std::string user_id;
    std::vector<std::string> run_ids;  // oldest save first
    std::string latest_run_id;
    protocol::RequestStatus latest_status = protocol::RequestStatus::Pending;
    std::int64_t updated_at = 0;
};

// Persists and resumes run state on top of a StateStore backend.
class StateStoreBridge {
public:
    StateStoreBridge(StateStore& store, core::config::StateStoreConfig config = {});

    // Returns the snapshot id on success.
    core::errors::Result<std::string> save(const std::string& run_id,
                                           const std::string& thread_id,
                                           const std::string& user_id,
                                           const protocol::RequestState& state);

    // An unknown run_id yields an empty optional, not an error.
    core::errors::Result<std::optional<protocol::RequestState>> load(
        const std::string& run_id) const;

    // Same as load, but another user's run is reported as absent.
    core::errors::Result<std::optional<protocol::RequestState>> load(
        const std::string& run_id, const std::string& user_id) const;

    core::errors::Result<std::optional<ThreadContext>> get_thread_context(
        const std::string& thread_id) const;

    core::errors::Result<std::size_t> collect_expired(std::int64_t now_unix_ms);
    core::errors::Result<std::size_t> collect_expired();

private:
    StateStore& store_;
    core::config::StateStoreConfig config_;
};

}  // namespace conductor::session
