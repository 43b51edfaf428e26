#pragma once

#include <nlohmann/json.hpp>
#include "core/errors/orchestration_errors.hpp"
#include "protocol/request_state.hpp"

namespace conductor::session {

nlohmann::json state_to_json(const protocol::RequestState& state);

core::errors::Result<protocol::RequestState> state_from_json(
    const nlohmann::json& document);

}  // namespace conductor::session
