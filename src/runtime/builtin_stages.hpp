#pragma once

#include <string>
#include <vector>
#include "core/errors/orchestration_errors.hpp"
#include "runtime/stage.hpp"

namespace conductor::runtime {

// The fixed seven-stage pipeline in execution order:
// triage, data, optimization, actions, reporting, synthetic_data, corpus_admin.
// Stage logic is deterministic so runs can be replayed in tests.
core::errors::Result<StagePipeline> make_default_pipeline();

const std::vector<std::string>& default_stage_names();

}  // namespace conductor::runtime
