#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace conductor::events {

struct SequenceReport {
    bool valid = true;
    std::vector<std::string> violations;
    std::map<std::string, std::size_t> counts;  // by event type
    std::size_t tool_pairs = 0;
};

// Checks the captured frames of one thread against the lifecycle rules of a
// run: one agent_started first, one terminal agent_completed last, every
// tool_executing closed by a matching tool_completed, sequence numbers
// strictly increasing. Frames of other runs and auxiliary frames without a
// run id are skipped for the lifecycle rules.
SequenceReport validate_run_events(const std::vector<nlohmann::json>& frames,
                                   const std::string& run_id);

}  // namespace conductor::events
