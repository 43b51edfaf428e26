#include "runtime/stage.hpp"

#include <unordered_set>
#include <utility>

namespace conductor::runtime {

using core::errors::ErrorCategory;
using core::errors::OrchestrationError;

StagePipeline::StagePipeline(std::vector<Entry> entries)
    : entries_(std::move(entries)) {}

std::vector<std::string> StagePipeline::names() const {
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& entry : entries_) {
        names.push_back(entry.name);
    }
    return names;
}

StagePipeline::Builder& StagePipeline::Builder::add(std::string name,
                                                    std::unique_ptr<Stage> stage) {
    entries_.push_back(Entry{std::move(name), std::move(stage)});
    return *this;
}

core::errors::Result<StagePipeline> StagePipeline::Builder::build() {
    if (entries_.empty()) {
        return OrchestrationError{ErrorCategory::Validation,
                                  "Pipeline needs at least one stage.",
                                  "empty_pipeline"};
    }
    std::unordered_set<std::string> seen;
    for (const auto& entry : entries_) {
        if (entry.name.empty()) {
            return OrchestrationError{ErrorCategory::Validation,
                                      "Stage names cannot be empty.",
                                      "invalid_stage_name"};
        }
        if (!entry.stage) {
            return OrchestrationError{ErrorCategory::Validation,
                                      "Stage '" + entry.name + "' has no implementation.",
                                      "invalid_stage"};
        }
        if (!seen.insert(entry.name).second) {
            return OrchestrationError{ErrorCategory::Validation,
                                      "Duplicate stage name: " + entry.name,
                                      "duplicate_stage"};
        }
    }
    return StagePipeline(std::move(entries_));
}

}  // namespace conductor::runtime
