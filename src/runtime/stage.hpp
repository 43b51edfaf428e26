#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "core/errors/orchestration_errors.hpp"
#include "protocol/request_state.hpp"

namespace conductor::runtime {

class StageContext;

// A named, stateless unit of business logic. Stages never mutate the state
// they are given; they return the state the orchestrator should commit.
// One instance serves every concurrent run, so execute() must be const-safe.
class Stage {
public:
    virtual ~Stage() = default;

    virtual bool check_entry_conditions(const protocol::RequestState& state) const = 0;
    virtual core::errors::Result<protocol::RequestState> execute(
        const protocol::RequestState& state, StageContext& context) const = 0;
};

// Fixed, ordered stage table. Built once, never reordered afterwards.
class StagePipeline {
public:
    struct Entry {
        std::string name;
        std::unique_ptr<Stage> stage;
    };

    class Builder {
    public:
        Builder& add(std::string name, std::unique_ptr<Stage> stage);
        core::errors::Result<StagePipeline> build();

    private:
        std::vector<Entry> entries_;
    };

    StagePipeline(StagePipeline&&) noexcept = default;
    StagePipeline& operator=(StagePipeline&&) noexcept = default;

    const std::vector<Entry>& entries() const { return entries_; }
    std::vector<std::string> names() const;
    std::size_t size() const { return entries_.size(); }

private:
    explicit StagePipeline(std::vector<Entry> entries);

    std::vector<Entry> entries_;
};

}  // namespace conductor::runtime
