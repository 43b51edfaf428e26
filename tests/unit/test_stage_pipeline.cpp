#include <memory>
#include <string>
#include <gtest/gtest.h>
#include "runtime/builtin_stages.hpp"
#include "runtime/stage.hpp"
#include "runtime/stage_context.hpp"

namespace {

using conductor::core::errors::get_error;
using conductor::core::errors::get_value;
using conductor::core::errors::is_error;
using conductor::core::errors::Result;
using conductor::protocol::RequestState;
using conductor::runtime::default_stage_names;
using conductor::runtime::make_default_pipeline;
using conductor::runtime::Stage;
using conductor::runtime::StageContext;
using conductor::runtime::StagePipeline;

class NoopStage : public Stage {
public:
    bool check_entry_conditions(const RequestState&) const override { return true; }
    Result<RequestState> execute(const RequestState& state,
                                 StageContext&) const override {
        return state;
    }
};

TEST(StagePipelineTest, KeepsRegistrationOrder) {
    StagePipeline::Builder builder;
    builder.add("first", std::make_unique<NoopStage>())
        .add("second", std::make_unique<NoopStage>())
        .add("third", std::make_unique<NoopStage>());
    auto built = builder.build();
    ASSERT_FALSE(is_error(built));

    const auto names = get_value(built).names();
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "first");
    EXPECT_EQ(names[2], "third");
}

TEST(StagePipelineTest, RejectsEmptyPipeline) {
    StagePipeline::Builder builder;
    auto built = builder.build();
    ASSERT_TRUE(is_error(built));
    EXPECT_EQ(get_error(built).code, "empty_pipeline");
}

TEST(StagePipelineTest, RejectsDuplicateNames) {
    StagePipeline::Builder builder;
    builder.add("triage", std::make_unique<NoopStage>())
        .add("triage", std::make_unique<NoopStage>());
    auto built = builder.build();
    ASSERT_TRUE(is_error(built));
    EXPECT_EQ(get_error(built).code, "duplicate_stage");
}

TEST(StagePipelineTest, RejectsEmptyNameAndMissingStage) {
    StagePipeline::Builder unnamed;
    unnamed.add("", std::make_unique<NoopStage>());
    auto no_name = unnamed.build();
    ASSERT_TRUE(is_error(no_name));
    EXPECT_EQ(get_error(no_name).code, "invalid_stage_name");

    StagePipeline::Builder hollow;
    hollow.add("triage", nullptr);
    auto no_stage = hollow.build();
    ASSERT_TRUE(is_error(no_stage));
    EXPECT_EQ(get_error(no_stage).code, "invalid_stage");
}

TEST(StagePipelineTest, DefaultPipelineHasTheSevenStagesInOrder) {
    auto built = make_default_pipeline();
    ASSERT_FALSE(is_error(built));
    EXPECT_EQ(get_value(built).names(), default_stage_names());
    ASSERT_EQ(default_stage_names().size(), 7u);
    EXPECT_EQ(default_stage_names().front(), "triage");
    EXPECT_EQ(default_stage_names().back(), "corpus_admin");
}

}  // namespace
