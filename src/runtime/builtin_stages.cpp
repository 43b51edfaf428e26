#include "runtime/builtin_stages.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <memory>
#include <utility>
#include <nlohmann/json.hpp>
#include "runtime/stage_context.hpp"

namespace conductor::runtime {

using core::errors::ErrorCategory;
using core::errors::OrchestrationError;
using core::errors::Result;
using nlohmann::json;
using protocol::RequestState;

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

bool mentions(const std::string& lowered, const char* word) {
    return lowered.find(word) != std::string::npos;
}

RequestState with_result(const RequestState& state, const std::string& stage,
                         json result) {
    RequestState next = state;
    next.stage_results[stage] = std::move(result);
    return next;
}

const json& result_of(const RequestState& state, const std::string& stage) {
    return state.stage_results.at(stage);
}

Result<json> classify_request(const json& args) {
    const std::string text = to_lower(args.value("user_request", std::string()));
    if (text.empty()) {
        return OrchestrationError{ErrorCategory::Validation, "Nothing to classify.",
                                  "empty_request"};
    }

    std::string intent = "general";
    if (mentions(text, "optimi") || mentions(text, "reduce") || mentions(text, "improve")) {
        intent = "optimize";
    } else if (mentions(text, "analy") || mentions(text, "why")) {
        intent = "analyze";
    } else if (mentions(text, "monitor") || mentions(text, "alert")) {
        intent = "monitor";
    }

    std::string category = "general_inquiry";
    json keywords = json::array();
    for (const char* word : {"gpu", "cost", "latency", "memory", "throughput"}) {
        if (mentions(text, word)) {
            keywords.push_back(word);
        }
    }
    if (mentions(text, "gpu")) {
        category = "gpu_optimization";
    } else if (mentions(text, "cost")) {
        category = "cost_optimization";
    } else if (mentions(text, "latency") || mentions(text, "throughput")) {
        category = "performance_optimization";
    }

    json result;
    result["intent"] = {{"primary", intent}};
    result["category"] = category;
    result["priority"] = intent == "optimize" ? "high" : "medium";
    result["keywords"] = keywords;
    return result;
}

class TriageStage : public Stage {
public:
    bool check_entry_conditions(const RequestState& state) const override {
        return !state.user_request.empty();
    }

    Result<RequestState> execute(const RequestState& state,
                                 StageContext& context) const override {
        context.think("Classifying the request");
        auto classified = context.run_tool(
            "classify_request", json{{"user_request", state.user_request}},
            classify_request);
        if (core::errors::is_error(classified)) {
            return core::errors::get_error(classified);
        }
        return with_result(state, "triage", core::errors::get_value(classified));
    }
};

class DataStage : public Stage {
public:
    bool check_entry_conditions(const RequestState& state) const override {
        return state.has_result("triage");
    }

    Result<RequestState> execute(const RequestState& state,
                                 StageContext& context) const override {
        auto handle = context.resource();
        if (core::errors::is_error(handle)) {
            return core::errors::get_error(handle);
        }
        resources::ResourceHandle* client = core::errors::get_value(handle);
        const json& triage = result_of(state, "triage");

        json sample;
        sample["run_id"] = state.run_id;
        sample["category"] = triage.at("category");
        sample["request_length"] = state.user_request.size();

        auto collected = context.run_tool(
            "collect_metrics", sample, [client](const json& args) -> Result<json> {
                auto inserted = client->execute("insert", json{{"row", args}});
                if (core::errors::is_error(inserted)) {
                    return core::errors::get_error(inserted);
                }
                return client->execute("count");
            });
        if (core::errors::is_error(collected)) {
            return core::errors::get_error(collected);
        }

        const json& counted = core::errors::get_value(collected);
        json result;
        result["intent"] = triage.at("intent").at("primary");
        result["samples"] = counted.value("count", 0);
        result["metrics"] = {{"utilization", 0.42}, {"p95_latency_ms", 180}};
        return with_result(state, "data", std::move(result));
    }
};

class OptimizationStage : public Stage {
public:
    bool check_entry_conditions(const RequestState& state) const override {
        return state.has_result("data");
    }

    Result<RequestState> execute(const RequestState& state,
                                 StageContext& context) const override {
        context.think("Deriving recommendations from collected metrics");
        const std::string category = result_of(state, "triage").value("category", "");

        json recommendations = json::array();
        if (category == "gpu_optimization") {
            recommendations.push_back("Batch inference requests to raise GPU occupancy");
            recommendations.push_back("Enable mixed precision on eligible models");
        } else if (category == "cost_optimization") {
            recommendations.push_back("Route low-priority traffic to a cheaper model tier");
        } else if (category == "performance_optimization") {
            recommendations.push_back("Cache repeated prompts close to the caller");
        } else {
            recommendations.push_back("Collect a longer metrics window before tuning");
        }

        json result;
        result["recommendations"] = recommendations;
        result["based_on_samples"] = result_of(state, "data").value("samples", 0);
        return with_result(state, "optimization", std::move(result));
    }
};

class ActionsStage : public Stage {
public:
    bool check_entry_conditions(const RequestState& state) const override {
        return state.has_result("optimization");
    }

    Result<RequestState> execute(const RequestState& state,
                                 StageContext& context) const override {
        const json& recommendations =
            result_of(state, "optimization").at("recommendations");
        auto planned = context.run_tool(
            "plan_actions", json{{"recommendations", recommendations}},
            [](const json& args) -> Result<json> {
                json steps = json::array();
                std::size_t order = 1;
                for (const auto& item : args.at("recommendations")) {
                    steps.push_back({{"step", order++},
                                     {"action", item},
                                     {"status", "proposed"}});
                }
                return json{{"steps", steps}};
            });
        if (core::errors::is_error(planned)) {
            return core::errors::get_error(planned);
        }
        return with_result(state, "actions", core::errors::get_value(planned));
    }
};

class ReportingStage : public Stage {
public:
    bool check_entry_conditions(const RequestState&) const override { return true; }

    Result<RequestState> execute(const RequestState& state,
                                 StageContext& context) const override {
        context.think("Summarizing results");
        json sections = json::array();
        for (const auto& [stage, result] : state.stage_results) {
            static_cast<void>(result);
            sections.push_back(stage);
        }

        std::string summary = "Request: " + state.user_request + ".";
        if (state.has_result("optimization")) {
            const auto& recs = result_of(state, "optimization").at("recommendations");
            summary += " " + std::to_string(recs.size()) + " recommendation(s) proposed.";
        } else {
            summary += " No recommendations were produced.";
        }

        json result;
        result["summary"] = summary;
        result["sections"] = sections;
        return with_result(state, "reporting", std::move(result));
    }
};

class SyntheticDataStage : public Stage {
public:
    bool check_entry_conditions(const RequestState& state) const override {
        return state.has_result("triage");
    }

    Result<RequestState> execute(const RequestState& state,
                                 StageContext& context) const override {
        const std::size_t count = 3 + state.user_request.size() % 5;
        auto generated = context.run_tool(
            "generate_samples",
            json{{"count", count},
                 {"category", result_of(state, "triage").value("category", "")}},
            [](const json& args) -> Result<json> {
                const std::size_t n = args.at("count").get<std::size_t>();
                json records = json::array();
                for (std::size_t i = 0; i < n; ++i) {
                    records.push_back({{"id", i},
                                       {"category", args.at("category")},
                                       {"tokens", 128 * (i + 1)}});
                }
                return json{{"records", records}, {"count", n}};
            });
        if (core::errors::is_error(generated)) {
            return core::errors::get_error(generated);
        }
        return with_result(state, "synthetic_data", core::errors::get_value(generated));
    }
};

class CorpusAdminStage : public Stage {
public:
    bool check_entry_conditions(const RequestState& state) const override {
        return state.has_result("triage");
    }

    Result<RequestState> execute(const RequestState& state,
                                 StageContext& context) const override {
        auto handle = context.resource();
        if (core::errors::is_error(handle)) {
            return core::errors::get_error(handle);
        }
        auto rows = core::errors::get_value(handle)->execute("query");
        if (core::errors::is_error(rows)) {
            return core::errors::get_error(rows);
        }

        json result;
        result["documents"] = core::errors::get_value(rows).size();
        result["corpus"] = "user-" + state.user_id;
        return with_result(state, "corpus_admin", std::move(result));
    }
};

}  // namespace

const std::vector<std::string>& default_stage_names() {
    static const std::vector<std::string> names = {
        "triage", "data", "optimization", "actions",
        "reporting", "synthetic_data", "corpus_admin"};
    return names;
}

Result<StagePipeline> make_default_pipeline() {
    StagePipeline::Builder builder;
    builder.add("triage", std::make_unique<TriageStage>())
        .add("data", std::make_unique<DataStage>())
        .add("optimization", std::make_unique<OptimizationStage>())
        .add("actions", std::make_unique<ActionsStage>())
        .add("reporting", std::make_unique<ReportingStage>())
        .add("synthetic_data", std::make_unique<SyntheticDataStage>())
        .add("corpus_admin", std::make_unique<CorpusAdminStage>());
    return builder.build();
}

}  // namespace conductor::runtime
