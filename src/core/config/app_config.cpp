#include "core/config/app_config.hpp"

#include <fstream>
#include <limits>
#include <sstream>
#include <nlohmann/json.hpp>

namespace conductor::core::config {

using errors::ErrorCategory;
using errors::OrchestrationError;
using nlohmann::json;

namespace {

OrchestrationError invalid(const std::string& key, const std::string& why) {
    return OrchestrationError{ErrorCategory::Validation,
                              "Invalid config value for '" + key + "': " + why,
                              "invalid_config"};
}

errors::Result<std::uint32_t> read_uint(const json& section,
                                        const std::string& section_name,
                                        const std::string& key,
                                        const std::uint32_t fallback,
                                        const std::uint32_t min_value = 0,
                                        const std::uint32_t max_value =
                                            std::numeric_limits<std::uint32_t>::max()) {
    const auto it = section.find(key);
    if (it == section.end()) {
        return fallback;
    }
    const std::string full_key = section_name + "." + key;
    if (!it->is_number_integer()) {
        return invalid(full_key, "expected an integer");
    }
    const auto value = it->get<std::int64_t>();
    if (value < static_cast<std::int64_t>(min_value) ||
        value > static_cast<std::int64_t>(max_value)) {
        return invalid(full_key, "out of range [" + std::to_string(min_value) + ", " +
                                     std::to_string(max_value) + "]");
    }
    return static_cast<std::uint32_t>(value);
}

errors::Result<bool> read_bool(const json& section,
                               const std::string& section_name,
                               const std::string& key, const bool fallback) {
    const auto it = section.find(key);
    if (it == section.end()) {
        return fallback;
    }
    if (!it->is_boolean()) {
        return invalid(section_name + "." + key, "expected a boolean");
    }
    return it->get<bool>();
}

// Assigns a parsed value or hands back the error.
template <typename T>
bool assign(errors::Result<T> parsed, T& target, OrchestrationError& error) {
    if (errors::is_error(parsed)) {
        error = errors::get_error(parsed);
        return false;
    }
    target = errors::get_value(parsed);
    return true;
}

const json& section_or_empty(const json& root, const std::string& name) {
    static const json kEmpty = json::object();
    const auto it = root.find(name);
    return it == root.end() ? kEmpty : *it;
}

}  // namespace

errors::Result<AppConfig> parse_config(const std::string& json_text) {
    const json root = json::parse(json_text, nullptr, false);
    if (root.is_discarded()) {
        return OrchestrationError{ErrorCategory::Validation,
                                  "Config is not valid JSON.", "invalid_config"};
    }
    if (!root.is_object()) {
        return OrchestrationError{ErrorCategory::Validation,
                                  "Config root must be a JSON object.",
                                  "invalid_config"};
    }
    for (const char* name : {"orchestrator", "resources", "notifier", "state_store"}) {
        const auto it = root.find(name);
        if (it != root.end() && !it->is_object()) {
            return invalid(name, "expected an object");
        }
    }

    AppConfig config;
    OrchestrationError error{ErrorCategory::Validation, "", "invalid_config"};

    const json& orchestrator = section_or_empty(root, "orchestrator");
    auto& orch = config.orchestrator;
    if (!assign(read_uint(orchestrator, "orchestrator", "max_retries", orch.max_retries,
                          0, OrchestratorConfig::kMaxRetries),
                orch.max_retries, error) ||
        !assign(read_uint(orchestrator, "orchestrator", "retry_backoff_ms",
                          orch.retry_backoff_ms, 0,
                          OrchestratorConfig::kMaxRetryBackoffMs),
                orch.retry_backoff_ms, error) ||
        !assign(read_bool(orchestrator, "orchestrator", "halt_on_stage_failure",
                          orch.halt_on_stage_failure),
                orch.halt_on_stage_failure, error) ||
        !assign(read_uint(orchestrator, "orchestrator", "run_timeout_ms",
                          orch.run_timeout_ms),
                orch.run_timeout_ms, error) ||
        !assign(read_uint(orchestrator, "orchestrator", "max_concurrent_runs_per_user",
                          orch.max_concurrent_runs_per_user),
                orch.max_concurrent_runs_per_user, error)) {
        return error;
    }
    const auto overrides = orchestrator.find("stage_overrides");
    if (overrides != orchestrator.end()) {
        if (!overrides->is_object()) {
            return invalid("orchestrator.stage_overrides", "expected an object");
        }
        for (const auto& [stage, halt] : overrides->items()) {
            if (!halt.is_boolean()) {
                return invalid("orchestrator.stage_overrides." + stage,
                               "expected a boolean");
            }
            orch.stage_overrides[stage] = halt.get<bool>();
        }
    }

    const json& resources = section_or_empty(root, "resources");
    auto& res = config.resources;
    if (!assign(read_uint(resources, "resources", "max_clients_per_user",
                          res.max_clients_per_user, 1),
                res.max_clients_per_user, error) ||
        !assign(read_uint(resources, "resources", "client_ttl_seconds",
                          res.client_ttl_seconds),
                res.client_ttl_seconds, error) ||
        !assign(read_uint(resources, "resources", "sweep_interval_ms",
                          res.sweep_interval_ms, 1),
                res.sweep_interval_ms, error)) {
        return error;
    }

    const json& notifier = section_or_empty(root, "notifier");
    if (!assign(read_uint(notifier, "notifier", "max_send_attempts",
                          config.notifier.max_send_attempts, 1),
                config.notifier.max_send_attempts, error) ||
        !assign(read_uint(notifier, "notifier", "retry_delay_ms",
                          config.notifier.retry_delay_ms),
                config.notifier.retry_delay_ms, error)) {
        return error;
    }

    const json& state_store = section_or_empty(root, "state_store");
    const auto directory = state_store.find("directory");
    if (directory != state_store.end()) {
        if (!directory->is_string()) {
            return invalid("state_store.directory", "expected a string");
        }
        config.state_store.directory = directory->get<std::string>();
    }
    if (!assign(read_uint(state_store, "state_store", "snapshot_ttl_seconds",
                          config.state_store.snapshot_ttl_seconds),
                config.state_store.snapshot_ttl_seconds, error)) {
        return error;
    }

    const auto level = root.find("log_level");
    if (level != root.end()) {
        if (!level->is_string() ||
            !logging::Logger::parse_level(level->get<std::string>(),
                                          config.log_level)) {
            return invalid("log_level", "expected one of debug, info, warn, error");
        }
    }

    return config;
}

errors::Result<AppConfig> load_config(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return OrchestrationError{ErrorCategory::Validation,
                                  "Unable to open config file: " + path.string(),
                                  "config_not_found",
                                  "Pass an existing JSON file to --config."};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse_config(buffer.str());
}

}  // namespace conductor::core::config
