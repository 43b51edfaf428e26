#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include "core/errors/orchestration_errors.hpp"
#include "core/logging/logger.hpp"

namespace conductor::core::config {

struct OrchestratorConfig {
    static constexpr std::uint32_t kMaxRetries = 10;
    static constexpr std::uint32_t kMaxRetryBackoffMs = 30000;

    std::uint32_t max_retries = 2;
    // Delay before retry n is retry_backoff_ms * 2^(n-1), capped at
    // kMaxRetryBackoffMs.
    std::uint32_t retry_backoff_ms = 50;
    bool halt_on_stage_failure = true;
    // Per-stage halt/continue override, keyed by stage name.
    std::map<std::string, bool> stage_overrides;
    // 0 disables the default run deadline.
    std::uint32_t run_timeout_ms = 0;
    // 0 lifts the cap.
    std::uint32_t max_concurrent_runs_per_user = 3;

    bool halts_on_failure(const std::string& stage_name) const {
        const auto it = stage_overrides.find(stage_name);
        return it == stage_overrides.end() ? halt_on_stage_failure : it->second;
    }
};

struct ResourceConfig {
    std::uint32_t max_clients_per_user = 5;
    std::uint32_t client_ttl_seconds = 300;
    std::uint32_t sweep_interval_ms = 30000;
};

struct NotifierConfig {
    std::uint32_t max_send_attempts = 3;
    std::uint32_t retry_delay_ms = 10;
};

struct StateStoreConfig {
    // Empty keeps snapshots in memory.
    std::filesystem::path directory;
    std::uint32_t snapshot_ttl_seconds = 86400;
};

struct AppConfig {
    OrchestratorConfig orchestrator;
    ResourceConfig resources;
    NotifierConfig notifier;
    StateStoreConfig state_store;
    logging::LogLevel log_level = logging::LogLevel::INFO;
};

// Parses a JSON document. Missing keys keep their defaults.
errors::Result<AppConfig> parse_config(const std::string& json_text);

errors::Result<AppConfig> load_config(const std::filesystem::path& path);

}  // namespace conductor::core::config
