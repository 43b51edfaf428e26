#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/orchestration_errors.hpp"

namespace conductor::app::cli {

    enum class Command {
        Run,      // one run of the built-in pipeline
        Channel   // route inbound frames read from stdin
    };

    struct CliOptions {
        Command command = Command::Run;
        std::string task;
        std::string user_id;
        std::string thread_id;
        std::optional<std::string> run_id;
        std::optional<std::filesystem::path> config_path;
        std::optional<std::filesystem::path> state_dir;
        std::optional<std::uint32_t> timeout_ms;
        bool verbose = false;
    };

    conductor::core::errors::Result<CliOptions> parse_and_validate(int argc, char* argv[]);
}
