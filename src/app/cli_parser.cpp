#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <vector>

namespace conductor::app::cli {

    using namespace conductor::core::errors;

    namespace {

        constexpr const char* kUsage =
            "Usage: conductor_cli run --task \"...\" --user ID --thread ID | "
            "conductor_cli channel --user ID --thread ID";

        // 1. Raw Options Struct (Internal only)
        struct RawCliOptions {
            std::optional<std::string> task;
            std::optional<std::string> user;
            std::optional<std::string> thread;
            std::optional<std::string> run_id;
            std::optional<std::string> config;
            std::optional<std::string> state_dir;
            std::optional<std::string> timeout_ms;
            bool verbose = false;
        };

        bool is_identifier(const std::string& text) {
            if (text.empty() || text.size() > 128) {
                return false;
            }
            for (const char c : text) {
                const bool allowed = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                                     (c >= '0' && c <= '9') || c == '-' || c == '_';
                if (!allowed) {
                    return false;
                }
            }
            return true;
        }

    }  // namespace

    Result<CliOptions> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return OrchestrationError{ErrorCategory::Validation, "No command provided.", "missing_command", kUsage};
        }

        CliOptions options;
        const std::string command = argv[1];
        if (command == "run") {
            options.command = Command::Run;
        } else if (command == "channel") {
            options.command = Command::Channel;
        } else {
            return OrchestrationError{ErrorCategory::Validation, "Unknown command: " + command, "unknown_command", "Supported commands are 'run' and 'channel'."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            std::optional<std::string>* target = nullptr;
            if (args[i] == "--task") target = &raw.task;
            else if (args[i] == "--user") target = &raw.user;
            else if (args[i] == "--thread") target = &raw.thread;
            else if (args[i] == "--run-id") target = &raw.run_id;
            else if (args[i] == "--config") target = &raw.config;
            else if (args[i] == "--state-dir") target = &raw.state_dir;
            else if (args[i] == "--timeout-ms") target = &raw.timeout_ms;
            else if (args[i] == "--verbose") {
                raw.verbose = true;
                continue;
            } else {
                return OrchestrationError{ErrorCategory::Validation, "Unknown argument: " + args[i], "unknown_argument", kUsage};
            }

            if (i + 1 >= args.size()) {
                return OrchestrationError{ErrorCategory::Validation, "Missing value for " + args[i], "missing_value"};
            }
            *target = args[++i];
        }

        // 3. Validator Phase: Enforce logic and bounds
        options.verbose = raw.verbose;

        if (!raw.user.has_value() || !raw.thread.has_value()) {
            return OrchestrationError{ErrorCategory::Validation, "Both --user and --thread are required", "missing_required_flag", kUsage};
        }
        if (!is_identifier(raw.user.value()) || !is_identifier(raw.thread.value())) {
            return OrchestrationError{ErrorCategory::Validation, "Invalid --user or --thread", "invalid_identifier", "Use letters, digits, '-' and '_' only."};
        }
        options.user_id = raw.user.value();
        options.thread_id = raw.thread.value();

        if (options.command == Command::Run) {
            if (!raw.task.has_value() || raw.task->empty()) {
                return OrchestrationError{ErrorCategory::Validation, "The run command requires --task", "missing_required_flag", kUsage};
            }
            options.task = raw.task.value();
        } else if (raw.task.has_value() || raw.run_id.has_value()) {
            return OrchestrationError{ErrorCategory::Validation, "--task and --run-id only apply to the run command", "conflicting_flags", "Send user_message frames on stdin instead."};
        }

        if (raw.run_id) {
            if (!is_identifier(raw.run_id.value())) {
                return OrchestrationError{ErrorCategory::Validation, "Invalid --run-id", "invalid_identifier", "Use letters, digits, '-' and '_' only."};
            }
            options.run_id = raw.run_id.value();
        }

        // Exception-free integer parsing
        if (raw.timeout_ms) {
            uint32_t timeout = 0;
            const char* begin = raw.timeout_ms->data();
            const char* end = raw.timeout_ms->data() + raw.timeout_ms->size();
            auto [ptr, ec] = std::from_chars(begin, end, timeout);
            if (ec != std::errc() || ptr != end) {
                return OrchestrationError{ErrorCategory::Validation, "Invalid number for --timeout-ms", "invalid_integer", "Provide a positive integer."};
            }
            if (timeout == 0 || timeout > 3600000) {
                return OrchestrationError{ErrorCategory::Validation, "--timeout-ms out of bounds", "bounds_error", "Must be between 1 and 3600000."};
            }
            options.timeout_ms = timeout;
        }

        // Path validation
        if (raw.config) {
            std::filesystem::path p(raw.config.value());
            std::error_code path_ec;
            const bool is_file = std::filesystem::is_regular_file(p, path_ec);
            if (path_ec || !is_file) {
                return OrchestrationError{ErrorCategory::Validation, "Config file does not exist: " + p.string(), "invalid_path"};
            }
            options.config_path = std::move(p);
        }

        if (raw.state_dir) {
            std::filesystem::path p(raw.state_dir.value());
            std::error_code path_ec;
            const bool exists = std::filesystem::exists(p, path_ec);
            if (!path_ec && exists && !std::filesystem::is_directory(p, path_ec)) {
                return OrchestrationError{ErrorCategory::Validation, "State directory is not a directory: " + p.string(), "invalid_path"};
            }
            options.state_dir = std::move(p);
        }

        return options;
    }

} // namespace conductor::app::cli
