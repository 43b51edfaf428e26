#pragma once
#include <chrono>
#include <optional>
#include <string>

namespace conductor::protocol {

    // Identity bundle for one run. user_id and thread_id arrive already
    // authenticated.
    struct RunRequest {
        std::string user_request;
        std::string thread_id;
        std::string user_id;
        std::string run_id;
    };

    struct RunOptions {
        std::optional<std::chrono::steady_clock::time_point> deadline;
    };

} // namespace conductor::protocol
