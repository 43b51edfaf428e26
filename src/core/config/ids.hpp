#pragma once
#include <chrono>
#include <cstdint>
#include <random>
#include <sstream>
#include <string>

namespace conductor::core::config {

    // Generates "<prefix>-" followed by 8 hex characters, e.g. "run-3fa9c01e"
    inline std::string generate_id(const std::string& prefix) {
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix << "-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    inline std::string generate_run_id() {
        return generate_id("run");
    }

    inline std::int64_t now_unix_ms() {
        const auto now = std::chrono::system_clock::now();
        return static_cast<std::int64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch())
                .count());
    }

} // namespace conductor::core::config
