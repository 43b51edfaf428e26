#pragma once

#include <cstddef>
#include <mutex>
#include <ostream>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/orchestration_errors.hpp"

namespace conductor::events {

// A per-thread live connection. send() reports failures instead of throwing.
class Transport {
public:
    virtual ~Transport() = default;

    virtual core::errors::Status send(const std::string& thread_id,
                                      const std::string& frame) = 0;
    virtual bool is_connected(const std::string& thread_id) const = 0;
};

// Records frames per thread. Threads are connected until disconnected.
class InMemoryTransport : public Transport {
public:
    core::errors::Status send(const std::string& thread_id,
                              const std::string& frame) override;
    bool is_connected(const std::string& thread_id) const override;

    void disconnect(const std::string& thread_id);
    void reconnect(const std::string& thread_id);
    // The thread drops after `frames` more frames have been delivered.
    void disconnect_after(const std::string& thread_id, std::size_t frames);
    // The next `count` sends fail with a connection error, then sends recover.
    void fail_next_sends(std::size_t count);

    std::vector<std::string> frames(const std::string& thread_id) const;
    std::vector<nlohmann::json> events(const std::string& thread_id) const;
    std::size_t frame_count() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<std::string>> frames_;
    std::unordered_set<std::string> disconnected_;
    std::unordered_map<std::string, std::size_t> remaining_before_drop_;
    std::size_t failures_to_inject_ = 0;
};

// Writes one JSON line per frame; used by the CLI.
class StreamTransport : public Transport {
public:
    explicit StreamTransport(std::ostream& out);

    core::errors::Status send(const std::string& thread_id,
                              const std::string& frame) override;
    bool is_connected(const std::string& thread_id) const override;

private:
    std::ostream& out_;
    mutable std::mutex mutex_;
};

}  // namespace conductor::events
