#include "events/transport.hpp"

namespace conductor::events {

using core::errors::ErrorCategory;
using core::errors::OrchestrationError;

core::errors::Status InMemoryTransport::send(const std::string& thread_id,
                                             const std::string& frame) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disconnected_.count(thread_id) != 0) {
        return OrchestrationError{ErrorCategory::Connection,
                                  "No live connection for thread " + thread_id,
                                  "transport_disconnected"};
    }
    if (failures_to_inject_ > 0) {
        --failures_to_inject_;
        return OrchestrationError{ErrorCategory::Connection,
                                  "Transient send failure on thread " + thread_id,
                                  "transport_send_failed"};
    }

    frames_[thread_id].push_back(frame);

    auto drop = remaining_before_drop_.find(thread_id);
    if (drop != remaining_before_drop_.end()) {
        if (drop->second <= 1) {
            disconnected_.insert(thread_id);
            remaining_before_drop_.erase(drop);
        } else {
            --drop->second;
        }
    }
    return core::errors::ok();
}

bool InMemoryTransport::is_connected(const std::string& thread_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disconnected_.count(thread_id) == 0;
}

void InMemoryTransport::disconnect(const std::string& thread_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    disconnected_.insert(thread_id);
}

void InMemoryTransport::reconnect(const std::string& thread_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    disconnected_.erase(thread_id);
    remaining_before_drop_.erase(thread_id);
}

void InMemoryTransport::disconnect_after(const std::string& thread_id,
                                         const std::size_t frames) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (frames == 0) {
        disconnected_.insert(thread_id);
        return;
    }
    remaining_before_drop_[thread_id] = frames;
}

void InMemoryTransport::fail_next_sends(const std::size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_to_inject_ = count;
}

std::vector<std::string> InMemoryTransport::frames(const std::string& thread_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = frames_.find(thread_id);
    if (it == frames_.end()) {
        return {};
    }
    return it->second;
}

std::vector<nlohmann::json> InMemoryTransport::events(
    const std::string& thread_id) const {
    std::vector<nlohmann::json> parsed;
    for (const auto& frame : frames(thread_id)) {
        parsed.push_back(nlohmann::json::parse(frame, nullptr, false));
    }
    return parsed;
}

std::size_t InMemoryTransport::frame_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t total = 0;
    for (const auto& [thread_id, thread_frames] : frames_) {
        total += thread_frames.size();
    }
    return total;
}

StreamTransport::StreamTransport(std::ostream& out) : out_(out) {}

core::errors::Status StreamTransport::send(const std::string& thread_id,
                                           const std::string& frame) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << frame << "\n";
    out_.flush();
    if (!out_.good()) {
        return OrchestrationError{ErrorCategory::Connection,
                                  "Output stream closed for thread " + thread_id,
                                  "transport_send_failed"};
    }
    return core::errors::ok();
}

bool StreamTransport::is_connected(const std::string&) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return out_.good();
}

}  // namespace conductor::events
