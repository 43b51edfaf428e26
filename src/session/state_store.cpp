#include "session/state_store.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>
#include <utility>

namespace conductor::session {

using core::errors::ErrorCategory;
using core::errors::OrchestrationError;
using nlohmann::json;

namespace {

json snapshot_to_json(const RunSnapshot& snapshot) {
    json document;
    document["snapshot_id"] = snapshot.snapshot_id;
    document["run_id"] = snapshot.run_id;
    document["thread_id"] = snapshot.thread_id;
    document["user_id"] = snapshot.user_id;
    document["saved_at"] = snapshot.saved_at;
    document["state"] = snapshot.state;
    return document;
}

std::optional<RunSnapshot> snapshot_from_json(const json& document) {
    if (!document.is_object()) {
        return std::nullopt;
    }
    for (const char* key : {"snapshot_id", "run_id", "thread_id", "user_id"}) {
        const auto it = document.find(key);
        if (it == document.end() || !it->is_string()) {
            return std::nullopt;
        }
    }
    const auto saved_at = document.find("saved_at");
    const auto state = document.find("state");
    if (saved_at == document.end() || !saved_at->is_number_integer() ||
        state == document.end()) {
        return std::nullopt;
    }

    RunSnapshot snapshot;
    snapshot.snapshot_id = document["snapshot_id"].get<std::string>();
    snapshot.run_id = document["run_id"].get<std::string>();
    snapshot.thread_id = document["thread_id"].get<std::string>();
    snapshot.user_id = document["user_id"].get<std::string>();
    snapshot.saved_at = saved_at->get<std::int64_t>();
    snapshot.state = *state;
    return snapshot;
}

void sort_by_saved_at(std::vector<RunSnapshot>& snapshots) {
    std::stable_sort(snapshots.begin(), snapshots.end(),
                     [](const RunSnapshot& lhs, const RunSnapshot& rhs) {
                         return lhs.saved_at < rhs.saved_at;
                     });
}

}  // namespace

// ---------------------------------------------------------------------------
// InMemoryStateStore
// ---------------------------------------------------------------------------

core::errors::Status InMemoryStateStore::check_available() const {
    if (!available_) {
        return OrchestrationError{ErrorCategory::Connection,
                                  "State store is unavailable.",
                                  "state_store_unavailable"};
    }
    return core::errors::ok();
}

core::errors::Status InMemoryStateStore::put(const RunSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto status = check_available();
    if (core::errors::is_error(status)) {
        return status;
    }
    snapshots_[snapshot.run_id] = snapshot;
    return core::errors::ok();
}

core::errors::Result<std::optional<RunSnapshot>> InMemoryStateStore::get(
    const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto status = check_available();
    if (core::errors::is_error(status)) {
        return core::errors::get_error(status);
    }
    const auto it = snapshots_.find(run_id);
    if (it == snapshots_.end()) {
        return std::optional<RunSnapshot>{};
    }
    return std::optional<RunSnapshot>{it->second};
}

core::errors::Result<std::vector<RunSnapshot>> InMemoryStateStore::list_thread(
    const std::string& thread_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto status = check_available();
    if (core::errors::is_error(status)) {
        return core::errors::get_error(status);
    }
    std::vector<RunSnapshot> matches;
    for (const auto& [run_id, snapshot] : snapshots_) {
        if (snapshot.thread_id == thread_id) {
            matches.push_back(snapshot);
        }
    }
    sort_by_saved_at(matches);
    return matches;
}

core::errors::Result<std::size_t> InMemoryStateStore::erase_older_than(
    const std::int64_t cutoff_unix_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto status = check_available();
    if (core::errors::is_error(status)) {
        return core::errors::get_error(status);
    }
    std::size_t removed = 0;
    for (auto it = snapshots_.begin(); it != snapshots_.end();) {
        if (it->second.saved_at < cutoff_unix_ms) {
            it = snapshots_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void InMemoryStateStore::set_available(const bool available) {
    std::lock_guard<std::mutex> lock(mutex_);
    available_ = available;
}

std::size_t InMemoryStateStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshots_.size();
}

// ---------------------------------------------------------------------------
// FileStateStore
// ---------------------------------------------------------------------------

FileStateStore::FileStateStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

core::errors::Status FileStateStore::ensure_directory() const {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        return OrchestrationError{ErrorCategory::Connection,
                                  "Unable to create state directory: " +
                                      directory_.string() + " (" + ec.message() + ")",
                                  "state_dir_create_failed"};
    }
    return core::errors::ok();
}

core::errors::Result<std::filesystem::path> FileStateStore::snapshot_path(
    const std::string& run_id) const {
    if (run_id.empty()) {
        return OrchestrationError{ErrorCategory::Validation,
                                  "Run ID cannot be empty.", "invalid_run_id"};
    }
    for (const char c : run_id) {
        const bool allowed = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                             (c >= '0' && c <= '9') || c == '-' || c == '_';
        if (!allowed) {
            return OrchestrationError{ErrorCategory::Validation,
                                      "Run ID contains unsupported characters: " +
                                          run_id,
                                      "invalid_run_id",
                                      "Use letters, digits, '-' and '_'."};
        }
    }
    return directory_ / (run_id + ".json");
}

core::errors::Status FileStateStore::put(const RunSnapshot& snapshot) {
    auto path_result = snapshot_path(snapshot.run_id);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::lock_guard<std::mutex> lock(mutex_);
    auto dir_status = ensure_directory();
    if (core::errors::is_error(dir_status)) {
        return dir_status;
    }

    auto tmp_path = path;
    tmp_path += ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out.is_open()) {
            return OrchestrationError{ErrorCategory::Connection,
                                      "Unable to open snapshot file: " +
                                          tmp_path.string(),
                                      "snapshot_open_failed"};
        }
        out << snapshot_to_json(snapshot).dump(-1, ' ', false,
                                               json::error_handler_t::replace)
            << "\n";
        if (!out.good()) {
            return OrchestrationError{ErrorCategory::Connection,
                                      "Unable to write snapshot file: " +
                                          tmp_path.string(),
                                      "snapshot_write_failed"};
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        return OrchestrationError{ErrorCategory::Connection,
                                  "Unable to commit snapshot file: " +
                                      path.string() + " (" + ec.message() + ")",
                                  "snapshot_write_failed"};
    }
    return core::errors::ok();
}

core::errors::Result<std::optional<RunSnapshot>> FileStateStore::get(
    const std::string& run_id) const {
    auto path_result = snapshot_path(run_id);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        return std::optional<RunSnapshot>{};
    }
    std::ifstream in(path);
    if (!in.is_open()) {
        return OrchestrationError{ErrorCategory::Connection,
                                  "Unable to open snapshot file: " + path.string(),
                                  "snapshot_open_failed"};
    }
    const json document = json::parse(in, nullptr, false);
    auto snapshot = snapshot_from_json(document);
    if (!snapshot.has_value()) {
        return OrchestrationError{ErrorCategory::Internal,
                                  "Snapshot file is malformed: " + path.string(),
                                  "corrupt_snapshot"};
    }
    return snapshot;
}

core::errors::Result<std::vector<RunSnapshot>> FileStateStore::read_all() const {
    std::vector<RunSnapshot> snapshots;
    std::error_code ec;
    if (!std::filesystem::exists(directory_, ec) || ec) {
        return snapshots;
    }
    std::filesystem::directory_iterator it(directory_, ec);
    if (ec) {
        return OrchestrationError{ErrorCategory::Connection,
                                  "Unable to list state directory: " +
                                      directory_.string(),
                                  "state_dir_list_failed"};
    }
    for (const auto& entry : it) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }
        std::ifstream in(entry.path());
        const json document = json::parse(in, nullptr, false);
        auto snapshot = snapshot_from_json(document);
        if (snapshot.has_value()) {
            snapshots.push_back(std::move(snapshot.value()));
        }
    }
    return snapshots;
}

core::errors::Result<std::vector<RunSnapshot>> FileStateStore::list_thread(
    const std::string& thread_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto all = read_all();
    if (core::errors::is_error(all)) {
        return all;
    }
    std::vector<RunSnapshot> matches;
    for (const auto& snapshot : core::errors::get_value(all)) {
        if (snapshot.thread_id == thread_id) {
            matches.push_back(snapshot);
        }
    }
    sort_by_saved_at(matches);
    return matches;
}

core::errors::Result<std::size_t> FileStateStore::erase_older_than(
    const std::int64_t cutoff_unix_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto all = read_all();
    if (core::errors::is_error(all)) {
        return core::errors::get_error(all);
    }
    std::size_t removed = 0;
    for (const auto& snapshot : core::errors::get_value(all)) {
        if (snapshot.saved_at >= cutoff_unix_ms) {
            continue;
        }
        std::error_code ec;
        if (std::filesystem::remove(directory_ / (snapshot.run_id + ".json"), ec)) {
            ++removed;
        }
    }
    return removed;
}

}  // namespace conductor::session
