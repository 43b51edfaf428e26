#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/orchestration_errors.hpp"

namespace conductor::resources {

// The underlying client a handle leases. Every data-bearing call carries the
// owning user so the resource can enforce its own visibility rules.
class ResourceClient {
public:
    virtual ~ResourceClient() = default;

    virtual core::errors::Status connect() = 0;
    virtual core::errors::Status ping() = 0;
    virtual core::errors::Result<nlohmann::json> execute(
        const std::string& user_id, const std::string& operation,
        const nlohmann::json& params) = 0;
};

using ClientConnector = std::function<std::unique_ptr<ResourceClient>()>;

// Shared in-process analytics store. Rows are partitioned by user; a query
// only ever sees the caller's partition.
class AnalyticsBackend {
public:
    void set_available(bool available);
    bool available() const;
    // The next `count` connection attempts are refused.
    void refuse_next_connections(std::size_t count);
    bool accept_connection();

    void insert(const std::string& user_id, nlohmann::json row);
    std::vector<nlohmann::json> rows_for(const std::string& user_id) const;
    std::size_t total_rows() const;

private:
    mutable std::mutex mutex_;
    bool available_ = true;
    std::size_t refusals_ = 0;
    std::unordered_map<std::string, std::vector<nlohmann::json>> rows_;
};

// Operations: "insert" {row}, "query" {} and "count" {}.
class AnalyticsClient : public ResourceClient {
public:
    explicit AnalyticsClient(std::shared_ptr<AnalyticsBackend> backend);

    core::errors::Status connect() override;
    core::errors::Status ping() override;
    core::errors::Result<nlohmann::json> execute(
        const std::string& user_id, const std::string& operation,
        const nlohmann::json& params) override;

private:
    std::shared_ptr<AnalyticsBackend> backend_;
    bool connected_ = false;
};

ClientConnector make_analytics_connector(std::shared_ptr<AnalyticsBackend> backend);

}  // namespace conductor::resources
