#pragma once

#include "common.h"
#include "config.h"
#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace voicegate {

enum class HealthStatus {
    Up,
    Degraded,
    Down
};

/// Point-in-time copy of one provider's health counters
struct ProviderHealthSnapshot {
    std::string name;
    HealthStatus status = HealthStatus::Up;
    int consecutive_failures = 0;
    int64_t last_check_ms = 0;         ///< Wall clock of the last attempt, 0 = never called
    uint64_t total_calls = 0;
    uint64_t total_failures = 0;
};

/**
 * @brief Lock-free health record of one provider
 *
 * Updated by adapters after every attempt, read concurrently by the health
 * endpoints. Status is always derived from the consecutive-failure count
 * at read time; the stored status only tracks transitions for logging.
 */
class ProviderHealth {
public:
    ProviderHealth(const std::string& name, const HealthConfig& config);

    void record_success();
    void record_failure();

    HealthStatus status() const;
    ProviderHealthSnapshot snapshot() const;
    const std::string& name() const { return name_; }

private:
    HealthStatus status_for(int failures) const;

    std::string name_;
    HealthConfig config_;
    std::atomic<int> consecutive_failures_{0};
    std::atomic<int> reported_status_{static_cast<int>(HealthStatus::Up)};
    std::atomic<int64_t> last_check_ms_{0};
    std::atomic<uint64_t> total_calls_{0};
    std::atomic<uint64_t> total_failures_{0};
};

/**
 * @brief Fixed provider table, built once at startup
 *
 * The set of providers never changes after construction so lookups need no lock.
 */
class ProviderHealthTable {
public:
    ProviderHealthTable(const std::vector<std::string>& names, const HealthConfig& config);

    /// nullptr for an unknown provider
    ProviderHealth* get(const std::string& name) const;

    /// Snapshots in provider-name order
    std::vector<ProviderHealthSnapshot> snapshots() const;

private:
    std::map<std::string, std::unique_ptr<ProviderHealth>> providers_;
};

const char* health_status_to_string(HealthStatus status);

} // namespace voicegate
