#pragma once

#include "config.h"
#include "providers/provider_health.h"
#include "session_registry.h"
#include <string>
#include <vector>

namespace voicegate {

/// Aggregated view served by /health and /status
struct HealthReport {
    HealthStatus status = HealthStatus::Up;
    size_t active_sessions = 0;
    size_t max_sessions = 0;
    std::vector<ProviderHealthSnapshot> providers;
};

/**
 * @brief Read-only aggregation of registry load and provider health
 *
 * Overall status is up only when stt, llm and tts are all up and the
 * registry is below the near-capacity ratio; down when any of them is down;
 * degraded otherwise. Automation is listed but never affects the overall
 * status. Never mutates what it reads.
 */
class HealthReporter {
public:
    HealthReporter(const Config& config, const SessionRegistry& registry, const ProviderHealthTable& providers);

    HealthReport report() const;

    /// {"status": ...}
    std::string health_json() const;

    /// {status, active_sessions, max_sessions, providers: {...}}
    std::string status_json() const;

    /// Pure aggregation rule (exposed for tests)
    static HealthStatus aggregate(const std::vector<ProviderHealthSnapshot>& providers,
                                  size_t active_sessions,
                                  size_t max_sessions,
                                  float near_capacity_ratio);

private:
    Config config_;
    const SessionRegistry& registry_;
    const ProviderHealthTable& providers_;
};

} // namespace voicegate
