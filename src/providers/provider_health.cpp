#include "providers/provider_health.h"
#include "logger.h"
#include <sstream>

namespace voicegate {

ProviderHealth::ProviderHealth(const std::string& name, const HealthConfig& config)
    : name_(name), config_(config) {}

void ProviderHealth::record_success() {
    total_calls_.fetch_add(1);
    last_check_ms_.store(wall_clock_ms());
    consecutive_failures_.store(0);

    int previous = reported_status_.exchange(static_cast<int>(HealthStatus::Up));
    if (previous != static_cast<int>(HealthStatus::Up)) {
        LOG_HEALTH(name_ + " recovered: " + health_status_to_string(static_cast<HealthStatus>(previous)) + " -> up");
    }
}

void ProviderHealth::record_failure() {
    total_calls_.fetch_add(1);
    total_failures_.fetch_add(1);
    last_check_ms_.store(wall_clock_ms());
    int failures = consecutive_failures_.fetch_add(1) + 1;

    int next = static_cast<int>(status_for(failures));
    int previous = reported_status_.exchange(next);
    if (previous != next) {
        std::ostringstream oss;
        oss << name_ << " " << health_status_to_string(static_cast<HealthStatus>(previous))
            << " -> " << health_status_to_string(static_cast<HealthStatus>(next))
            << " after " << failures << " consecutive failures";
        Logger::warn("[Health] " + oss.str());
    }
}

HealthStatus ProviderHealth::status() const {
    return status_for(consecutive_failures_.load());
}

ProviderHealthSnapshot ProviderHealth::snapshot() const {
    ProviderHealthSnapshot snap;
    snap.name = name_;
    snap.consecutive_failures = consecutive_failures_.load();
    snap.status = status_for(snap.consecutive_failures);
    snap.last_check_ms = last_check_ms_.load();
    snap.total_calls = total_calls_.load();
    snap.total_failures = total_failures_.load();
    return snap;
}

HealthStatus ProviderHealth::status_for(int failures) const {
    if (failures >= config_.down_after_failures) {
        return HealthStatus::Down;
    }
    if (failures >= config_.degraded_after_failures) {
        return HealthStatus::Degraded;
    }
    return HealthStatus::Up;
}

ProviderHealthTable::ProviderHealthTable(const std::vector<std::string>& names, const HealthConfig& config) {
    for (const auto& name : names) {
        providers_[name] = std::make_unique<ProviderHealth>(name, config);
    }
}

ProviderHealth* ProviderHealthTable::get(const std::string& name) const {
    auto it = providers_.find(name);
    return it == providers_.end() ? nullptr : it->second.get();
}

std::vector<ProviderHealthSnapshot> ProviderHealthTable::snapshots() const {
    std::vector<ProviderHealthSnapshot> result;
    result.reserve(providers_.size());
    for (const auto& entry : providers_) {
        result.push_back(entry.second->snapshot());
    }
    return result;
}

const char* health_status_to_string(HealthStatus status) {
    switch (status) {
        case HealthStatus::Up: return "up";
        case HealthStatus::Degraded: return "degraded";
        case HealthStatus::Down: return "down";
    }
    return "unknown";
}

} // namespace voicegate
