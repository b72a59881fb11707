#include "health_reporter.h"
#include "codec.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace voicegate {

namespace {

bool counts_toward_status(const std::string& name) {
    return name == provider::STT || name == provider::LLM || name == provider::TTS;
}

} // anonymous namespace

HealthReporter::HealthReporter(const Config& config,
                               const SessionRegistry& registry,
                               const ProviderHealthTable& providers)
    : config_(config), registry_(registry), providers_(providers) {}

HealthStatus HealthReporter::aggregate(const std::vector<ProviderHealthSnapshot>& providers,
                                       size_t active_sessions,
                                       size_t max_sessions,
                                       float near_capacity_ratio) {
    bool all_up = true;
    for (const auto& p : providers) {
        if (!counts_toward_status(p.name)) {
            continue;
        }
        if (p.status == HealthStatus::Down) {
            return HealthStatus::Down;
        }
        if (p.status != HealthStatus::Up) {
            all_up = false;
        }
    }

    bool near_capacity = max_sessions > 0 &&
        static_cast<double>(active_sessions) >= static_cast<double>(max_sessions) * near_capacity_ratio;
    return (all_up && !near_capacity) ? HealthStatus::Up : HealthStatus::Degraded;
}

HealthReport HealthReporter::report() const {
    HealthReport r;
    r.active_sessions = registry_.active_count();
    r.max_sessions = registry_.capacity();
    r.providers = providers_.snapshots();
    r.status = aggregate(r.providers, r.active_sessions, r.max_sessions, config_.server.near_capacity_ratio);
    return r;
}

std::string HealthReporter::health_json() const {
    json j;
    j["status"] = health_status_to_string(report().status);
    return j.dump();
}

std::string HealthReporter::status_json() const {
    HealthReport r = report();
    json j;
    j["status"] = health_status_to_string(r.status);
    j["active_sessions"] = r.active_sessions;
    j["max_sessions"] = r.max_sessions;
    j["providers"] = json::object();
    for (const auto& p : r.providers) {
        json entry;
        entry["status"] = health_status_to_string(p.status);
        entry["consecutive_failures"] = p.consecutive_failures;
        entry["last_check"] = p.last_check_ms > 0 ? json(codec::iso8601_from_ms(p.last_check_ms)) : json(nullptr);
        entry["total_calls"] = p.total_calls;
        entry["total_failures"] = p.total_failures;
        j["providers"][p.name] = entry;
    }
    return j.dump();
}

} // namespace voicegate
