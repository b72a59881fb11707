#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

void apply_retry(voicegate::RetryConfig& r, const json& j) {
    if (j.contains("max_attempts")) r.max_attempts = j["max_attempts"];
    if (j.contains("initial_backoff_ms")) r.initial_backoff_ms = j["initial_backoff_ms"];
    if (j.contains("max_backoff_ms")) r.max_backoff_ms = j["max_backoff_ms"];
    if (j.contains("max_rate_limit_wait_ms")) r.max_rate_limit_wait_ms = j["max_rate_limit_wait_ms"];
}

void apply_provider(voicegate::ProviderConfig& p, const json& j) {
    if (j.contains("endpoint")) p.endpoint = j["endpoint"];
    if (j.contains("model")) p.model = j["model"];
    if (j.contains("api_key")) p.api_key = j["api_key"];
    if (j.contains("api_key_env")) p.api_key_env = j["api_key_env"];
    if (j.contains("timeout_ms")) p.timeout_ms = j["timeout_ms"];
    if (j.contains("connect_timeout_ms")) p.connect_timeout_ms = j["connect_timeout_ms"];
    if (j.contains("retry") && j["retry"].is_object()) apply_retry(p.retry, j["retry"]);
}

json retry_to_json(const voicegate::RetryConfig& r) {
    json j;
    j["max_attempts"] = r.max_attempts;
    j["initial_backoff_ms"] = r.initial_backoff_ms;
    j["max_backoff_ms"] = r.max_backoff_ms;
    j["max_rate_limit_wait_ms"] = r.max_rate_limit_wait_ms;
    return j;
}

json provider_to_json(const voicegate::ProviderConfig& p) {
    json j;
    j["endpoint"] = p.endpoint;
    j["model"] = p.model;
    // Inline tokens are never written back; only the variable name
    if (!p.api_key_env.empty()) j["api_key_env"] = p.api_key_env;
    j["timeout_ms"] = p.timeout_ms;
    j["connect_timeout_ms"] = p.connect_timeout_ms;
    j["retry"] = retry_to_json(p.retry);
    return j;
}

/// Apply full JSON config (all sections) into cfg
void apply_json_to_config(voicegate::Config& cfg, const json& j) {
    // Server config
    if (j.contains("server")) {
        auto& s = j["server"];
        if (s.contains("host")) cfg.server.host = s["host"];
        if (s.contains("port")) cfg.server.port = s["port"];
        if (s.contains("max_sessions")) cfg.server.max_sessions = s["max_sessions"];
        if (s.contains("idle_timeout_ms")) cfg.server.idle_timeout_ms = s["idle_timeout_ms"];
        if (s.contains("sweep_interval_ms")) cfg.server.sweep_interval_ms = s["sweep_interval_ms"];
        if (s.contains("near_capacity_ratio")) cfg.server.near_capacity_ratio = s["near_capacity_ratio"];
        if (s.contains("ws_read_timeout_ms")) cfg.server.ws_read_timeout_ms = s["ws_read_timeout_ms"];
        if (s.contains("service_name")) cfg.server.service_name = s["service_name"];
    }

    // Audio config
    if (j.contains("audio")) {
        auto& a = j["audio"];
        if (a.contains("sample_rate")) cfg.audio.sample_rate = a["sample_rate"];
        if (a.contains("max_utterance_ms")) cfg.audio.max_utterance_ms = a["max_utterance_ms"];
    }

    // VAD config
    if (j.contains("vad")) {
        auto& v = j["vad"];
        if (v.contains("threshold")) cfg.vad.threshold = v["threshold"];
        if (v.contains("silence_threshold")) cfg.vad.silence_threshold = v["silence_threshold"];
        if (v.contains("frame_ms")) cfg.vad.frame_ms = v["frame_ms"];
        if (v.contains("start_frames_required")) cfg.vad.start_frames_required = v["start_frames_required"];
        if (v.contains("end_of_utterance_silence_ms"))
            cfg.vad.end_of_utterance_silence_ms = v["end_of_utterance_silence_ms"];
    }

    if (j.contains("session")) {
        auto& s = j["session"];
        if (s.contains("pending_text_limit")) cfg.session.pending_text_limit = s["pending_text_limit"];
    }

    // STT config
    if (j.contains("stt")) {
        auto& s = j["stt"];
        apply_provider(cfg.stt, s);
        if (s.contains("language")) cfg.stt.language = s["language"];
    }

    // LLM config
    if (j.contains("llm")) {
        auto& l = j["llm"];
        apply_provider(cfg.llm, l);
        if (l.contains("system_prompt")) cfg.llm.system_prompt = l["system_prompt"];
        if (l.contains("temperature")) cfg.llm.temperature = l["temperature"];
        if (l.contains("max_tokens")) cfg.llm.max_tokens = l["max_tokens"];
        if (l.contains("context_max_turns")) cfg.llm.context_max_turns = l["context_max_turns"];
    }

    // TTS config
    if (j.contains("tts")) {
        auto& t = j["tts"];
        apply_provider(cfg.tts, t);
        if (t.contains("voice")) cfg.tts.voice = t["voice"];
        if (t.contains("response_format")) cfg.tts.response_format = t["response_format"];
    }

    // Core automation (task delegation) config
    if (j.contains("automation")) {
        auto& a = j["automation"];
        apply_provider(cfg.automation, a);
        if (a.contains("enabled")) cfg.automation.enabled = a["enabled"];
        if (a.contains("delegation_prefix")) cfg.automation.delegation_prefix = a["delegation_prefix"];
        if (a.contains("max_tracked_tasks")) cfg.automation.max_tracked_tasks = a["max_tracked_tasks"];
    }

    if (j.contains("health")) {
        auto& h = j["health"];
        if (h.contains("degraded_after_failures")) cfg.health.degraded_after_failures = h["degraded_after_failures"];
        if (h.contains("down_after_failures")) cfg.health.down_after_failures = h["down_after_failures"];
    }

    if (j.contains("log")) {
        auto& l = j["log"];
        if (l.contains("level")) cfg.log.level = l["level"];
        if (l.contains("file")) cfg.log.file = l["file"];
    }
}

void check_provider(const char* name, const voicegate::ProviderConfig& p, bool key_required,
                    std::vector<std::string>& problems) {
    std::string n(name);
    if (p.endpoint.empty()) problems.push_back(n + ".endpoint is empty");
    if (p.timeout_ms <= 0) problems.push_back(n + ".timeout_ms must be positive");
    if (p.retry.max_attempts < 1) problems.push_back(n + ".retry.max_attempts must be at least 1");
    if (p.retry.initial_backoff_ms < 0 || p.retry.max_backoff_ms < p.retry.initial_backoff_ms)
        problems.push_back(n + ".retry backoff must satisfy 0 <= initial_backoff_ms <= max_backoff_ms");
    if (key_required && p.resolve_api_key().empty()) {
        problems.push_back(n + " has no API key (set api_key_env" +
                           (p.api_key_env.empty() ? std::string() : " variable " + p.api_key_env) +
                           " or api_key)");
    }
}

} // anonymous namespace

namespace voicegate {

std::string ProviderConfig::resolve_api_key() const {
    if (!api_key_env.empty()) {
        const char* value = std::getenv(api_key_env.c_str());
        if (value && *value) {
            return std::string(value);
        }
    }
    return api_key;
}

Result<Config> Config::load_from_file(const std::string& path) {
    Config cfg;

    std::ifstream file(expand_path(path));
    if (!file.is_open()) {
        return make_error(ErrorType::ConfigError, "Could not open config file: " + path);
    }
    json j;
    try {
        file >> j;
        apply_json_to_config(cfg, j);
    } catch (const json::exception& e) {
        return make_error(ErrorType::ConfigError, "Error parsing config " + path + ": " + e.what());
    }

    if (!cfg.log.file.empty()) {
        cfg.log.file = resolve_relative_to(path, cfg.log.file);
    }

    Logger::info("Loaded config: " + path);
    return cfg;
}

Result<void> Config::merge_json(const std::string& json_text) {
    try {
        json j = json::parse(json_text);
        apply_json_to_config(*this, j);
    } catch (const json::exception& e) {
        return make_error(ErrorType::ConfigError, std::string("Error parsing config JSON: ") + e.what());
    }
    return Result<void>();
}

Result<void> Config::validate() const {
    std::vector<std::string> problems;

    if (server.port <= 0 || server.port > 65535) problems.push_back("server.port out of range");
    if (server.max_sessions == 0) problems.push_back("server.max_sessions must be positive");
    if (server.idle_timeout_ms <= 0) problems.push_back("server.idle_timeout_ms must be positive");
    if (server.sweep_interval_ms <= 0) problems.push_back("server.sweep_interval_ms must be positive");
    if (server.near_capacity_ratio <= 0.0f || server.near_capacity_ratio > 1.0f)
        problems.push_back("server.near_capacity_ratio must be in (0, 1]");

    if (audio.sample_rate <= 0) problems.push_back("audio.sample_rate must be positive");
    if (audio.max_utterance_ms <= 0) problems.push_back("audio.max_utterance_ms must be positive");
    if (vad.frame_ms <= 0) problems.push_back("vad.frame_ms must be positive");
    if (vad.end_of_utterance_silence_ms < vad.frame_ms)
        problems.push_back("vad.end_of_utterance_silence_ms must be at least one frame");
    if (vad.start_frames_required < 1) problems.push_back("vad.start_frames_required must be at least 1");
    if (session.pending_text_limit < 0) problems.push_back("session.pending_text_limit must not be negative");

    check_provider("stt", stt, true, problems);
    // Local Ollama (/api/chat) runs without a token
    check_provider("llm", llm, llm.endpoint.find("/api/chat") == std::string::npos, problems);
    check_provider("tts", tts, true, problems);
    if (automation.enabled) {
        check_provider("automation", automation, false, problems);
    }
    if (automation.max_tracked_tasks < 1) problems.push_back("automation.max_tracked_tasks must be positive");

    if (health.degraded_after_failures < 1 || health.down_after_failures <= health.degraded_after_failures)
        problems.push_back("health thresholds must satisfy 1 <= degraded_after_failures < down_after_failures");

    if (problems.empty()) {
        return Result<void>();
    }
    std::ostringstream oss;
    oss << "Invalid configuration:";
    for (const auto& p : problems) {
        oss << "\n  - " << p;
    }
    return make_error(ErrorType::ConfigError, oss.str());
}

void Config::save_to_file(const std::string& path) const {
    json j;

    j["server"]["host"] = server.host;
    j["server"]["port"] = server.port;
    j["server"]["max_sessions"] = server.max_sessions;
    j["server"]["idle_timeout_ms"] = server.idle_timeout_ms;
    j["server"]["sweep_interval_ms"] = server.sweep_interval_ms;
    j["server"]["near_capacity_ratio"] = server.near_capacity_ratio;
    j["server"]["ws_read_timeout_ms"] = server.ws_read_timeout_ms;
    j["server"]["service_name"] = server.service_name;

    j["audio"]["sample_rate"] = audio.sample_rate;
    j["audio"]["max_utterance_ms"] = audio.max_utterance_ms;

    j["vad"]["threshold"] = vad.threshold;
    j["vad"]["silence_threshold"] = vad.silence_threshold;
    j["vad"]["frame_ms"] = vad.frame_ms;
    j["vad"]["start_frames_required"] = vad.start_frames_required;
    j["vad"]["end_of_utterance_silence_ms"] = vad.end_of_utterance_silence_ms;

    j["session"]["pending_text_limit"] = session.pending_text_limit;

    j["stt"] = provider_to_json(stt);
    j["stt"]["language"] = stt.language;

    j["llm"] = provider_to_json(llm);
    j["llm"]["system_prompt"] = llm.system_prompt;
    j["llm"]["temperature"] = llm.temperature;
    j["llm"]["max_tokens"] = llm.max_tokens;
    j["llm"]["context_max_turns"] = llm.context_max_turns;

    j["tts"] = provider_to_json(tts);
    j["tts"]["voice"] = tts.voice;
    j["tts"]["response_format"] = tts.response_format;

    j["automation"] = provider_to_json(automation);
    j["automation"]["enabled"] = automation.enabled;
    j["automation"]["delegation_prefix"] = automation.delegation_prefix;
    j["automation"]["max_tracked_tasks"] = automation.max_tracked_tasks;

    j["health"]["degraded_after_failures"] = health.degraded_after_failures;
    j["health"]["down_after_failures"] = health.down_after_failures;

    j["log"]["level"] = log.level;
    j["log"]["file"] = log.file;

    std::ofstream file(path);
    if (file.is_open()) {
        file << j.dump(2);
    } else {
        Logger::warn("Could not write config file: " + path);
    }
}

} // namespace voicegate
