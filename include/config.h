#pragma once

#include "errors.h"
#include <string>
#include <cstdint>
#include <vector>

namespace voicegate {

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8000;
    size_t max_sessions = 64;
    int idle_timeout_ms = 300000;          ///< Close sessions with no activity for this long
    int sweep_interval_ms = 5000;          ///< Idle sweeper period
    float near_capacity_ratio = 0.9f;      ///< Registry at or above this share of max_sessions reports degraded
    int ws_read_timeout_ms = 60000;        ///< WebSocket keep-alive: drop peers silent this long (0 = no timeout)
    std::string service_name = "voicegate";
};

struct AudioConfig {
    int sample_rate = 16000;
    int max_utterance_ms = 30000;          ///< Forced flush (truncation) beyond this duration
};

struct VADConfig {
    float threshold = 0.05f;               ///< RMS (normalized 0-1) above which a frame counts as speech
    float silence_threshold = 0.02f;       ///< RMS below this always counts as silence
    int frame_ms = 20;
    int start_frames_required = 2;         ///< Consecutive speech frames before speech is confirmed
    int end_of_utterance_silence_ms = 700; ///< Silence after speech that ends the utterance
};

struct SessionConfig {
    int pending_text_limit = 1;            ///< Text messages buffered while a turn is in flight
};

/// Bounded retry with exponential backoff (Timeout/Unavailable only)
struct RetryConfig {
    int max_attempts = 3;
    int initial_backoff_ms = 200;
    int max_backoff_ms = 2000;
    int max_rate_limit_wait_ms = 5000;     ///< Cap on a provider-supplied Retry-After
};

/// Common shape of every external provider
struct ProviderConfig {
    std::string endpoint;
    std::string model;
    std::string api_key;                   ///< Inline token (prefer api_key_env)
    std::string api_key_env;               ///< Environment variable holding the token
    int timeout_ms = 10000;
    int connect_timeout_ms = 1000;
    RetryConfig retry;

    /// Token from api_key_env when set and present, else api_key
    std::string resolve_api_key() const;
};

struct STTConfig : ProviderConfig {
    std::string language = "en";
};

struct LLMConfig : ProviderConfig {
    std::string system_prompt = "You are a helpful voice assistant. Keep responses brief and actionable. "
                                "If the user asks you to create, generate, build, research or automate "
                                "something complex, respond with: \"DELEGATE: <task description>\".";
    float temperature = 0.1f;
    int max_tokens = 150;
    int context_max_turns = 6;             ///< Only send the last N turns as context
};

struct TTSConfig : ProviderConfig {
    std::string voice = "alloy";
    std::string response_format = "wav";
};

struct AutomationConfig : ProviderConfig {
    bool enabled = false;
    std::string delegation_prefix = "DELEGATE:";
    int max_tracked_tasks = 1000;          ///< Oldest delegated tasks are forgotten beyond this
};

struct HealthConfig {
    int degraded_after_failures = 3;
    int down_after_failures = 6;
};

struct LogConfig {
    std::string level = "info";
    std::string file;                      ///< Empty = console only
};

struct Config {
    ServerConfig server;
    AudioConfig audio;
    VADConfig vad;
    SessionConfig session;
    STTConfig stt;
    LLMConfig llm;
    TTSConfig tts;
    AutomationConfig automation;
    HealthConfig health;
    LogConfig log;

    /**
     * @brief Load configuration from a JSON file
     *
     * Missing keys keep their defaults. An unreadable or unparsable file is a ConfigError.
     */
    static Result<Config> load_from_file(const std::string& path);

    /// Apply a JSON document (string form) on top of this config
    Result<void> merge_json(const std::string& json_text);

    /**
     * @brief Check invariants and required credentials
     * @return All violations joined in one ConfigError, or success
     */
    Result<void> validate() const;

    void save_to_file(const std::string& path) const;
};

} // namespace voicegate
