#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include <memory>

namespace voicegate {

// Audio types
using Sample = int16_t;
using AudioFrame = std::vector<Sample>;
using AudioBuffer = std::vector<Sample>;
using Bytes = std::vector<uint8_t>;

// Timing
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

inline int64_t ms_since(TimePoint start) {
    auto now = Clock::now();
    return std::chrono::duration_cast<Duration>(now - start).count();
}

/// Wall-clock milliseconds since epoch (for timestamps reported to clients)
inline int64_t wall_clock_ms() {
    return std::chrono::duration_cast<Duration>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Audio format constants
constexpr int DEFAULT_SAMPLE_RATE = 16000;
constexpr int FRAME_SIZE_MS = 20;
constexpr int BYTES_PER_SAMPLE = sizeof(Sample);

inline size_t ms_to_samples(int ms, int sample_rate = DEFAULT_SAMPLE_RATE) {
    return (static_cast<size_t>(ms) * static_cast<size_t>(sample_rate)) / 1000;
}

inline int64_t samples_to_ms(size_t samples, int sample_rate = DEFAULT_SAMPLE_RATE) {
    return static_cast<int64_t>((samples * 1000) / static_cast<size_t>(sample_rate));
}

/// Opaque session token; also the correlation id of every pipeline request
using SessionId = std::string;

/// Pipeline provider names (keys of the provider health table)
namespace provider {
    constexpr const char* STT = "stt";
    constexpr const char* LLM = "llm";
    constexpr const char* TTS = "tts";
    constexpr const char* AUTOMATION = "automation";
}

} // namespace voicegate
