#pragma once

/**
 * Test doubles shared by the session and provider tests.
 * - FakeHttpTransport: scripted provider responses keyed by URL, optional blocking.
 * - FakeConnection: in-memory client channel with a blocking read().
 * No network and no WebSocket stack involved.
 */

#include "codec.h"
#include "config.h"
#include "providers/http_transport.h"
#include "transport_session.h"
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace voicegate {
namespace testing {

constexpr const char* STT_URL = "http://stt.test/v1/audio/transcriptions";
constexpr const char* LLM_URL = "http://llm.test/v1/chat/completions";
constexpr const char* TTS_URL = "http://tts.test/v1/audio/speech";
constexpr const char* AUTOMATION_URL = "http://automation.test/api/chat";

inline HttpResponse json_response(const std::string& body, long status = 200) {
    HttpResponse r;
    r.status = status;
    r.body = body;
    r.content_type = "application/json";
    return r;
}

inline HttpResponse status_response(long status, int64_t retry_after_ms = -1) {
    HttpResponse r;
    r.status = status;
    r.body = "{\"error\":\"scripted\"}";
    r.content_type = "application/json";
    r.retry_after_ms = retry_after_ms;
    return r;
}

inline HttpResponse timeout_response() {
    HttpResponse r;
    r.failure = TransportFailure::Timeout;
    r.failure_message = "scripted timeout";
    return r;
}

inline HttpResponse audio_response(const std::string& bytes = "RIFF-fake-audio") {
    HttpResponse r;
    r.status = 200;
    r.body = bytes;
    r.content_type = "audio/wav";
    return r;
}

inline HttpResponse transcript_response(const std::string& text) {
    return json_response("{\"text\":\"" + text + "\"}");
}

inline HttpResponse chat_response(const std::string& content) {
    return json_response("{\"choices\":[{\"message\":{\"role\":\"assistant\",\"content\":\"" + content + "\"}}]}");
}

/**
 * Scripted HttpTransport. Each URL has a queue of one-shot responses and a
 * fallback used once the queue is empty. A blocked URL holds every request
 * until release() or until the request's CancelToken fires.
 */
class FakeHttpTransport : public HttpTransport {
public:
    HttpResponse perform(const HttpRequest& request) override {
        std::unique_lock<std::mutex> lock(mutex_);
        calls_[request.url]++;
        requests_[request.url].push_back(request.body);

        if (blocked_.count(request.url)) {
            waiting_++;
            cv_.notify_all();
            while (blocked_.count(request.url)) {
                if (request.cancel && request.cancel->is_cancelled()) {
                    waiting_--;
                    HttpResponse r;
                    r.failure = TransportFailure::Cancelled;
                    r.failure_message = "cancelled";
                    return r;
                }
                cv_.wait_for(lock, std::chrono::milliseconds(5));
            }
            waiting_--;
        }

        auto& queue = scripted_[request.url];
        if (!queue.empty()) {
            HttpResponse r = queue.front();
            queue.pop_front();
            return r;
        }
        auto it = fallback_.find(request.url);
        if (it != fallback_.end()) {
            return it->second;
        }
        return status_response(404);
    }

    /// One-shot response for the next request to url
    void push(const std::string& url, const HttpResponse& response) {
        std::lock_guard<std::mutex> lock(mutex_);
        scripted_[url].push_back(response);
    }

    /// Response for every request to url once its queue is empty
    void set_default(const std::string& url, const HttpResponse& response) {
        std::lock_guard<std::mutex> lock(mutex_);
        fallback_[url] = response;
    }

    void block(const std::string& url) {
        std::lock_guard<std::mutex> lock(mutex_);
        blocked_[url] = true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            blocked_.clear();
        }
        cv_.notify_all();
    }

    /// Wait until n requests are parked on blocked URLs
    bool wait_for_blocked(int n, int timeout_ms = 2000) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [&] { return waiting_ >= n; });
    }

    int calls(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(url);
        return it == calls_.end() ? 0 : it->second;
    }

    std::vector<std::string> bodies(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = requests_.find(url);
        return it == requests_.end() ? std::vector<std::string>() : it->second;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, std::deque<HttpResponse>> scripted_;
    std::map<std::string, HttpResponse> fallback_;
    std::map<std::string, bool> blocked_;
    std::map<std::string, int> calls_;
    std::map<std::string, std::vector<std::string>> requests_;
    int waiting_ = 0;
};

/**
 * In-memory Connection: the test feeds inbound frames and inspects outbound ones.
 */
class FakeConnection : public Connection {
public:
    Result<std::string> read() override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !open_ || !inbound_.empty(); });
        if (!inbound_.empty()) {
            std::string next = inbound_.front();
            inbound_.pop_front();
            return next;
        }
        return make_transport_error("Connection is closed");
    }

    Result<void> write(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_ || fail_writes_) {
            return make_transport_error("Write failed");
        }
        outbound_.push_back(text);
        cv_.notify_all();
        return Result<void>();
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = false;
        }
        cv_.notify_all();
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_;
    }

    std::string remote_endpoint() const override { return "fake:0"; }

    void push_inbound(const std::string& frame) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            inbound_.push_back(frame);
        }
        cv_.notify_all();
    }

    void set_fail_writes(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_writes_ = fail;
    }

    std::vector<std::string> writes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return outbound_;
    }

    /// Block until at least n frames were written
    bool wait_for_writes(size_t n, int timeout_ms = 2000) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [&] { return outbound_.size() >= n; });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> inbound_;
    std::vector<std::string> outbound_;
    bool open_ = true;
    bool fail_writes_ = false;
};

/// Config pointing every provider at the fake transport, with millisecond backoffs
inline Config make_test_config() {
    Config cfg;
    cfg.stt.endpoint = STT_URL;
    cfg.stt.model = "whisper-test";
    cfg.llm.endpoint = LLM_URL;
    cfg.llm.model = "llm-test";
    cfg.tts.endpoint = TTS_URL;
    cfg.tts.model = "tts-test";
    cfg.automation.endpoint = AUTOMATION_URL;
    for (ProviderConfig* p : std::vector<ProviderConfig*>{&cfg.stt, &cfg.llm, &cfg.tts, &cfg.automation}) {
        p->api_key = "test-key";
        p->retry.max_attempts = 3;
        p->retry.initial_backoff_ms = 1;
        p->retry.max_backoff_ms = 4;
        p->retry.max_rate_limit_wait_ms = 20;
    }
    cfg.automation.retry.max_attempts = 1;
    return cfg;
}

/// 440 Hz sine at the given amplitude (speech-like energy for the VAD)
inline AudioBuffer tone(int ms, int16_t amplitude = 8000, int sample_rate = DEFAULT_SAMPLE_RATE) {
    AudioBuffer out(ms_to_samples(ms, sample_rate));
    for (size_t i = 0; i < out.size(); ++i) {
        double t = static_cast<double>(i) / sample_rate;
        out[i] = static_cast<Sample>(amplitude * std::sin(2.0 * 3.14159265358979 * 440.0 * t));
    }
    return out;
}

inline AudioBuffer silence(int ms, int sample_rate = DEFAULT_SAMPLE_RATE) {
    return AudioBuffer(ms_to_samples(ms, sample_rate), 0);
}

inline void append(AudioBuffer& dst, const AudioBuffer& src) {
    dst.insert(dst.end(), src.begin(), src.end());
}

/// {"type":"voice","content":<base64 PCM>}
inline std::string voice_frame(const AudioBuffer& samples) {
    return "{\"type\":\"voice\",\"content\":\"" + codec::base64_encode(codec::pcm_to_bytes(samples)) + "\"}";
}

inline std::string text_frame(const std::string& text) {
    return "{\"type\":\"text\",\"content\":\"" + text + "\"}";
}

inline std::string control_frame(const std::string& verb) {
    return "{\"type\":\"control\",\"content\":\"" + verb + "\"}";
}

} // namespace testing
} // namespace voicegate
