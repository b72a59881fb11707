#include "codec.h"
#include <algorithm>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace voicegate {
namespace codec {

namespace {

const char BASE64_CHARS[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789+/";

int base64_value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

uint16_t read_u16(const Bytes& b, size_t off) {
    return static_cast<uint16_t>(b[off] | (b[off + 1] << 8));
}

uint32_t read_u32(const Bytes& b, size_t off) {
    return static_cast<uint32_t>(b[off]) |
           (static_cast<uint32_t>(b[off + 1]) << 8) |
           (static_cast<uint32_t>(b[off + 2]) << 16) |
           (static_cast<uint32_t>(b[off + 3]) << 24);
}

void write_u16(Bytes& b, uint16_t v) {
    b.push_back(static_cast<uint8_t>(v & 0xff));
    b.push_back(static_cast<uint8_t>((v >> 8) & 0xff));
}

void write_u32(Bytes& b, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        b.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xff));
    }
}

void write_tag(Bytes& b, const char* tag) {
    b.insert(b.end(), tag, tag + 4);
}

} // anonymous namespace

std::string base64_encode(const uint8_t* data, size_t size) {
    std::string out;
    out.reserve(((size + 2) / 3) * 4);
    size_t i = 0;
    while (i + 3 <= size) {
        uint32_t n = (static_cast<uint32_t>(data[i]) << 16) |
                     (static_cast<uint32_t>(data[i + 1]) << 8) |
                     static_cast<uint32_t>(data[i + 2]);
        out.push_back(BASE64_CHARS[(n >> 18) & 0x3f]);
        out.push_back(BASE64_CHARS[(n >> 12) & 0x3f]);
        out.push_back(BASE64_CHARS[(n >> 6) & 0x3f]);
        out.push_back(BASE64_CHARS[n & 0x3f]);
        i += 3;
    }
    size_t rest = size - i;
    if (rest == 1) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        out.push_back(BASE64_CHARS[(n >> 18) & 0x3f]);
        out.push_back(BASE64_CHARS[(n >> 12) & 0x3f]);
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (static_cast<uint32_t>(data[i]) << 16) |
                     (static_cast<uint32_t>(data[i + 1]) << 8);
        out.push_back(BASE64_CHARS[(n >> 18) & 0x3f]);
        out.push_back(BASE64_CHARS[(n >> 12) & 0x3f]);
        out.push_back(BASE64_CHARS[(n >> 6) & 0x3f]);
        out.push_back('=');
    }
    return out;
}

std::string base64_encode(const Bytes& data) {
    return base64_encode(data.data(), data.size());
}

std::optional<Bytes> base64_decode(const std::string& text) {
    std::string clean;
    clean.reserve(text.size());
    for (char c : text) {
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
        clean.push_back(c);
    }
    if (clean.size() % 4 != 0) {
        return std::nullopt;
    }

    Bytes out;
    out.reserve((clean.size() / 4) * 3);
    for (size_t i = 0; i < clean.size(); i += 4) {
        int v[4];
        int padding = 0;
        for (int k = 0; k < 4; ++k) {
            char c = clean[i + k];
            if (c == '=') {
                // Padding is only legal in the last two positions of the last quantum
                if (i + 4 != clean.size() || k < 2) return std::nullopt;
                v[k] = 0;
                padding++;
            } else {
                if (padding > 0) return std::nullopt;
                v[k] = base64_value(c);
                if (v[k] < 0) return std::nullopt;
            }
        }
        uint32_t n = (static_cast<uint32_t>(v[0]) << 18) | (static_cast<uint32_t>(v[1]) << 12) |
                     (static_cast<uint32_t>(v[2]) << 6) | static_cast<uint32_t>(v[3]);
        out.push_back(static_cast<uint8_t>((n >> 16) & 0xff));
        if (padding < 2) out.push_back(static_cast<uint8_t>((n >> 8) & 0xff));
        if (padding < 1) out.push_back(static_cast<uint8_t>(n & 0xff));
    }
    return out;
}

std::string iso8601_now() {
    return iso8601_from_ms(wall_clock_ms());
}

std::string iso8601_from_ms(int64_t epoch_ms) {
    std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
    int64_t ms = epoch_ms % 1000;
    std::tm utc_tm{};
    gmtime_r(&seconds, &utc_tm);

    std::ostringstream oss;
    oss << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms << "Z";
    return oss.str();
}

std::optional<AudioBuffer> pcm_from_bytes(const Bytes& bytes) {
    if (bytes.size() % BYTES_PER_SAMPLE != 0) {
        return std::nullopt;
    }
    AudioBuffer samples(bytes.size() / BYTES_PER_SAMPLE);
    for (size_t i = 0; i < samples.size(); ++i) {
        samples[i] = static_cast<Sample>(read_u16(bytes, i * 2));
    }
    return samples;
}

Bytes pcm_to_bytes(const AudioBuffer& samples) {
    Bytes out;
    out.reserve(samples.size() * BYTES_PER_SAMPLE);
    for (Sample s : samples) {
        write_u16(out, static_cast<uint16_t>(s));
    }
    return out;
}

bool is_wav(const Bytes& bytes) {
    return bytes.size() >= 12 &&
           std::memcmp(bytes.data(), "RIFF", 4) == 0 &&
           std::memcmp(bytes.data() + 8, "WAVE", 4) == 0;
}

Result<AudioBuffer> wav_to_pcm(const Bytes& wav, int expected_sample_rate) {
    if (!is_wav(wav)) {
        return make_protocol_error("Audio is not a RIFF/WAVE container");
    }

    bool have_format = false;
    size_t off = 12;
    while (off + 8 <= wav.size()) {
        std::string tag(reinterpret_cast<const char*>(wav.data() + off), 4);
        uint32_t chunk_size = read_u32(wav, off + 4);
        size_t body = off + 8;

        if (tag == "fmt ") {
            if (chunk_size < 16 || body + 16 > wav.size()) {
                return make_protocol_error("WAV fmt chunk truncated");
            }
            uint16_t format = read_u16(wav, body);
            uint16_t channels = read_u16(wav, body + 2);
            uint32_t rate = read_u32(wav, body + 4);
            uint16_t bits = read_u16(wav, body + 14);
            if (format != 1 || channels != 1 || bits != 16) {
                return make_protocol_error("WAV must be 16-bit mono linear PCM");
            }
            if (static_cast<int>(rate) != expected_sample_rate) {
                return make_protocol_error("WAV sample rate " + std::to_string(rate) +
                                           " does not match " + std::to_string(expected_sample_rate));
            }
            have_format = true;
        } else if (tag == "data") {
            if (!have_format) {
                return make_protocol_error("WAV data chunk precedes fmt chunk");
            }
            // Streamed WAVs may carry a placeholder size; clamp to what is present
            size_t available = wav.size() - body;
            size_t size = std::min<size_t>(chunk_size, available);
            size -= size % BYTES_PER_SAMPLE;
            Bytes data(wav.begin() + static_cast<std::ptrdiff_t>(body),
                       wav.begin() + static_cast<std::ptrdiff_t>(body + size));
            auto samples = pcm_from_bytes(data);
            if (!samples) {
                return make_protocol_error("WAV data has odd byte count");
            }
            return *samples;
        }

        off = body + chunk_size + (chunk_size & 1);
    }
    return make_protocol_error("WAV has no data chunk");
}

Bytes pcm_to_wav(const AudioBuffer& samples, int sample_rate) {
    const uint32_t data_size = static_cast<uint32_t>(samples.size() * BYTES_PER_SAMPLE);
    Bytes out;
    out.reserve(44 + data_size);
    write_tag(out, "RIFF");
    write_u32(out, 36 + data_size);
    write_tag(out, "WAVE");
    write_tag(out, "fmt ");
    write_u32(out, 16);
    write_u16(out, 1);                                   // PCM
    write_u16(out, 1);                                   // mono
    write_u32(out, static_cast<uint32_t>(sample_rate));
    write_u32(out, static_cast<uint32_t>(sample_rate * BYTES_PER_SAMPLE));
    write_u16(out, BYTES_PER_SAMPLE);
    write_u16(out, 16);
    write_tag(out, "data");
    write_u32(out, data_size);
    Bytes pcm = pcm_to_bytes(samples);
    out.insert(out.end(), pcm.begin(), pcm.end());
    return out;
}

} // namespace codec
} // namespace voicegate
