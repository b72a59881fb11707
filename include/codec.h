#pragma once

/**
 * @file codec.h
 * @brief Wire encodings: base64, ISO-8601 timestamps, 16-bit PCM and WAV containers
 */

#include "common.h"
#include "errors.h"
#include <string>
#include <optional>

namespace voicegate {
namespace codec {

/// Standard base64 (RFC 4648) with '=' padding
std::string base64_encode(const uint8_t* data, size_t size);
std::string base64_encode(const Bytes& data);

/**
 * @brief Decode standard base64; whitespace is ignored
 * @return Decoded bytes, or nullopt on illegal characters or bad padding
 */
std::optional<Bytes> base64_decode(const std::string& text);

/// Current UTC time as "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string iso8601_now();

/// Epoch milliseconds (wall clock) in the same format
std::string iso8601_from_ms(int64_t epoch_ms);

/// Little-endian 16-bit PCM bytes to samples; nullopt on odd byte count
std::optional<AudioBuffer> pcm_from_bytes(const Bytes& bytes);

/// Samples to little-endian 16-bit PCM bytes
Bytes pcm_to_bytes(const AudioBuffer& samples);

/// True when bytes begin with a RIFF....WAVE header
bool is_wav(const Bytes& bytes);

/**
 * @brief Extract PCM samples from a WAV container
 *
 * Accepts only uncompressed 16-bit mono PCM at expected_sample_rate.
 * @return Samples, or ProtocolError describing the mismatch
 */
Result<AudioBuffer> wav_to_pcm(const Bytes& wav, int expected_sample_rate);

/// Wrap samples in a canonical 44-byte-header WAV (16-bit mono)
Bytes pcm_to_wav(const AudioBuffer& samples, int sample_rate);

} // namespace codec
} // namespace voicegate
