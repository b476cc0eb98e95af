#pragma once

#include <cstdint>
#include <functional>

namespace EigenPlayer {

/**
 * @brief Failure categories of the audio layer
 */
enum class AudioError {
    FileNotFound,
    UnsupportedFormat,
    DecoderError,
    DeviceUnavailable,
    StreamError
};

inline const char* AudioErrorToString(AudioError error) {
    switch (error) {
        case AudioError::FileNotFound: return "file not found";
        case AudioError::UnsupportedFormat: return "unsupported format";
        case AudioError::DecoderError: return "decoder error";
        case AudioError::DeviceUnavailable: return "output device unavailable";
        case AudioError::StreamError: return "stream error";
        default: return "unknown";
    }
}

/**
 * @brief Interleaved 32-bit float PCM stream description
 */
struct StreamFormat {
    uint32_t sampleRate = 44100;
    uint32_t channels = 2;

    [[nodiscard]] uint32_t GetBytesPerFrame() const {
        return channels * static_cast<uint32_t>(sizeof(float));
    }

    bool operator==(const StreamFormat& other) const = default;
};

/**
 * @brief Fills an interleaved output buffer with frames * channels samples
 */
using RenderCallback = std::function<void(float* buffer, uint32_t frames)>;

} // namespace EigenPlayer
