/**
 * @file MockAudio.hpp
 * @brief Audio output and decoder doubles for backend tests
 */

#pragma once

#include <gmock/gmock.h>

#include "audio/AudioDecoder.hpp"
#include "audio/AudioOutput.hpp"

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

namespace EigenPlayer {
namespace Test {

// =============================================================================
// Mock Audio Output
// =============================================================================

class MockAudioOutput : public AudioOutput {
public:
    MOCK_METHOD((std::expected<void, AudioError>), Open,
                (const StreamFormat& format, RenderCallback callback), (override));
    MOCK_METHOD(void, Close, (), (override));
    MOCK_METHOD(bool, IsOpen, (), (const, override));
    MOCK_METHOD(StreamFormat, GetFormat, (), (const, override));
};

/**
 * @brief Output without a device; the test pulls frames by hand
 */
class FakeAudioOutput : public AudioOutput {
public:
    std::expected<void, AudioError> Open(const StreamFormat& format, RenderCallback callback) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_failOpen) {
            return std::unexpected(AudioError::DeviceUnavailable);
        }
        m_format = format;
        m_callback = std::move(callback);
        ++m_openCount;
        return {};
    }

    void Close() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_callback = nullptr;
    }

    [[nodiscard]] bool IsOpen() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return static_cast<bool>(m_callback);
    }

    [[nodiscard]] StreamFormat GetFormat() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_format;
    }

    /**
     * @brief Run the render callback once, as the writer thread would
     */
    std::vector<float> Pull(uint32_t frames) {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<float> buffer(static_cast<size_t>(frames) * m_format.channels, -1.0f);
        if (m_callback) {
            m_callback(buffer.data(), frames);
        }
        return buffer;
    }

    void SetFailOpen(bool fail) { m_failOpen = fail; }
    [[nodiscard]] int GetOpenCount() const { return m_openCount; }

private:
    mutable std::mutex m_mutex;
    StreamFormat m_format;
    RenderCallback m_callback;
    bool m_failOpen = false;
    int m_openCount = 0;
};

// =============================================================================
// Fake Decoder
// =============================================================================

/**
 * @brief Decoder serving a fixed interleaved sample block
 */
class FakeDecoder : public AudioDecoder {
public:
    FakeDecoder(std::vector<float> samples, StreamFormat format)
        : m_samples(std::move(samples))
        , m_format(format) {}

    [[nodiscard]] StreamFormat GetFormat() const override { return m_format; }

    size_t Read(float* out, size_t frames) override {
        const size_t channels = m_format.channels;
        const size_t available = (m_samples.size() - m_position) / channels;
        const size_t count = std::min(frames, available);
        std::copy_n(m_samples.begin() + static_cast<std::ptrdiff_t>(m_position), count * channels, out);
        m_position += count * channels;
        return count;
    }

    /**
     * @brief Factory producing fresh decoders over the same samples
     */
    static DecoderFactory MakeFactory(std::vector<float> samples, StreamFormat format,
                                      std::shared_ptr<std::vector<std::string>> opened = nullptr) {
        return [samples = std::move(samples), format, opened](const std::string& path)
                   -> std::expected<std::unique_ptr<AudioDecoder>, AudioError> {
            if (path == "missing.wav") {
                return std::unexpected(AudioError::FileNotFound);
            }
            if (opened) {
                opened->push_back(path);
            }
            return std::make_unique<FakeDecoder>(samples, format);
        };
    }

private:
    std::vector<float> m_samples;
    size_t m_position = 0;
    StreamFormat m_format;
};

} // namespace Test
} // namespace EigenPlayer
