#pragma once

#include "audio/AudioTypes.hpp"
#include <atomic>
#include <expected>
#include <string>
#include <thread>
#include <vector>

typedef struct pa_simple pa_simple;

namespace EigenPlayer {

/**
 * @brief Pull-model audio sink
 *
 * Once opened, the sink repeatedly invokes the render callback from its own
 * thread and plays whatever it produces.
 */
class AudioOutput {
public:
    virtual ~AudioOutput() = default;

    virtual std::expected<void, AudioError> Open(const StreamFormat& format, RenderCallback callback) = 0;
    virtual void Close() = 0;
    [[nodiscard]] virtual bool IsOpen() const = 0;
    [[nodiscard]] virtual StreamFormat GetFormat() const = 0;
};

/**
 * @brief PulseAudio output using the simple API on a writer thread
 */
class PulseAudioOutput : public AudioOutput {
public:
    explicit PulseAudioOutput(std::string applicationName = "EigenPlayer");
    ~PulseAudioOutput() override;

    PulseAudioOutput(const PulseAudioOutput&) = delete;
    PulseAudioOutput& operator=(const PulseAudioOutput&) = delete;

    std::expected<void, AudioError> Open(const StreamFormat& format, RenderCallback callback) override;
    void Close() override;
    [[nodiscard]] bool IsOpen() const override { return m_stream != nullptr; }
    [[nodiscard]] StreamFormat GetFormat() const override { return m_format; }

    /**
     * @brief Check whether a PulseAudio server accepts playback streams
     */
    static bool IsAvailable();

private:
    void WriterThreadFunc();

    std::string m_applicationName;
    pa_simple* m_stream = nullptr;
    StreamFormat m_format;
    RenderCallback m_callback;
    std::thread m_writerThread;
    std::atomic<bool> m_running{false};
};

} // namespace EigenPlayer
