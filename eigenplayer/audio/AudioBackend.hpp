#pragma once

#include "audio/AudioDecoder.hpp"
#include "audio/AudioOutput.hpp"
#include "audio/AudioTypes.hpp"
#include "audio/RingBuffer.hpp"
#include "config/Config.hpp"
#include "dsp/Equalizer.hpp"
#include <atomic>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace EigenPlayer {

/**
 * @brief Track playback engine
 *
 * A decoder thread fills a ring buffer sized by ring_buffer_size; the output
 * sink drains it from its own thread, applying the equalizer and the volume.
 * The ring absorbs scheduling jitter between the two sides so neither blocks
 * the other.
 *
 * Usage:
 * @code
 * AudioBackend backend(audioConfig, std::make_unique<PulseAudioOutput>());
 * if (backend.LoadTrack("song.flac")) {
 *     backend.Play();
 * }
 * @endcode
 */
class AudioBackend {
public:
    AudioBackend(const AudioConfig& config,
                 std::unique_ptr<AudioOutput> output,
                 DecoderFactory decoderFactory = &SndfileDecoder::Open);
    ~AudioBackend();

    AudioBackend(const AudioBackend&) = delete;
    AudioBackend& operator=(const AudioBackend&) = delete;

    /**
     * @brief Stop the current track and start decoding a new one
     *
     * Playback state is left untouched; call Play() to hear it.
     */
    std::expected<void, AudioError> LoadTrack(const std::string& path);

    void Play();
    void Pause();

    /**
     * @brief Stop decoding and playback and close the output stream
     */
    void Stop();

    /**
     * @brief Set output gain, clamped to [0, 1]; NaN and inf are ignored
     */
    void SetVolume(float volume);
    [[nodiscard]] float GetVolume() const { return m_volume.load(); }

    [[nodiscard]] bool IsPlaying() const { return m_playing.load(); }

    /**
     * @brief True once the decoder reached the end of the current track
     */
    [[nodiscard]] bool IsDecoderFinished() const { return m_decoderFinished.load(); }

    void SetEqEnabled(bool enabled);
    [[nodiscard]] bool IsEqEnabled() const;
    void SetEqBands(const EqBandList& bands);
    [[nodiscard]] EqBandList GetEqBands() const;

    [[nodiscard]] size_t GetRingBufferSize() const { return m_ringBufferSize; }
    [[nodiscard]] const std::string& GetCurrentTrack() const { return m_currentTrack; }

    /**
     * @brief Samples currently queued between decoder and output
     */
    [[nodiscard]] size_t GetBufferedSamples() const;

private:
    void StopDecoder();
    void DecoderThreadFunc(std::unique_ptr<AudioDecoder> decoder,
                           std::shared_ptr<RingBuffer<float>> ring);
    void Render(RingBuffer<float>& ring, float* buffer, uint32_t frames, uint32_t channels);

    std::unique_ptr<AudioOutput> m_output;
    DecoderFactory m_decoderFactory;

    size_t m_ringBufferSize;
    int m_producerSleepUs;
    std::shared_ptr<RingBuffer<float>> m_ring;

    std::thread m_decoderThread;
    std::atomic<bool> m_stopSignal{false};
    std::atomic<bool> m_decoderFinished{false};
    std::atomic<bool> m_playing{false};
    std::atomic<float> m_volume{1.0f};

    mutable std::mutex m_eqMutex;
    Equalizer m_eq;

    std::string m_currentTrack;
};

} // namespace EigenPlayer
