#include "audio/AudioBackend.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <vector>

namespace EigenPlayer {

namespace {
    constexpr size_t kDecodeChunkFrames = 1024;
}

AudioBackend::AudioBackend(const AudioConfig& config,
                           std::unique_ptr<AudioOutput> output,
                           DecoderFactory decoderFactory)
    : m_output(std::move(output))
    , m_decoderFactory(std::move(decoderFactory))
    , m_ringBufferSize(static_cast<size_t>(std::max(config.ringBufferSize, 1)))
    , m_producerSleepUs(std::max(config.producerSleepUs, 0))
    , m_volume(std::clamp(config.defaultVolume, 0.0f, 1.0f))
    , m_eq(Equalizer::FromConfig(config.eqBands, config.enableEq,
                                 static_cast<float>(StreamFormat{}.sampleRate),
                                 static_cast<int>(StreamFormat{}.channels))) {
    EIGENPLAYER_LOG_DEBUG("Audio backend created: ring buffer {} samples, {} EQ bands ({})",
                          m_ringBufferSize, config.eqBands.size(),
                          config.enableEq ? "enabled" : "disabled");
}

AudioBackend::~AudioBackend() {
    StopDecoder();
    if (m_output) {
        m_output->Close();
    }
}

std::expected<void, AudioError> AudioBackend::LoadTrack(const std::string& path) {
    EIGENPLAYER_LOG_INFO("Loading track: {}", path);

    StopDecoder();
    if (m_output) {
        m_output->Close();
    }
    m_currentTrack.clear();

    auto decoder = m_decoderFactory(path);
    if (!decoder) {
        EIGENPLAYER_LOG_ERROR("Cannot load {}: {}", path, AudioErrorToString(decoder.error()));
        return std::unexpected(decoder.error());
    }

    const StreamFormat format = (*decoder)->GetFormat();
    {
        std::lock_guard<std::mutex> lock(m_eqMutex);
        m_eq.SetChannels(static_cast<int>(format.channels));
        m_eq.SetSampleRate(static_cast<float>(format.sampleRate));
    }

    // Bridge between decoder thread and output callback. The render side
    // consumes whole frames, so the ring holds a whole number of them.
    const size_t frameSamples = std::max<size_t>(format.channels, 1);
    const size_t capacity = std::max(m_ringBufferSize, frameSamples) / frameSamples * frameSamples;
    auto ring = std::make_shared<RingBuffer<float>>(capacity);
    m_ring = ring;

    m_stopSignal = false;
    m_decoderFinished = false;
    m_decoderThread = std::thread(&AudioBackend::DecoderThreadFunc, this,
                                  std::move(*decoder), ring);

    if (m_output) {
        const uint32_t channels = format.channels;
        auto opened = m_output->Open(format, [this, ring, channels](float* buffer, uint32_t frames) {
            Render(*ring, buffer, frames, channels);
        });
        if (!opened) {
            StopDecoder();
            return std::unexpected(opened.error());
        }
    }

    m_currentTrack = path;
    EIGENPLAYER_LOG_INFO("Track loaded, decoder thread started");
    return {};
}

void AudioBackend::DecoderThreadFunc(std::unique_ptr<AudioDecoder> decoder,
                                     std::shared_ptr<RingBuffer<float>> ring) {
    const size_t channels = decoder->GetFormat().channels;
    std::vector<float> chunk(kDecodeChunkFrames * channels);
    const auto backoff = std::chrono::microseconds(m_producerSleepUs);

    while (!m_stopSignal) {
        const size_t frames = decoder->Read(chunk.data(), kDecodeChunkFrames);
        if (frames == 0) {
            break;
        }

        const size_t samples = frames * channels;
        size_t written = 0;
        while (written < samples) {
            written += ring->PushBulk(chunk.data() + written, samples - written);
            if (written < samples) {
                if (m_stopSignal) {
                    return;
                }
                std::this_thread::sleep_for(backoff);
            }
        }
    }

    m_decoderFinished = true;
    EIGENPLAYER_LOG_DEBUG("Decoder thread finished");
}

void AudioBackend::Render(RingBuffer<float>& ring, float* buffer, uint32_t frames, uint32_t channels) {
    float* end = buffer + static_cast<size_t>(frames) * channels;
    if (!m_playing) {
        std::fill(buffer, end, 0.0f);
        return;
    }

    const float volume = m_volume.load();
    std::lock_guard<std::mutex> lock(m_eqMutex);
    while (buffer < end) {
        // Only consume whole frames so channels never shift on underrun
        if (ring.Size() < channels) {
            std::fill(buffer, end, 0.0f);
            return;
        }
        for (uint32_t ch = 0; ch < channels; ++ch) {
            float s = ring.TryPop().value_or(0.0f);
            s = m_eq.Process(s, static_cast<int>(ch));
            *buffer++ = s * volume;
        }
    }
}

void AudioBackend::StopDecoder() {
    if (m_decoderThread.joinable()) {
        m_stopSignal = true;
        m_decoderThread.join();
        m_stopSignal = false;
    }
}

void AudioBackend::Play() {
    EIGENPLAYER_LOG_INFO("Starting playback");
    m_playing = true;
}

void AudioBackend::Pause() {
    EIGENPLAYER_LOG_INFO("Pausing playback");
    m_playing = false;
}

void AudioBackend::Stop() {
    EIGENPLAYER_LOG_INFO("Stopping playback");
    m_playing = false;
    StopDecoder();
    if (m_output) {
        m_output->Close();
    }
    m_currentTrack.clear();
}

void AudioBackend::SetVolume(float volume) {
    if (!std::isfinite(volume)) {
        EIGENPLAYER_LOG_WARN("Ignoring non-finite volume, keeping {}", m_volume.load());
        return;
    }
    const float clamped = std::clamp(volume, 0.0f, 1.0f);
    EIGENPLAYER_LOG_INFO("Setting volume to {}", clamped);
    m_volume = clamped;
}

void AudioBackend::SetEqEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(m_eqMutex);
    m_eq.SetEnabled(enabled);
}

bool AudioBackend::IsEqEnabled() const {
    std::lock_guard<std::mutex> lock(m_eqMutex);
    return m_eq.IsEnabled();
}

void AudioBackend::SetEqBands(const EqBandList& bands) {
    std::lock_guard<std::mutex> lock(m_eqMutex);
    m_eq.UpdateBands(bands);
}

EqBandList AudioBackend::GetEqBands() const {
    std::lock_guard<std::mutex> lock(m_eqMutex);
    return m_eq.GetBands();
}

size_t AudioBackend::GetBufferedSamples() const {
    return m_ring ? m_ring->Size() : 0;
}

} // namespace EigenPlayer
