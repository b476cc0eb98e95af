#include "audio/AudioOutput.hpp"
#include "core/Logger.hpp"
#include <pulse/simple.h>
#include <pulse/error.h>
#include <algorithm>

namespace EigenPlayer {

namespace {
    // ~20ms per write at the stream rate
    constexpr uint32_t kChunksPerSecond = 50;
}

PulseAudioOutput::PulseAudioOutput(std::string applicationName)
    : m_applicationName(std::move(applicationName)) {
}

PulseAudioOutput::~PulseAudioOutput() {
    Close();
}

bool PulseAudioOutput::IsAvailable() {
    pa_sample_spec ss;
    ss.format = PA_SAMPLE_FLOAT32LE;
    ss.rate = 44100;
    ss.channels = 2;

    int error = 0;
    pa_simple* probe = pa_simple_new(nullptr, "EigenPlayer", PA_STREAM_PLAYBACK, nullptr,
                                     "probe", &ss, nullptr, nullptr, &error);
    if (!probe) {
        EIGENPLAYER_LOG_WARN("PulseAudio unavailable: {}", pa_strerror(error));
        return false;
    }
    pa_simple_free(probe);
    return true;
}

std::expected<void, AudioError> PulseAudioOutput::Open(const StreamFormat& format, RenderCallback callback) {
    Close();

    pa_sample_spec ss;
    ss.format = PA_SAMPLE_FLOAT32LE;
    ss.rate = format.sampleRate;
    ss.channels = static_cast<uint8_t>(format.channels);

    if (!pa_sample_spec_valid(&ss)) {
        EIGENPLAYER_LOG_ERROR("Unsupported output format: {} Hz, {} channels",
                              format.sampleRate, format.channels);
        return std::unexpected(AudioError::UnsupportedFormat);
    }

    // Keep the server side buffer short, the ring buffer does the smoothing
    pa_buffer_attr ba;
    ba.maxlength = static_cast<uint32_t>(-1);
    ba.tlength = (format.sampleRate / 10) * format.GetBytesPerFrame();  // ~100ms
    ba.prebuf = static_cast<uint32_t>(-1);
    ba.minreq = static_cast<uint32_t>(-1);
    ba.fragsize = static_cast<uint32_t>(-1);

    int error = 0;
    m_stream = pa_simple_new(
        nullptr,                    // Server (NULL = default)
        m_applicationName.c_str(),  // Application name
        PA_STREAM_PLAYBACK,         // Stream direction
        nullptr,                    // Device (NULL = default)
        "Playback",                 // Stream name
        &ss,                        // Sample spec
        nullptr,                    // Channel map (NULL = default)
        &ba,                        // Buffer attributes
        &error                      // Error code
    );

    if (!m_stream) {
        EIGENPLAYER_LOG_ERROR("Failed to open PulseAudio stream: {}", pa_strerror(error));
        return std::unexpected(AudioError::DeviceUnavailable);
    }

    m_format = format;
    m_callback = std::move(callback);
    m_running = true;
    m_writerThread = std::thread(&PulseAudioOutput::WriterThreadFunc, this);

    EIGENPLAYER_LOG_INFO("PulseAudio stream opened: {} Hz, {} channels",
                         format.sampleRate, format.channels);
    return {};
}

void PulseAudioOutput::Close() {
    m_running = false;
    if (m_writerThread.joinable()) {
        m_writerThread.join();
    }

    if (m_stream) {
        int error = 0;
        if (pa_simple_drain(m_stream, &error) < 0) {
            EIGENPLAYER_LOG_WARN("PulseAudio drain failed: {}", pa_strerror(error));
        }
        pa_simple_free(m_stream);
        m_stream = nullptr;
    }
    m_callback = nullptr;
}

void PulseAudioOutput::WriterThreadFunc() {
    const uint32_t frames = std::max<uint32_t>(1, m_format.sampleRate / kChunksPerSecond);
    std::vector<float> buffer(static_cast<size_t>(frames) * m_format.channels);

    while (m_running) {
        m_callback(buffer.data(), frames);

        int error = 0;
        // pa_simple_write blocks until the server has room
        if (pa_simple_write(m_stream, buffer.data(), buffer.size() * sizeof(float), &error) < 0) {
            EIGENPLAYER_LOG_ERROR("PulseAudio write error: {}", pa_strerror(error));
            m_running = false;
        }
    }
}

} // namespace EigenPlayer
