#include "audio/AudioDecoder.hpp"
#include "core/Logger.hpp"
#include <sndfile.h>
#include <filesystem>

namespace EigenPlayer {

SndfileDecoder::SndfileDecoder(SNDFILE* file, const StreamFormat& format, int64_t totalFrames)
    : m_file(file)
    , m_format(format)
    , m_totalFrames(totalFrames) {
}

SndfileDecoder::~SndfileDecoder() {
    if (m_file) {
        sf_close(m_file);
        m_file = nullptr;
    }
}

std::expected<std::unique_ptr<AudioDecoder>, AudioError> SndfileDecoder::Open(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        EIGENPLAYER_LOG_ERROR("Audio file not found: {}", path);
        return std::unexpected(AudioError::FileNotFound);
    }

    SF_INFO info{};
    SNDFILE* file = sf_open(path.c_str(), SFM_READ, &info);
    if (!file) {
        EIGENPLAYER_LOG_ERROR("Failed to open audio file {}: {}", path, sf_strerror(nullptr));
        return std::unexpected(AudioError::UnsupportedFormat);
    }

    if (info.channels <= 0 || info.samplerate <= 0) {
        sf_close(file);
        EIGENPLAYER_LOG_ERROR("Audio file {} has no usable stream", path);
        return std::unexpected(AudioError::UnsupportedFormat);
    }

    // Decode as floats in [-1, 1]
    sf_command(file, SFC_SET_NORM_FLOAT, nullptr, SF_TRUE);

    StreamFormat format;
    format.sampleRate = static_cast<uint32_t>(info.samplerate);
    format.channels = static_cast<uint32_t>(info.channels);

    EIGENPLAYER_LOG_DEBUG("Opened {}: {} Hz, {} channels, {} frames",
                          path, format.sampleRate, format.channels, info.frames);

    return std::unique_ptr<AudioDecoder>(
        new SndfileDecoder(file, format, static_cast<int64_t>(info.frames)));
}

size_t SndfileDecoder::Read(float* out, size_t frames) {
    if (!m_file) {
        return 0;
    }
    sf_count_t read = sf_readf_float(m_file, out, static_cast<sf_count_t>(frames));
    if (read < 0) {
        EIGENPLAYER_LOG_ERROR("Decoder read error: {}", sf_strerror(m_file));
        return 0;
    }
    return static_cast<size_t>(read);
}

} // namespace EigenPlayer
