#pragma once

#include "audio/AudioTypes.hpp"
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <string>

typedef struct sf_private_tag SNDFILE;

namespace EigenPlayer {

/**
 * @brief Source of interleaved float PCM frames
 */
class AudioDecoder {
public:
    virtual ~AudioDecoder() = default;

    [[nodiscard]] virtual StreamFormat GetFormat() const = 0;

    /**
     * @brief Decode up to frames frames into out
     * @return Frames decoded, 0 at end of stream
     */
    virtual size_t Read(float* out, size_t frames) = 0;
};

using DecoderFactory =
    std::function<std::expected<std::unique_ptr<AudioDecoder>, AudioError>(const std::string& path)>;

/**
 * @brief libsndfile backed decoder (WAV, FLAC, OGG, MP3 where supported)
 */
class SndfileDecoder : public AudioDecoder {
public:
    ~SndfileDecoder() override;

    SndfileDecoder(const SndfileDecoder&) = delete;
    SndfileDecoder& operator=(const SndfileDecoder&) = delete;

    static std::expected<std::unique_ptr<AudioDecoder>, AudioError> Open(const std::string& path);

    [[nodiscard]] StreamFormat GetFormat() const override { return m_format; }
    size_t Read(float* out, size_t frames) override;

    [[nodiscard]] int64_t GetTotalFrames() const { return m_totalFrames; }

private:
    SndfileDecoder(SNDFILE* file, const StreamFormat& format, int64_t totalFrames);

    SNDFILE* m_file = nullptr;
    StreamFormat m_format;
    int64_t m_totalFrames = 0;
};

} // namespace EigenPlayer
