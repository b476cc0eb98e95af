#pragma once

#include "dsp/Biquad.hpp"
#include "dsp/EqBand.hpp"
#include <cstddef>
#include <vector>

namespace EigenPlayer {

/**
 * @brief Chain of biquad bands applied in configuration order
 *
 * Not thread safe; the audio backend serialises access.
 */
class Equalizer {
public:
    Equalizer() = default;

    /**
     * @brief Build an equalizer from configured bands
     * @param bands Band table, processed in order
     * @param enabled Initial state of the bypass switch
     * @param sampleRate Sample rate used for coefficient design
     * @param channels Number of interleaved channels
     */
    static Equalizer FromConfig(const EqBandList& bands, bool enabled,
                                float sampleRate, int channels = 1);

    /**
     * @brief Filter one sample of the given channel
     *
     * Returns the input unchanged while the equalizer is disabled.
     */
    float Process(float sample, int channel = 0) {
        if (!m_enabled) {
            return sample;
        }
        float x = sample;
        for (auto& filter : m_filters) {
            x = filter.Process(x, channel);
        }
        return x;
    }

    /**
     * @brief Filter an interleaved buffer in place
     */
    void ProcessInterleaved(float* samples, size_t frames);

    /**
     * @brief Replace all bands, clearing filter state
     */
    void UpdateBands(const EqBandList& bands);

    void SetSampleRate(float sampleRate);
    void SetChannels(int channels);

    /**
     * @brief Clear the delay lines of every band
     */
    void Reset();

    void SetEnabled(bool enabled) { m_enabled = enabled; }
    [[nodiscard]] bool IsEnabled() const { return m_enabled; }

    [[nodiscard]] const EqBandList& GetBands() const { return m_bands; }
    [[nodiscard]] size_t GetBandCount() const { return m_bands.size(); }
    [[nodiscard]] float GetSampleRate() const { return m_sampleRate; }
    [[nodiscard]] int GetChannels() const { return m_channels; }
    [[nodiscard]] const Biquad& GetFilter(size_t band) const { return m_filters.at(band); }

private:
    void RebuildFilters();

    EqBandList m_bands;
    std::vector<Biquad> m_filters;
    float m_sampleRate = 44100.0f;
    int m_channels = 1;
    bool m_enabled = false;
};

} // namespace EigenPlayer
