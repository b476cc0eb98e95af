#include "dsp/Equalizer.hpp"

namespace EigenPlayer {

Equalizer Equalizer::FromConfig(const EqBandList& bands, bool enabled,
                                float sampleRate, int channels) {
    Equalizer eq;
    eq.m_bands = bands;
    eq.m_enabled = enabled;
    eq.m_sampleRate = sampleRate;
    eq.m_channels = channels > 0 ? channels : 1;
    eq.RebuildFilters();
    return eq;
}

void Equalizer::ProcessInterleaved(float* samples, size_t frames) {
    if (!m_enabled || m_filters.empty()) {
        return;
    }
    float* end = samples + frames * m_channels;
    while (samples < end) {
        for (int ch = 0; ch < m_channels; ++ch, ++samples) {
            *samples = Process(*samples, ch);
        }
    }
}

void Equalizer::UpdateBands(const EqBandList& bands) {
    m_bands = bands;
    RebuildFilters();
}

void Equalizer::SetSampleRate(float sampleRate) {
    m_sampleRate = sampleRate;
    RebuildFilters();
}

void Equalizer::SetChannels(int channels) {
    m_channels = channels > 0 ? channels : 1;
    RebuildFilters();
}

void Equalizer::Reset() {
    for (auto& filter : m_filters) {
        filter.Reset();
    }
}

void Equalizer::RebuildFilters() {
    m_filters.clear();
    m_filters.reserve(m_bands.size());
    for (const auto& band : m_bands) {
        m_filters.emplace_back(BiquadCoefficients::Design(band, m_sampleRate), m_channels);
    }
}

} // namespace EigenPlayer
