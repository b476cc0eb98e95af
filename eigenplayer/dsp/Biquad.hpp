#pragma once

#include "dsp/EqBand.hpp"
#include <array>
#include <vector>

namespace EigenPlayer {

/**
 * @brief Normalised biquad coefficients (a0 == 1)
 */
struct BiquadCoefficients {
    float b0 = 1.0f;
    float b1 = 0.0f;
    float b2 = 0.0f;
    float a1 = 0.0f;
    float a2 = 0.0f;

    /**
     * @brief Design coefficients after the RBJ audio EQ cookbook
     *
     * Unknown filter types yield the identity filter.
     */
    static BiquadCoefficients Design(const EqBand& band, float sampleRate);
};

/**
 * @brief Second order IIR section, transposed direct form II
 *
 * Keeps a separate delay line per channel so interleaved multi-channel
 * streams can share one set of coefficients.
 */
class Biquad {
public:
    explicit Biquad(const BiquadCoefficients& coeffs = {}, int channels = 1);

    float Process(float x, int channel = 0) {
        auto& dly = m_delays[channel];
        float y = m_coeffs.b0 * x + dly[0];
        dly[0] = m_coeffs.b1 * x - m_coeffs.a1 * y + dly[1];
        dly[1] = m_coeffs.b2 * x - m_coeffs.a2 * y;
        return y;
    }

    void Reset();

    void SetCoefficients(const BiquadCoefficients& coeffs) { m_coeffs = coeffs; }
    [[nodiscard]] const BiquadCoefficients& GetCoefficients() const { return m_coeffs; }
    [[nodiscard]] int GetChannels() const { return static_cast<int>(m_delays.size()); }

private:
    BiquadCoefficients m_coeffs;
    std::vector<std::array<float, 2>> m_delays;
};

} // namespace EigenPlayer
