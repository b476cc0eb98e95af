#include "dsp/Biquad.hpp"
#include <cmath>
#include <numbers>

namespace EigenPlayer {

BiquadCoefficients BiquadCoefficients::Design(const EqBand& band, float sampleRate) {
    const double A = std::pow(10.0, band.gainDb / 40.0);
    const double w0 = 2.0 * std::numbers::pi * band.frequency / sampleRate;
    const double cs = std::cos(w0);
    const double sn = std::sin(w0);
    const double alpha = sn / (2.0 * band.q);

    double b0, b1, b2, a0, a1, a2;
    switch (band.type) {
        case static_cast<int>(FilterType::LowShelf): {
            const double beta = 2.0 * std::sqrt(A) * alpha;
            b0 = A * ((A + 1) - (A - 1) * cs + beta);
            b1 = 2 * A * ((A - 1) - (A + 1) * cs);
            b2 = A * ((A + 1) - (A - 1) * cs - beta);
            a0 = (A + 1) + (A - 1) * cs + beta;
            a1 = -2 * ((A - 1) + (A + 1) * cs);
            a2 = (A + 1) + (A - 1) * cs - beta;
            break;
        }
        case static_cast<int>(FilterType::Peaking):
            b0 = 1 + alpha * A;
            b1 = -2 * cs;
            b2 = 1 - alpha * A;
            a0 = 1 + alpha / A;
            a1 = -2 * cs;
            a2 = 1 - alpha / A;
            break;
        case static_cast<int>(FilterType::HighShelf): {
            const double beta = 2.0 * std::sqrt(A) * alpha;
            b0 = A * ((A + 1) + (A - 1) * cs + beta);
            b1 = -2 * A * ((A - 1) + (A + 1) * cs);
            b2 = A * ((A + 1) + (A - 1) * cs - beta);
            a0 = (A + 1) - (A - 1) * cs + beta;
            a1 = 2 * ((A - 1) - (A + 1) * cs);
            a2 = (A + 1) - (A - 1) * cs - beta;
            break;
        }
        default:
            return {};
    }

    const double a0inv = 1.0 / a0;
    BiquadCoefficients c;
    c.b0 = static_cast<float>(b0 * a0inv);
    c.b1 = static_cast<float>(b1 * a0inv);
    c.b2 = static_cast<float>(b2 * a0inv);
    c.a1 = static_cast<float>(a1 * a0inv);
    c.a2 = static_cast<float>(a2 * a0inv);
    return c;
}

Biquad::Biquad(const BiquadCoefficients& coeffs, int channels)
    : m_coeffs(coeffs)
    , m_delays(channels > 0 ? channels : 1, {0.0f, 0.0f}) {
}

void Biquad::Reset() {
    for (auto& dly : m_delays) {
        dly = {0.0f, 0.0f};
    }
}

} // namespace EigenPlayer
