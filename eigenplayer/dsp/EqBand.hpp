#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace EigenPlayer {

/**
 * @brief Filter shape of one equalizer band
 *
 * The numeric values are the ones used in the eq_bands table of the
 * configuration file.
 */
enum class FilterType : int {
    LowShelf = 0,
    Peaking = 1,
    HighShelf = 2
};

inline const char* FilterTypeToString(int type) {
    switch (type) {
        case static_cast<int>(FilterType::LowShelf): return "lowshelf";
        case static_cast<int>(FilterType::Peaking): return "peaking";
        case static_cast<int>(FilterType::HighShelf): return "highshelf";
        default: return "passthrough";
    }
}

/**
 * @brief One parametric EQ band: (center frequency, Q, gain in dB, filter type)
 *
 * Any type outside FilterType is kept as-is and acts as a pass-through stage.
 */
struct EqBand {
    float frequency = 1000.0f;  ///< Center/corner frequency in Hz
    float q = 0.707f;           ///< Quality factor
    float gainDb = 0.0f;        ///< Gain in dB
    int type = static_cast<int>(FilterType::Peaking);

    bool operator==(const EqBand& other) const = default;
};

using EqBandList = std::vector<EqBand>;

} // namespace EigenPlayer
