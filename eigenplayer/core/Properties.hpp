#pragma once

#include "config/Config.hpp"

namespace EigenPlayer {

class Core;

/**
 * @brief Register the player properties with their initial values
 *
 * playing, current_track, volume, playlist and enable_eq describe the
 * playback state; ring_buffer_size, default_volume and eq_bands mirror the
 * loaded audio configuration.
 */
void RegisterProperties(Core& core, const AudioConfig& audio = {});

} // namespace EigenPlayer
