#include "core/Properties.hpp"
#include "core/Core.hpp"
#include "core/Logger.hpp"

namespace EigenPlayer {

void RegisterProperties(Core& core, const AudioConfig& audio) {
    // Playback state
    core.AddProperty("playing", false);
    core.AddProperty("current_track", std::string("none"));
    core.AddProperty("volume", audio.defaultVolume);
    core.AddProperty("playlist", StringList{});
    core.AddProperty("enable_eq", audio.enableEq);

    // Configuration
    core.AddProperty("ring_buffer_size", audio.ringBufferSize);
    core.AddProperty("default_volume", audio.defaultVolume);
    core.AddProperty("eq_bands", audio.eqBands);

    EIGENPLAYER_LOG_DEBUG("Registered {} properties", core.GetPropertyNames().size());
}

} // namespace EigenPlayer
