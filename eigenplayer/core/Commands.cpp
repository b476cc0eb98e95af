#include "core/Commands.hpp"
#include "core/Core.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>

namespace EigenPlayer {

namespace {

using Params = std::vector<std::string>;

void Play(const Params& params, Core& core) {
    if (!params.empty()) {
        core.SetProperty("current_track", params[0]);
        core.SetProperty("playing", true);
        return;
    }

    // Resume only if there is something to resume
    if (core.GetString("current_track").value_or("none") != "none") {
        core.SetProperty("playing", true);
    }
}

void Pause(const Params&, Core& core) {
    core.SetProperty("playing", false);
}

void Stop(const Params&, Core& core) {
    core.SetProperty("playing", false);
    core.SetProperty("current_track", std::string("none"));
}

void Volume(const Params& params, Core& core) {
    if (params.empty()) {
        return;
    }
    auto volume = ParseFloat(params[0]);
    if (!volume) {
        EIGENPLAYER_LOG_WARN("Ignoring invalid volume '{}'", params[0]);
        return;
    }
    core.SetProperty("volume", std::clamp(*volume, 0.0f, 1.0f));
}

void Add(const Params& params, Core& core) {
    if (params.empty()) {
        return;
    }
    auto playlist = core.GetStringList("playlist");
    if (!playlist) {
        return;
    }
    playlist->push_back(params[0]);
    core.SetProperty("playlist", std::move(*playlist));
}

void Remove(const Params& params, Core& core) {
    if (params.empty()) {
        return;
    }
    auto playlist = core.GetStringList("playlist");
    if (!playlist) {
        return;
    }
    std::erase(*playlist, params[0]);
    core.SetProperty("playlist", std::move(*playlist));
}

/**
 * @brief Move offset entries from the current track, without wrapping
 */
void Step(Core& core, int offset) {
    auto current = core.GetString("current_track");
    auto playlist = core.GetStringList("playlist");
    if (!current || !playlist) {
        return;
    }

    auto it = std::find(playlist->begin(), playlist->end(), *current);
    if (it == playlist->end()) {
        return;
    }

    const auto index = static_cast<long>(std::distance(playlist->begin(), it)) + offset;
    if (index < 0 || index >= static_cast<long>(playlist->size())) {
        return;
    }

    core.SetProperty("current_track", (*playlist)[static_cast<size_t>(index)]);
    core.SetProperty("playing", true);
}

void Next(const Params&, Core& core) {
    Step(core, 1);
}

void Prev(const Params&, Core& core) {
    Step(core, -1);
}

void Eq(const Params& params, Core& core) {
    const bool enabled = core.GetBool("enable_eq").value_or(false);
    if (params.empty() || params[0] == "toggle") {
        core.SetProperty("enable_eq", !enabled);
    } else if (params[0] == "on") {
        core.SetProperty("enable_eq", true);
    } else if (params[0] == "off") {
        core.SetProperty("enable_eq", false);
    } else {
        EIGENPLAYER_LOG_WARN("Unknown eq argument '{}'", params[0]);
    }
}

} // namespace

std::optional<float> ParseFloat(std::string_view text) {
    float value = 0.0f;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (first != last && *first == '+') {
        ++first;
    }
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || std::isnan(value)) {
        return std::nullopt;
    }
    return value;
}

void RegisterCommands(Core& core) {
    core.AddCommand("play", Command{Play, "play [track]"});
    core.AddCommand("pause", Command{Pause, "pause"});
    core.AddCommand("stop", Command{Stop, "stop"});
    core.AddCommand("volume", Command{Volume, "volume <0-1>"});
    core.AddCommand("add", Command{Add, "add <track>"});
    core.AddCommand("remove", Command{Remove, "remove <track>"});
    core.AddCommand("next", Command{Next, "next"});
    core.AddCommand("prev", Command{Prev, "prev"});
    core.AddCommand("eq", Command{Eq, "eq [on|off|toggle]"});
}

} // namespace EigenPlayer
