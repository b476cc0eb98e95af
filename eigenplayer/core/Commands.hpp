#pragma once

#include <optional>
#include <string_view>

namespace EigenPlayer {

class Core;

/**
 * @brief Register the built-in player commands
 *
 * play [track], pause, stop, volume <v>, add <track>, remove <track>,
 * next, prev and eq [on|off|toggle]. Commands only touch properties; the
 * audio backend and the database follow through property subscribers.
 */
void RegisterCommands(Core& core);

/**
 * @brief Parse a whole string as a float, rejecting trailing garbage and NaN
 */
std::optional<float> ParseFloat(std::string_view text);

} // namespace EigenPlayer
