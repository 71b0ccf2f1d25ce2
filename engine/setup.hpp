#pragma once
#include <array>
#include <string>
#include "state.hpp"

namespace peril {

// One starting load balancer per player, in player order.
inline constexpr std::array<Position, 4> STARTING_POSITIONS {{
    {1, 1}, {1, 4}, {6, 1}, {6, 4}
}};

// Throws std::invalid_argument naming the first bad field.
void validateConfig(const GameConfig& cfg);

// Read `key=value` lines into cfg. Unknown keys are warned about and skipped;
// a malformed value or unreadable file returns false and leaves cfg as it was.
bool loadConfig(const std::string& path, GameConfig& cfg, const StepOpts& opt);

// Reset `s` to round 0 of a fresh game: players, seeded RNG, starting
// placements. Validates the config first.
void initGame(GameState& s, const GameConfig& cfg, const StepOpts& opt);
GameState newGame(const GameConfig& cfg, const StepOpts& opt);

} // namespace peril
