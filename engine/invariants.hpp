#pragma once
#include "state.hpp"

namespace peril {

// Structural consistency of a game state: symmetric edges, board/service
// agreement, ownership agreement, bounds on resources, budgets, entropy and
// uptime. When `verbose` is set each violation is emitted as a warning.
bool checkInvariants(const GameState& s, const StepOpts& opt, bool verbose);

} // namespace peril
