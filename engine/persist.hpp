#pragma once
#include <iosfwd>
#include <string>
#include "state.hpp"

namespace peril {

// Human-readable snapshot of everything a UI/web/telemetry client needs:
// round, phase, entropy, uptime, players, services, counters, history.
void writeSnapshot(std::ostream& os, const GameState& s);

// Versioned text save (snapshot + config + RNG state). Event log and dice
// history are not saved. loadGame leaves `s` untouched on any failure.
bool saveGame(const GameState& s, const std::string& path, const StepOpts& opt);
bool loadGame(GameState& s, const std::string& path, const StepOpts& opt);

} // namespace peril
