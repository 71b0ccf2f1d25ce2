#pragma once
#include <optional>
#include "state.hpp"

namespace peril {

// Chaos entry point. Does nothing while entropy is below the threshold;
// otherwise rolls a d8, applies the matching event and raises entropy by
// the roll (capped at maxEntropy). Returns the event that fired, if any.
std::optional<ChaosKind> chaosEvent(GameState& s, const StepOpts& opt);

// d8 face (1..8) -> event kind.
ChaosKind chaosKindForRoll(int roll);

// Explicit event helpers (used internally / for tests)
void applyChaosEffect(GameState& s, ChaosKind kind, const StepOpts& opt);
void ddosAttack(GameState& s);
void memoryLeak(GameState& s);
void diskFull(GameState& s);
void networkPartition(GameState& s);
void datacenterOutage(GameState& s);

} // namespace peril
