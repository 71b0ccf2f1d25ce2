#pragma once
#include <string_view>
#include <vector>
#include "state.hpp"

namespace peril {

// "d4" .. "d20". Throws std::invalid_argument for anything else; there is
// no silent d6 fallback.
DieKind parseDieKind(std::string_view name);

// Roll `count` dice of one kind, record the roll (with round/phase) in the
// history and as the last roll, and return it. Loaded results queued with
// loadDice() are consumed before the generator is touched.
const DiceRoll& rollDice(GameState& s, DieKind die, int count = 1);

// Single-die shorthand returning just the face value.
int rollDie(GameState& s, DieKind die);

// Queue forced results for the next rolls (tests, replays).
void loadDice(GameState& s, const std::vector<int>& results);

} // namespace peril
