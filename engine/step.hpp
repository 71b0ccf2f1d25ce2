#pragma once
#include <functional>
#include <optional>
#include "actions.hpp"
#include "state.hpp"

namespace peril {

// successful / total, 1.0 before any traffic.
double calculateUptime(const GameState& s);

// Drivers sequence the phases themselves; the engine never self-advances.
void setPhase(GameState& s, Phase p);
Phase nextPhase(Phase p);

// Resolution phase: overloaded services may fail (> 1.5x capacity, 40%) or
// degrade (> 1.2x capacity, 30%). No cascades start here.
void resolveOverloads(GameState& s, const StepOpts& opt);

// End of the chaos phase: round+1, uptime snapshot, action budgets reset,
// load decay and healing, entropy -1.
void advanceRound(GameState& s, const StepOpts& opt);

bool isGameOver(const GameState& s);

// Cooperative: TEAM_WINNER or nothing. Competitive: first player with the
// strictly highest score.
std::optional<int> getWinner(const GameState& s);

// Asked for the next action of `playerId`; nullopt passes the turn.
using ActionPolicy = std::function<std::optional<Action>(const GameState&, int playerId)>;

// Run the current phase and move to the next one. In the action phase every
// player acts until its budget is spent; a pass or a rejected action forfeits
// the rest of that player's budget.
void runPhase(GameState& s, const ActionPolicy& policy, const StepOpts& opt);
void playRound(GameState& s, const ActionPolicy& policy, const StepOpts& opt);

// Loop rounds until isGameOver(). Returns the number of rounds played.
int playGame(GameState& s, const ActionPolicy& policy, const StepOpts& opt);

} // namespace peril
