#pragma once
#include "state.hpp"

namespace peril {

// Run the cascade check for a service that has just failed: a d20 roll of
// CASCADE_ROLL_MAX or less pushes every live neighbour into Cascading with
// extra load, and each of those may in turn run its own check.
//
// A chain visits each service at most once, so even a fully connected board
// terminates after one pass over its services.
void triggerCascadeCheck(GameState& s, int failedId, const StepOpts& opt);

} // namespace peril
