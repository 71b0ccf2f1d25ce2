#pragma once
#include "state.hpp"

namespace peril {

// Roll 2d10, add the sum to totalRequests and return it.
int generateTraffic(GameState& s, const StepOpts& opt);

// Spread `requests` over the live load balancers and route each share.
// successfulRequests + failedRequests grows by exactly `requests`. A negative
// count is ignored.
void processRequests(GameState& s, int requests, const StepOpts& opt);

// Route `amount` into one service at recursion `depth`. Exposed for tests.
void routeRequests(GameState& s, int serviceId, int amount, int depth, const StepOpts& opt);

} // namespace peril
