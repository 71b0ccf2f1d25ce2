#include "traffic.hpp"
#include "cascade.hpp"
#include "dice.hpp"
#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

namespace peril {

int generateTraffic(GameState& s, const StepOpts& opt) {
    const DiceRoll& roll = rollDice(s, DieKind::D10, 2);
    const int requests = roll.total;
    s.totalRequests += requests;

    std::ostringstream dice;
    dice << "2d10: " << roll.rolls[0] << "+" << roll.rolls[1];
    GameEvent e;
    e.kind   = EventKind::TrafficGenerated;
    e.value  = requests;
    e.detail = dice.str();
    logEvent(s, opt, std::move(e));
    return requests;
}

void processRequests(GameState& s, int requests, const StepOpts& opt) {
    if (requests < 0) {
        emit(opt, LogKind::Warning, "[Traffic] Ignoring negative request count " + std::to_string(requests) + ".");
        return;
    }

    std::vector<int> entryPoints;
    for (const auto& [id, svc] : s.services) {
        if (svc.kind == ServiceKind::LoadBalancer && svc.state != ServiceState::Failed) {
            entryPoints.push_back(id);
        }
    }

    if (entryPoints.empty()) {
        s.failedRequests += requests;
        GameEvent e;
        e.kind  = EventKind::AllRequestsFailed;
        e.value = requests;
        logEvent(s, opt, std::move(e));
        return;
    }

    const int n = static_cast<int>(entryPoints.size());
    const int perEntry = requests / n;
    const int extra    = requests % n;
    for (int i = 0; i < n; ++i) {
        routeRequests(s, entryPoints[static_cast<size_t>(i)], perEntry + (i < extra ? 1 : 0), 0, opt);
    }
}

// Healthy -> Degraded -> Overloaded, one step per overload event.
static void escalate(Service& svc) {
    if (svc.state == ServiceState::Healthy) {
        svc.state = ServiceState::Degraded;
    } else if (svc.state == ServiceState::Degraded) {
        svc.state = ServiceState::Overloaded;
    }
}

static void rollForFailure(GameState& s, Service& svc, const StepOpts& opt) {
    const int cap = svc.capacity();
    const int excess = svc.load - cap;
    if (excess <= cap) return;

    const double chance = std::min(MAX_FAILURE_CHANCE, static_cast<double>(excess) / cap);
    if (!s.rng.chance(chance)) return;

    svc.state = ServiceState::Failed;
    std::ostringstream oss;
    oss << "load " << svc.load << "/" << cap;
    GameEvent e;
    e.kind    = EventKind::ServiceFailed;
    e.service = svc.id;
    e.player  = svc.owner;
    e.value   = svc.load;
    e.detail  = oss.str();
    logEvent(s, opt, std::move(e));

    triggerCascadeCheck(s, svc.id, opt);
}

void routeRequests(GameState& s, int serviceId, int amount, int depth, const StepOpts& opt) {
    if (amount < 0) return;
    Service* svc = s.findService(serviceId);
    if (!svc || depth > MAX_ROUTE_DEPTH || svc->state == ServiceState::Failed) {
        s.failedRequests += amount;
        return;
    }

    svc->load += amount;
    if (svc->isOverloaded()) {
        escalate(*svc);
        rollForFailure(s, *svc, opt);
    }

    const bool forwards = isRouter(svc->kind) && !svc->connections.empty() &&
                          depth < MAX_FORWARD_DEPTH;
    if (!forwards) {
        // Terminal: requests complete here.
        if (svc->state != ServiceState::Failed) s.successfulRequests += amount;
        else                                    s.failedRequests += amount;
        return;
    }

    std::vector<int> downstream;
    for (int id : svc->connections) {
        const Service* d = s.findService(id);
        if (d && d->state != ServiceState::Failed) downstream.push_back(id);
    }
    if (downstream.empty()) {
        s.failedRequests += amount;
        return;
    }

    const int k = static_cast<int>(downstream.size());
    const int share = amount / k;
    // Whatever does not divide evenly is lost at this hop.
    s.failedRequests += amount % k;
    for (int id : downstream) {
        routeRequests(s, id, share, depth + 1, opt);
    }
}

} // namespace peril
