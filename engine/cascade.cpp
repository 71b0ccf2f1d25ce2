#include "cascade.hpp"
#include "dice.hpp"
#include <set>
#include <vector>

namespace peril {

static void cascadeFrom(GameState& s, int originId, std::set<int>& visited, const StepOpts& opt) {
    if (!visited.insert(originId).second) return;
    const Service* origin = s.findService(originId);
    if (!origin) return;

    const int roll = rollDie(s, DieKind::D20);
    GameEvent e;
    e.service = originId;
    e.value   = roll;
    if (roll > CASCADE_ROLL_MAX) {
        e.kind = EventKind::CascadeContained;
        logEvent(s, opt, std::move(e));
        return;
    }
    e.kind = EventKind::CascadeFailure;
    logEvent(s, opt, std::move(e));

    const std::vector<int> neighbours(origin->connections.begin(), origin->connections.end());
    for (int id : neighbours) {
        Service* n = s.findService(id);
        if (!n || n->state == ServiceState::Failed) continue;
        n->state = ServiceState::Cascading;
        n->load += CASCADE_LOAD;
        if (visited.count(id)) continue;
        if (s.rng.chance(CASCADE_SPREAD_CHANCE)) {
            cascadeFrom(s, id, visited, opt);
        }
    }
}

void triggerCascadeCheck(GameState& s, int failedId, const StepOpts& opt) {
    std::set<int> visited;
    cascadeFrom(s, failedId, visited, opt);
}

} // namespace peril
