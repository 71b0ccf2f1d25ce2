#include "invariants.hpp"
#include "board.hpp"
#include <string>

namespace peril {

bool checkInvariants(const GameState& s, const StepOpts& opt, bool verbose) {
    bool ok = true;
    auto bad = [&](const std::string& msg) {
        if (verbose) emit(opt, LogKind::Warning, "[Invariant] " + msg);
        ok = false;
    };

    if (s.round < 0) bad("round >= 0");
    if (s.entropy < 0 || s.entropy > s.config.maxEntropy) bad("entropy in [0, maxEntropy]");
    if (s.totalRequests < 0 || s.successfulRequests < 0 || s.failedRequests < 0)
        bad("request counters >= 0");
    for (double u : s.uptimeHistory) {
        if (!(u >= 0.0 && u <= 1.0)) bad("uptime snapshot in [0,1]");
    }

    for (const auto& p : s.players) {
        const std::string who = "player " + std::to_string(p.id) + ": ";
        if (p.cpu < 0 || p.memory < 0 || p.storage < 0) bad(who + "resources >= 0");
        if (p.actionsRemaining < 0 || p.actionsRemaining > ACTIONS_PER_ROUND)
            bad(who + "actionsRemaining in [0,3]");
        for (int id : p.servicesOwned) {
            const Service* svc = s.findService(id);
            if (!svc || svc->owner != p.id) bad(who + "owns service #" + std::to_string(id) + " it does not hold");
        }
    }

    for (const auto& [id, svc] : s.services) {
        const std::string what = "service #" + std::to_string(id) + ": ";
        if (id >= s.nextServiceId) bad(what + "id below nextServiceId");
        if (svc.load < 0) bad(what + "load >= 0");
        if (svc.bugs < 0) bad(what + "bugs >= 0");
        if (!inBounds(s.config, svc.pos)) bad(what + "position on board");
        if (serviceAt(s, svc.pos) != id) bad(what + "board cell agrees");

        const Player* owner = s.findPlayer(svc.owner);
        if (!owner || !owner->servicesOwned.count(id)) bad(what + "listed by its owner");

        for (int other : svc.connections) {
            const Service* o = s.findService(other);
            if (!o || !o->connections.count(id)) bad(what + "edge to #" + std::to_string(other) + " is symmetric");
            if (other == id) bad(what + "no self edge");
        }
    }

    for (const auto& [pos, id] : s.board) {
        const Service* svc = s.findService(id);
        if (!svc || svc->pos != pos) bad("board cell maps to a service at that cell");
    }

    return ok;
}

} // namespace peril
