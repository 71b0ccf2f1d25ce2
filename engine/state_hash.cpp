#include "state_hash.hpp"
#include <cstring>

namespace peril {

using namespace det;

uint64_t stateChecksum(const GameState& s) {
    uint64_t h = 1469598103934665603ULL;

    h = i32_le(h, s.round);
    h = i32_le(h, static_cast<int>(s.phase));
    h = i32_le(h, s.entropy);
    h = u64_le(h, static_cast<uint64_t>(s.totalRequests));
    h = u64_le(h, static_cast<uint64_t>(s.successfulRequests));
    h = u64_le(h, static_cast<uint64_t>(s.failedRequests));
    h = i32_le(h, s.nextServiceId);
    h = u64_le(h, s.rng.state());
    h = u64_le(h, s.rng.inc());

    for (double u : s.uptimeHistory) {
        uint64_t bits = 0;
        std::memcpy(&bits, &u, sizeof bits);
        h = u64_le(h, bits);
    }

    for (const auto& p : s.players) {
        h = i32_le(h, p.id);
        h = i32_le(h, p.cpu);
        h = i32_le(h, p.memory);
        h = i32_le(h, p.storage);
        h = i32_le(h, p.score);
        h = i32_le(h, p.actionsRemaining);
        for (int id : p.servicesOwned) h = i32_le(h, id);
    }

    for (const auto& [id, svc] : s.services) {
        h = i32_le(h, id);
        h = i32_le(h, static_cast<int>(svc.kind));
        h = i32_le(h, svc.pos.row);
        h = i32_le(h, svc.pos.col);
        h = i32_le(h, static_cast<int>(svc.state));
        h = i32_le(h, svc.load);
        h = i32_le(h, svc.bugs);
        h = i32_le(h, svc.owner);
        for (int c : svc.connections) h = i32_le(h, c);
    }
    return h;
}

} // namespace peril
