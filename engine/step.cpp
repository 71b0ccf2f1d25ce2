#include "step.hpp"
#include "events.hpp"
#include "invariants.hpp"
#include "traffic.hpp"
#include <algorithm>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace peril {

double calculateUptime(const GameState& s) {
    if (s.totalRequests <= 0) return 1.0;
    double u = static_cast<double>(s.successfulRequests) / static_cast<double>(s.totalRequests);
    return std::clamp(u, 0.0, 1.0);
}

void setPhase(GameState& s, Phase p) {
    s.phase = p;
}

Phase nextPhase(Phase p) {
    switch (p) {
        case Phase::Traffic:    return Phase::Action;
        case Phase::Action:     return Phase::Resolution;
        case Phase::Resolution: return Phase::Chaos;
        case Phase::Chaos:      return Phase::Traffic;
    }
    return Phase::Traffic;
}

void resolveOverloads(GameState& s, const StepOpts& opt) {
    for (auto& [id, svc] : s.services) {
        if (!svc.isOverloaded() || svc.state == ServiceState::Failed) continue;
        const double cap = svc.capacity();
        ServiceState before = svc.state;
        if (svc.load > cap * RESOLVE_FAIL_RATIO) {
            if (s.rng.chance(RESOLVE_FAIL_CHANCE)) svc.state = ServiceState::Failed;
        } else if (svc.load > cap * RESOLVE_DEGRADE_RATIO) {
            // Only a healthy service can slip; an overloaded one stays overloaded.
            if (s.rng.chance(RESOLVE_DEGRADE_CHANCE) && svc.state == ServiceState::Healthy) {
                svc.state = ServiceState::Degraded;
            }
        }
        if (svc.state != before) {
            GameEvent e;
            e.kind    = EventKind::OverloadResolved;
            e.service = id;
            e.player  = svc.owner;
            e.value   = svc.load;
            e.detail  = std::string(to_string(svc.state));
            logEvent(s, opt, std::move(e));
        }
    }
}

void advanceRound(GameState& s, const StepOpts& opt) {
    s.round += 1;

    const double uptime = calculateUptime(s);
    s.uptimeHistory.push_back(uptime);

    for (auto& p : s.players) p.actionsRemaining = ACTIONS_PER_ROUND;
    s.currentPlayer = 0;

    for (auto& [id, svc] : s.services) {
        svc.load = std::max(0, svc.load - 1);
        if (svc.state == ServiceState::Degraded &&
            svc.load < svc.capacity() * HEAL_LOAD_FRACTION) {
            if (s.rng.chance(HEAL_CHANCE)) svc.state = ServiceState::Healthy;
        }
    }

    s.entropy = std::max(0, s.entropy - 1);

    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(1);
    oss << "Uptime " << (uptime * 100.0) << "%, entropy " << s.entropy
        << ", requests " << s.successfulRequests << "/" << s.totalRequests;
    GameEvent e;
    e.kind   = EventKind::RoundEnd;
    e.value  = s.round;
    e.detail = oss.str();
    logEvent(s, opt, std::move(e));

    if (opt.check_invariants && !checkInvariants(s, opt, true)) {
        throw std::runtime_error("Simulation invariant failed.");
    }
}

bool isGameOver(const GameState& s) {
    if (s.round >= s.config.maxRounds) return true;

    const auto& h = s.uptimeHistory;
    if (s.config.cooperativeMode && h.size() >= static_cast<size_t>(UPTIME_WINDOW)) {
        double recent = std::accumulate(h.end() - UPTIME_WINDOW, h.end(), 0.0) / UPTIME_WINDOW;
        if (recent >= s.config.uptimeTarget) return true;
    }

    return std::none_of(s.players.begin(), s.players.end(),
                        [](const Player& p) { return !p.servicesOwned.empty(); });
}

std::optional<int> getWinner(const GameState& s) {
    if (s.config.cooperativeMode) {
        const auto& h = s.uptimeHistory;
        double avg = h.empty() ? 0.0 : std::accumulate(h.begin(), h.end(), 0.0) / h.size();
        if (avg >= s.config.uptimeTarget) return TEAM_WINNER;
        return std::nullopt;
    }

    const Player* best = nullptr;
    for (const auto& p : s.players) {
        if (!best || p.score > best->score) best = &p;
    }
    if (!best) return std::nullopt;
    return best->id;
}

static void runActionPhase(GameState& s, const ActionPolicy& policy, const StepOpts& opt) {
    for (auto& p : s.players) {
        s.currentPlayer = p.id;
        while (p.actionsRemaining > 0) {
            std::optional<Action> a;
            if (policy) a = policy(s, p.id);
            if (!a || !executeAction(s, p.id, *a, opt)) {
                p.actionsRemaining = 0;
            }
        }
    }
}

void runPhase(GameState& s, const ActionPolicy& policy, const StepOpts& opt) {
    switch (s.phase) {
        case Phase::Traffic: {
            int requests = generateTraffic(s, opt);
            processRequests(s, requests, opt);
        } break;
        case Phase::Action:
            runActionPhase(s, policy, opt);
            break;
        case Phase::Resolution:
            resolveOverloads(s, opt);
            break;
        case Phase::Chaos:
            chaosEvent(s, opt);
            advanceRound(s, opt);
            break;
    }
    setPhase(s, nextPhase(s.phase));
}

void playRound(GameState& s, const ActionPolicy& policy, const StepOpts& opt) {
    do {
        runPhase(s, policy, opt);
    } while (s.phase != Phase::Traffic);
}

int playGame(GameState& s, const ActionPolicy& policy, const StepOpts& opt) {
    const int start = s.round;
    while (!isGameOver(s)) {
        playRound(s, policy, opt);
    }
    return s.round - start;
}

} // namespace peril
