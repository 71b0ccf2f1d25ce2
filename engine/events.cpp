#include "events.hpp"
#include "board.hpp"
#include "dice.hpp"
#include <algorithm>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

namespace peril {

static int pickIndex(Rng& rng, size_t n) {
    return static_cast<int>(rng.below(static_cast<uint32_t>(n)));
}

static std::string_view describeChaos(ChaosKind k) {
    switch (k) {
        case ChaosKind::MinorGlitch:      return "Minor network glitch";
        case ChaosKind::MemoryLeak:       return "Memory leak in random service";
        case ChaosKind::DdosAttack:       return "DDoS attack increases all load";
        case ChaosKind::ConfigError:      return "Configuration error affects API gateways";
        case ChaosKind::DiskFull:         return "Disk full on database services";
        case ChaosKind::NetworkPartition: return "Network partition breaks connections";
        case ChaosKind::SecurityBreach:   return "Security breach requires service restarts";
        case ChaosKind::DatacenterOutage: return "Datacenter outage affects multiple services";
    }
    return "Unknown chaos event";
}

ChaosKind chaosKindForRoll(int roll) {
    roll = std::clamp(roll, 1, 8);
    return static_cast<ChaosKind>(roll - 1);
}

void ddosAttack(GameState& s) {
    for (auto& [id, svc] : s.services) {
        if (isRouter(svc.kind)) svc.load += DDOS_LOAD;
    }
}

void memoryLeak(GameState& s) {
    std::vector<int> healthy;
    for (const auto& [id, svc] : s.services) {
        if (svc.state == ServiceState::Healthy) healthy.push_back(id);
    }
    if (healthy.empty()) return;
    Service& victim = s.services.at(healthy[static_cast<size_t>(pickIndex(s.rng, healthy.size()))]);
    victim.state = ServiceState::Degraded;
    victim.load += MEMORY_LEAK_LOAD;
}

void diskFull(GameState& s) {
    for (auto& [id, svc] : s.services) {
        if (svc.kind == ServiceKind::Database) {
            svc.state = ServiceState::Overloaded;
            svc.load += DISK_FULL_LOAD;
        }
    }
}

void networkPartition(GameState& s) {
    std::vector<int> all;
    for (const auto& [id, svc] : s.services) all.push_back(id);
    const int picks = std::min(PARTITION_PICKS, static_cast<int>(all.size()));
    for (int i = 0; i < picks; ++i) {
        // With replacement: the same service may be hit twice.
        const Service& svc = s.services.at(all[static_cast<size_t>(pickIndex(s.rng, all.size()))]);
        if (svc.connections.empty()) continue;
        auto it = svc.connections.begin();
        std::advance(it, pickIndex(s.rng, svc.connections.size()));
        disconnectServices(s, svc.id, *it);
    }
}

void datacenterOutage(GameState& s) {
    std::vector<int> live;
    for (const auto& [id, svc] : s.services) {
        if (svc.state != ServiceState::Failed) live.push_back(id);
    }
    const int count = std::min(OUTAGE_FAILURES, static_cast<int>(live.size()));
    // Partial Fisher-Yates: distinct victims.
    for (size_t i = 0; i < static_cast<size_t>(count); ++i) {
        const size_t j = i + static_cast<size_t>(pickIndex(s.rng, live.size() - i));
        std::swap(live[i], live[j]);
        s.services.at(live[i]).state = ServiceState::Failed;
    }
}

void applyChaosEffect(GameState& s, ChaosKind kind, const StepOpts& opt) {
    switch (kind) {
        case ChaosKind::DdosAttack:       ddosAttack(s); break;
        case ChaosKind::MemoryLeak:       memoryLeak(s); break;
        case ChaosKind::DiskFull:         diskFull(s); break;
        case ChaosKind::NetworkPartition: networkPartition(s); break;
        case ChaosKind::DatacenterOutage: datacenterOutage(s); break;
        case ChaosKind::MinorGlitch:
        case ChaosKind::ConfigError:
        case ChaosKind::SecurityBreach:
            // Logged only; no board effect.
            emit(opt, LogKind::Chaos, "[Chaos] " + std::string(to_string(kind)) + " has no lasting effect.");
            break;
    }
}

std::optional<ChaosKind> chaosEvent(GameState& s, const StepOpts& opt) {
    if (s.entropy < s.config.chaosThreshold) return std::nullopt;

    const int roll = rollDie(s, DieKind::D8);
    const ChaosKind kind = chaosKindForRoll(roll);

    std::ostringstream oss;
    oss << to_string(kind) << ": " << describeChaos(kind) << " at entropy " << s.entropy;
    GameEvent e;
    e.kind   = EventKind::ChaosEvent;
    e.value  = roll;
    e.detail = oss.str();
    logEvent(s, opt, std::move(e));

    applyChaosEffect(s, kind, opt);

    s.entropy = std::min(s.config.maxEntropy, s.entropy + roll);
    return kind;
}

} // namespace peril
