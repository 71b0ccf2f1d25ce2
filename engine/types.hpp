#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace peril {

enum class ServiceKind : uint8_t {
    Compute, Database, Cache, Queue, LoadBalancer, ApiGateway,
    COUNT
};

enum class ServiceState : uint8_t {
    Healthy, Degraded, Overloaded, Failed, Cascading,
    COUNT
};

enum class Phase : uint8_t { Traffic, Action, Resolution, Chaos };

enum class DieKind : uint8_t { D4, D6, D8, D10, D12, D20 };

// Order matters: a d8 roll of N selects the (N-1)th entry.
enum class ChaosKind : uint8_t {
    MinorGlitch, MemoryLeak, DdosAttack, ConfigError,
    DiskFull, NetworkPartition, SecurityBreach, DatacenterOutage
};

enum class PlayerStrategy : uint8_t { Aggressive, Defensive, Balanced, Random };

constexpr size_t to_index(ServiceKind k) {
    return static_cast<size_t>(k);
}

constexpr int dieSides(DieKind d) {
    switch (d) {
        case DieKind::D4:  return 4;
        case DieKind::D6:  return 6;
        case DieKind::D8:  return 8;
        case DieKind::D10: return 10;
        case DieKind::D12: return 12;
        case DieKind::D20: return 20;
    }
    return 6;
}

inline std::string_view to_string(ServiceKind k) {
    switch (k) {
        case ServiceKind::Compute:      return "compute";
        case ServiceKind::Database:     return "database";
        case ServiceKind::Cache:        return "cache";
        case ServiceKind::Queue:        return "queue";
        case ServiceKind::LoadBalancer: return "load_balancer";
        case ServiceKind::ApiGateway:   return "api_gateway";
        default:                        return "unknown";
    }
}

inline std::string_view to_string(ServiceState st) {
    switch (st) {
        case ServiceState::Healthy:    return "healthy";
        case ServiceState::Degraded:   return "degraded";
        case ServiceState::Overloaded: return "overloaded";
        case ServiceState::Failed:     return "failed";
        case ServiceState::Cascading:  return "cascading";
        default:                       return "unknown";
    }
}

inline std::string_view to_string(Phase p) {
    switch (p) {
        case Phase::Traffic:    return "traffic";
        case Phase::Action:     return "action";
        case Phase::Resolution: return "resolution";
        case Phase::Chaos:      return "chaos";
    }
    return "unknown";
}

inline std::string_view to_string(DieKind d) {
    switch (d) {
        case DieKind::D4:  return "d4";
        case DieKind::D6:  return "d6";
        case DieKind::D8:  return "d8";
        case DieKind::D10: return "d10";
        case DieKind::D12: return "d12";
        case DieKind::D20: return "d20";
    }
    return "d?";
}

inline std::string_view to_string(ChaosKind c) {
    switch (c) {
        case ChaosKind::MinorGlitch:      return "minor_glitch";
        case ChaosKind::MemoryLeak:       return "memory_leak";
        case ChaosKind::DdosAttack:       return "ddos_attack";
        case ChaosKind::ConfigError:      return "config_error";
        case ChaosKind::DiskFull:         return "disk_full";
        case ChaosKind::NetworkPartition: return "network_partition";
        case ChaosKind::SecurityBreach:   return "security_breach";
        case ChaosKind::DatacenterOutage: return "datacenter_outage";
    }
    return "unknown";
}

inline std::string_view to_string(PlayerStrategy ps) {
    switch (ps) {
        case PlayerStrategy::Aggressive: return "aggressive";
        case PlayerStrategy::Defensive:  return "defensive";
        case PlayerStrategy::Balanced:   return "balanced";
        case PlayerStrategy::Random:     return "random";
    }
    return "unknown";
}

// Reverse lookups for the text formats (save files, action codec, config).
std::optional<ServiceKind>    parseServiceKind(std::string_view name);
std::optional<ServiceState>   parseServiceState(std::string_view name);
std::optional<Phase>          parsePhase(std::string_view name);
std::optional<PlayerStrategy> parseStrategy(std::string_view name);

} // namespace peril
