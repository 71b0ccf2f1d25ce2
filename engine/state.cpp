#include "state.hpp"
#include <sstream>

namespace peril {

namespace {

template <typename Enum, size_t N>
std::optional<Enum> lookup(std::string_view name, const Enum (&all)[N]) {
    for (Enum e : all) {
        if (to_string(e) == name) return e;
    }
    return std::nullopt;
}

LogKind logKindFor(EventKind k) {
    switch (k) {
        case EventKind::ChaosEvent:
        case EventKind::CascadeFailure:    return LogKind::Chaos;
        case EventKind::AllRequestsFailed:
        case EventKind::ServiceFailed:     return LogKind::Warning;
        case EventKind::RoundEnd:
        case EventKind::TrafficGenerated:  return LogKind::Info;
        default:                           return LogKind::Event;
    }
}

} // namespace

std::optional<ServiceKind> parseServiceKind(std::string_view name) {
    static const ServiceKind all[] = {
        ServiceKind::Compute, ServiceKind::Database, ServiceKind::Cache,
        ServiceKind::Queue, ServiceKind::LoadBalancer, ServiceKind::ApiGateway};
    return lookup(name, all);
}

std::optional<ServiceState> parseServiceState(std::string_view name) {
    static const ServiceState all[] = {
        ServiceState::Healthy, ServiceState::Degraded, ServiceState::Overloaded,
        ServiceState::Failed, ServiceState::Cascading};
    return lookup(name, all);
}

std::optional<Phase> parsePhase(std::string_view name) {
    static const Phase all[] = {Phase::Traffic, Phase::Action, Phase::Resolution, Phase::Chaos};
    return lookup(name, all);
}

std::optional<PlayerStrategy> parseStrategy(std::string_view name) {
    static const PlayerStrategy all[] = {
        PlayerStrategy::Aggressive, PlayerStrategy::Defensive,
        PlayerStrategy::Balanced, PlayerStrategy::Random};
    return lookup(name, all);
}

std::string_view to_string(EventKind k) {
    switch (k) {
        case EventKind::InitialPlacement:  return "initial_placement";
        case EventKind::TrafficGenerated:  return "traffic_generated";
        case EventKind::AllRequestsFailed: return "all_requests_failed";
        case EventKind::ServiceFailed:     return "service_failed";
        case EventKind::CascadeFailure:    return "cascade_failure";
        case EventKind::CascadeContained:  return "cascade_contained";
        case EventKind::ChaosEvent:        return "chaos_event";
        case EventKind::OverloadResolved:  return "overload_resolved";
        case EventKind::RoundEnd:          return "round_end";
        case EventKind::DeployService:     return "deploy_service";
        case EventKind::RepairService:     return "repair_service";
        case EventKind::ScaleService:      return "scale_service";
    }
    return "unknown";
}

std::string describe(const GameEvent& e) {
    std::ostringstream oss;
    switch (e.kind) {
        case EventKind::InitialPlacement:
            oss << "[Setup] Player " << e.player << " starts with service #" << e.service
                << " (" << e.detail << ")";
            break;
        case EventKind::TrafficGenerated:
            oss << "[Traffic] " << e.value << " requests incoming (" << e.detail << ")";
            break;
        case EventKind::AllRequestsFailed:
            oss << "[Warning] No load balancer online: " << e.value << " requests dropped.";
            break;
        case EventKind::ServiceFailed:
            oss << "[Warning] Service #" << e.service << " failed under load (" << e.detail << ")";
            break;
        case EventKind::CascadeFailure:
            oss << "[Cascade] Failure of #" << e.service << " spreads (d20=" << e.value << ")";
            break;
        case EventKind::CascadeContained:
            oss << "[Cascade] Failure of #" << e.service << " contained (d20=" << e.value << ")";
            break;
        case EventKind::ChaosEvent:
            oss << "[Chaos] " << e.detail << " (d8=" << e.value << ")";
            break;
        case EventKind::OverloadResolved:
            oss << "[Resolve] Service #" << e.service << " is now " << e.detail;
            break;
        case EventKind::RoundEnd:
            oss << "[Round] Round " << e.round << " ends. " << e.detail;
            break;
        case EventKind::DeployService:
            oss << "[Action] Player " << e.player << " deployed #" << e.service << " " << e.detail;
            break;
        case EventKind::RepairService:
            oss << "[Action] Player " << e.player << " repaired #" << e.service;
            break;
        case EventKind::ScaleService:
            oss << "[Action] Player " << e.player << " scaled #" << e.service;
            break;
    }
    return oss.str();
}

void logEvent(GameState& s, const StepOpts& opt, GameEvent e) {
    e.round = s.round;
    e.phase = s.phase;
    emit(opt, logKindFor(e.kind), describe(e));
    s.eventLog.push_back(std::move(e));
}

} // namespace peril
