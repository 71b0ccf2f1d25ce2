#include "actions.hpp"
#include "board.hpp"
#include <sstream>

namespace peril {

namespace {

bool repairable(ServiceState st) {
    return st == ServiceState::Degraded || st == ServiceState::Overloaded;
}

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

bool spendResources(Player& p, ServiceKind kind) {
    if (!p.canAfford(kind)) return false;
    const auto& sp = getSpec(kind);
    p.cpu     -= sp.cpu_cost;
    p.memory  -= sp.memory_cost;
    p.storage -= sp.storage_cost;
    return true;
}

bool doDeploy(GameState& s, Player& p, const DeployAction& a, const StepOpts& opt) {
    // Check the cell first so a failed placement never costs anything.
    if (!inBounds(s.config, a.pos) || s.board.count(a.pos)) return false;
    if (!spendResources(p, a.kind)) return false;

    int id = -1;
    if (placeService(s, a.kind, a.pos, p.id, &id) != PlaceResult::Ok) return false;

    std::ostringstream oss;
    oss << to_string(a.kind) << " at (" << a.pos.row << "," << a.pos.col << ")";
    GameEvent e;
    e.kind    = EventKind::DeployService;
    e.player  = p.id;
    e.service = id;
    e.detail  = oss.str();
    logEvent(s, opt, std::move(e));
    return true;
}

bool doRepair(GameState& s, Player& p, const RepairAction& a, const StepOpts& opt) {
    if (!p.servicesOwned.count(a.serviceId) || p.cpu < REPAIR_CPU) return false;
    Service* svc = s.findService(a.serviceId);
    if (!svc || !repairable(svc->state)) return false;

    svc->state = ServiceState::Healthy;
    svc->load  = std::max(0, svc->load - REPAIR_RELIEF);
    p.cpu -= REPAIR_CPU;

    GameEvent e;
    e.kind    = EventKind::RepairService;
    e.player  = p.id;
    e.service = a.serviceId;
    logEvent(s, opt, std::move(e));
    return true;
}

// No overload precondition: scaling a quiet service is allowed.
bool doScale(GameState& s, Player& p, const ScaleAction& a, const StepOpts& opt) {
    if (!p.servicesOwned.count(a.serviceId) || p.cpu < SCALE_CPU) return false;
    Service* svc = s.findService(a.serviceId);
    if (!svc) return false;

    svc->load = std::max(0, svc->load - SCALE_RELIEF);
    p.cpu -= SCALE_CPU;

    GameEvent e;
    e.kind    = EventKind::ScaleService;
    e.player  = p.id;
    e.service = a.serviceId;
    logEvent(s, opt, std::move(e));
    return true;
}

} // namespace

std::vector<Action> legalActions(const GameState& s, int playerId) {
    std::vector<Action> out;
    const Player* p = s.findPlayer(playerId);
    if (!p || p->actionsRemaining <= 0) return out;

    for (ServiceKind kind : ALL_SERVICE_KINDS) {
        if (!p->canAfford(kind)) continue;
        for (int r = 0; r < s.config.boardRows; ++r) {
            for (int c = 0; c < s.config.boardCols; ++c) {
                Position pos{r, c};
                if (!s.board.count(pos)) out.push_back(DeployAction{kind, pos});
            }
        }
    }

    for (int id : p->servicesOwned) {
        const Service* svc = s.findService(id);
        if (svc && repairable(svc->state)) out.push_back(RepairAction{id});
    }

    if (p->cpu >= SCALE_CPU) {
        for (int id : p->servicesOwned) {
            const Service* svc = s.findService(id);
            if (svc && svc->state == ServiceState::Healthy) out.push_back(ScaleAction{id});
        }
    }
    return out;
}

bool executeAction(GameState& s, int playerId, const Action& action, const StepOpts& opt) {
    Player* p = s.findPlayer(playerId);
    if (!p || p->actionsRemaining <= 0) return false;

    const bool ok = std::visit(overloaded{
        [&](const DeployAction& a) { return doDeploy(s, *p, a, opt); },
        [&](const RepairAction& a) { return doRepair(s, *p, a, opt); },
        [&](const ScaleAction& a)  { return doScale(s, *p, a, opt); },
    }, action);

    if (ok) {
        p->actionsRemaining -= 1;
        p->score += 1;
    }
    return ok;
}

std::string formatAction(const Action& action) {
    std::ostringstream oss;
    std::visit(overloaded{
        [&](const DeployAction& a) {
            oss << "deploy " << to_string(a.kind) << " " << a.pos.row << " " << a.pos.col;
        },
        [&](const RepairAction& a) { oss << "repair " << a.serviceId; },
        [&](const ScaleAction& a)  { oss << "scale " << a.serviceId; },
    }, action);
    return oss.str();
}

std::optional<Action> parseAction(std::string_view text) {
    std::istringstream iss{std::string(text)};
    std::string verb;
    if (!(iss >> verb)) return std::nullopt;

    std::optional<Action> out;
    if (verb == "deploy") {
        std::string kindName;
        int row = 0, col = 0;
        if (!(iss >> kindName >> row >> col)) return std::nullopt;
        auto kind = parseServiceKind(kindName);
        if (!kind) return std::nullopt;
        out = DeployAction{*kind, Position{row, col}};
    } else if (verb == "repair" || verb == "scale") {
        int id = 0;
        if (!(iss >> id)) return std::nullopt;
        if (verb == "repair") out = RepairAction{id};
        else                  out = ScaleAction{id};
    } else {
        return std::nullopt;
    }

    std::string trailing;
    if (iss >> trailing) return std::nullopt;
    return out;
}

} // namespace peril
