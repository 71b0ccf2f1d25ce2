#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include "state.hpp"

namespace peril {

struct DeployAction {
    ServiceKind kind = ServiceKind::Compute;
    Position    pos;
    bool operator==(const DeployAction& o) const { return kind == o.kind && pos == o.pos; }
};

struct RepairAction {
    int serviceId = 0;
    bool operator==(const RepairAction& o) const { return serviceId == o.serviceId; }
};

struct ScaleAction {
    int serviceId = 0;
    bool operator==(const ScaleAction& o) const { return serviceId == o.serviceId; }
};

using Action = std::variant<DeployAction, RepairAction, ScaleAction>;

// Every action the player could execute right now: deploys (catalog order x
// row-major empty cells), then repairs, then scales. Empty when the player
// has no actions left or does not exist.
std::vector<Action> legalActions(const GameState& s, int playerId);

// Apply one action. Returns false and leaves the state untouched when any
// precondition fails; on success spends one action and scores one point.
bool executeAction(GameState& s, int playerId, const Action& action, const StepOpts& opt);

// Text codec: "deploy <kind> <row> <col>", "repair <id>", "scale <id>".
std::string formatAction(const Action& action);
std::optional<Action> parseAction(std::string_view text);

} // namespace peril
