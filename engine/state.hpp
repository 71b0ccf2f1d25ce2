#pragma once
#include <algorithm>
#include <cstdint>
#include <deque>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "rng.hpp"
#include "specs.hpp"
#include "types.hpp"

namespace peril {

// ---------- Tuning constants ----------
constexpr int    STARTING_RESOURCES    = 20;
constexpr int    RESOURCE_CAP          = 50;   // applied on gain only
constexpr int    ACTIONS_PER_ROUND     = 3;

constexpr int    MAX_ROUTE_DEPTH       = 10;   // runaway guard
constexpr int    MAX_FORWARD_DEPTH     = 3;    // routers forward only below this depth
constexpr double MAX_FAILURE_CHANCE    = 0.8;

constexpr int    CASCADE_ROLL_MAX      = 8;    // d20 <= 8 cascades (40%)
constexpr int    CASCADE_LOAD          = 5;
constexpr double CASCADE_SPREAD_CHANCE = 0.3;

constexpr int    DDOS_LOAD             = 3;
constexpr int    MEMORY_LEAK_LOAD      = 2;
constexpr int    DISK_FULL_LOAD        = 5;
constexpr int    PARTITION_PICKS       = 3;
constexpr int    OUTAGE_FAILURES       = 2;

constexpr double HEAL_CHANCE           = 0.3;
constexpr double HEAL_LOAD_FRACTION    = 0.5;

constexpr double RESOLVE_FAIL_RATIO    = 1.5;
constexpr double RESOLVE_FAIL_CHANCE   = 0.4;
constexpr double RESOLVE_DEGRADE_RATIO = 1.2;
constexpr double RESOLVE_DEGRADE_CHANCE= 0.3;

constexpr int    REPAIR_CPU            = 2;
constexpr int    REPAIR_RELIEF         = 3;
constexpr int    SCALE_CPU             = 1;
constexpr int    SCALE_RELIEF          = 2;

constexpr int    UPTIME_WINDOW         = 3;
constexpr int    TEAM_WINNER           = -1;

// ---------- Typed log / message bus ----------
enum class LogKind { Info, Warning, Event, Chaos };

struct LogMsg {
    LogKind     kind;
    std::string text;
};

using LogSink = std::function<void(const LogMsg&)>;

inline void console_sink(const LogMsg& m) {
    std::cout << m.text << '\n';
}
inline void null_sink(const LogMsg&) {}

struct StepOpts {
    LogSink sink             = console_sink;
    bool    check_invariants = false;  // advanceRound throws on a violation
};

inline void emit(const StepOpts& opt, LogKind k, std::string text) {
    if (opt.sink) opt.sink(LogMsg{k, std::move(text)});
}

// ---------- Board / network ----------
struct Position {
    int row = 0;
    int col = 0;

    bool operator==(const Position& o) const { return row == o.row && col == o.col; }
    bool operator!=(const Position& o) const { return !(*this == o); }
    bool operator<(const Position& o) const {
        return row != o.row ? row < o.row : col < o.col;
    }
};

struct Service {
    int           id    = 0;
    ServiceKind   kind  = ServiceKind::Compute;
    Position      pos;
    ServiceState  state = ServiceState::Healthy;
    int           load  = 0;
    int           bugs  = 0;
    std::set<int> connections;  // symmetric
    int           owner = 0;

    int  capacity() const { return getSpec(kind).capacity; }
    bool isOverloaded() const { return load > capacity(); }
};

struct Player {
    int            id       = 0;
    std::string    name;
    PlayerStrategy strategy = PlayerStrategy::Balanced;
    int            cpu      = STARTING_RESOURCES;
    int            memory   = STARTING_RESOURCES;
    int            storage  = STARTING_RESOURCES;
    int            score    = 0;
    std::set<int>  servicesOwned;
    int            actionsRemaining = ACTIONS_PER_ROUND;

    bool canAfford(ServiceKind k) const {
        const auto& sp = getSpec(k);
        return cpu >= sp.cpu_cost && memory >= sp.memory_cost && storage >= sp.storage_cost;
    }
};

struct GameConfig {
    int      boardRows       = 8;
    int      boardCols       = 6;
    int      maxRounds       = 10;
    double   uptimeTarget    = 0.8;
    int      maxEntropy      = 10;
    int      chaosThreshold  = 3;
    bool     cooperativeMode = true;
    int      playerCount     = 4;
    uint64_t seed            = 42u;
};

// ---------- Dice / event records ----------
struct DiceRoll {
    DieKind          die   = DieKind::D6;
    std::vector<int> rolls;
    int              total = 0;
    int              round = 0;
    Phase            phase = Phase::Traffic;
};

enum class EventKind {
    InitialPlacement, TrafficGenerated, AllRequestsFailed, ServiceFailed,
    CascadeFailure, CascadeContained, ChaosEvent, OverloadResolved, RoundEnd,
    DeployService, RepairService, ScaleService
};

// Append-only audit record. Core logic never reads these back.
struct GameEvent {
    int         round   = 0;
    Phase       phase   = Phase::Traffic;
    EventKind   kind    = EventKind::RoundEnd;
    int         player  = -1;
    int         service = -1;
    int         value   = 0;   // die result, request count, ... depending on kind
    std::string detail;
};

// ---------- Aggregate root ----------
struct GameState {
    GameConfig config;

    int   round         = 0;
    Phase phase         = Phase::Traffic;
    int   currentPlayer = 0;
    int   entropy       = 0;

    std::vector<Player>        players;
    std::map<int, Service>     services;   // id order == creation order
    std::map<Position, int>    board;      // occupied cell -> service id
    int                        nextServiceId = 1;

    int64_t totalRequests      = 0;
    int64_t successfulRequests = 0;
    int64_t failedRequests     = 0;
    std::vector<double> uptimeHistory;

    std::vector<GameEvent> eventLog;

    // Dice
    Rng                     rng;
    std::vector<DiceRoll>   diceHistory;
    std::optional<DiceRoll> lastDiceRoll;
    std::deque<int>         loadedDice;   // forced results, consumed first

    Service* findService(int id) {
        auto it = services.find(id);
        return it == services.end() ? nullptr : &it->second;
    }
    const Service* findService(int id) const {
        auto it = services.find(id);
        return it == services.end() ? nullptr : &it->second;
    }
    Player* findPlayer(int id) {
        if (id < 0 || id >= static_cast<int>(players.size())) return nullptr;
        return &players[static_cast<size_t>(id)];
    }
    const Player* findPlayer(int id) const {
        if (id < 0 || id >= static_cast<int>(players.size())) return nullptr;
        return &players[static_cast<size_t>(id)];
    }
};

// Adds resources, capping each pool at RESOURCE_CAP.
inline void gainResources(Player& p, int cpu, int memory, int storage) {
    p.cpu     = std::min(RESOURCE_CAP, p.cpu + cpu);
    p.memory  = std::min(RESOURCE_CAP, p.memory + memory);
    p.storage = std::min(RESOURCE_CAP, p.storage + storage);
}

// Append to the event log and mirror it on the log bus.
void logEvent(GameState& s, const StepOpts& opt, GameEvent e);
std::string describe(const GameEvent& e);
std::string_view to_string(EventKind k);

} // namespace peril
