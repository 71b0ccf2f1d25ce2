#include "setup.hpp"
#include "board.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace peril {

void validateConfig(const GameConfig& cfg) {
    auto require = [](bool cond, const char* what) {
        if (!cond) throw std::invalid_argument(std::string("invalid game config: ") + what);
    };
    require(cfg.boardRows >= 1, "boardRows >= 1");
    require(cfg.boardCols >= 1, "boardCols >= 1");
    require(cfg.maxRounds >= 1, "maxRounds >= 1");
    require(cfg.uptimeTarget >= 0.0 && cfg.uptimeTarget <= 1.0, "uptimeTarget in [0,1]");
    require(cfg.maxEntropy >= 0, "maxEntropy >= 0");
    require(cfg.chaosThreshold >= 0, "chaosThreshold >= 0");
    require(cfg.playerCount >= 1, "playerCount >= 1");
}

static std::string trim(const std::string& in) {
    const auto b = in.find_first_not_of(" \t\r");
    if (b == std::string::npos) return {};
    const auto e = in.find_last_not_of(" \t\r");
    return in.substr(b, e - b + 1);
}

static bool parseBool(const std::string& v, bool& out) {
    if (v == "1" || v == "true" || v == "yes")  { out = true;  return true; }
    if (v == "0" || v == "false" || v == "no")  { out = false; return true; }
    return false;
}

bool loadConfig(const std::string& path, GameConfig& cfg, const StepOpts& opt) {
    std::ifstream f(path);
    if (!f) {
        emit(opt, LogKind::Warning, "[Config] Cannot open '" + path + "'.");
        return false;
    }

    GameConfig tmp = cfg; // in case of partial read
    std::string line;
    int lineNo = 0;
    while (std::getline(f, line)) {
        ++lineNo;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto pos = line.find('=');
        if (pos == std::string::npos) {
            emit(opt, LogKind::Warning, "[Config] " + path + ":" + std::to_string(lineNo) + ": expected key=value");
            return false;
        }
        std::string key = trim(line.substr(0, pos));
        std::string val = trim(line.substr(pos + 1));

        try {
            if      (key == "board_rows")      tmp.boardRows = std::stoi(val);
            else if (key == "board_cols")      tmp.boardCols = std::stoi(val);
            else if (key == "max_rounds")      tmp.maxRounds = std::stoi(val);
            else if (key == "uptime_target")   tmp.uptimeTarget = std::stod(val);
            else if (key == "max_entropy")     tmp.maxEntropy = std::stoi(val);
            else if (key == "chaos_threshold") tmp.chaosThreshold = std::stoi(val);
            else if (key == "players")         tmp.playerCount = std::stoi(val);
            else if (key == "seed")            tmp.seed = std::stoull(val);
            else if (key == "cooperative_mode") {
                if (!parseBool(val, tmp.cooperativeMode)) throw std::invalid_argument(val);
            } else {
                emit(opt, LogKind::Warning, "[Config] Ignoring unknown key '" + key + "'.");
            }
        } catch (const std::exception&) {
            emit(opt, LogKind::Warning, "[Config] " + path + ":" + std::to_string(lineNo) +
                                        ": bad value '" + val + "' for " + key);
            return false;
        }
    }

    cfg = tmp;
    return true;
}

void initGame(GameState& s, const GameConfig& cfg, const StepOpts& opt) {
    validateConfig(cfg);

    s = GameState();
    s.config = cfg;
    s.rng.reseed(cfg.seed);

    static const PlayerStrategy cycle[] = {
        PlayerStrategy::Aggressive, PlayerStrategy::Defensive,
        PlayerStrategy::Balanced, PlayerStrategy::Random};

    s.players.reserve(static_cast<size_t>(cfg.playerCount));
    for (int i = 0; i < cfg.playerCount; ++i) {
        Player p;
        p.id       = i;
        p.name     = "Player_" + std::to_string(i);
        p.strategy = cycle[i % 4];
        s.players.push_back(std::move(p));
    }

    for (size_t i = 0; i < s.players.size() && i < STARTING_POSITIONS.size(); ++i) {
        const Position pos = STARTING_POSITIONS[i];
        int id = -1;
        if (placeService(s, ServiceKind::LoadBalancer, pos, static_cast<int>(i), &id) != PlaceResult::Ok) {
            emit(opt, LogKind::Warning, "[Setup] Starting cell (" + std::to_string(pos.row) + "," +
                                        std::to_string(pos.col) + ") is off the board; player " +
                                        std::to_string(i) + " starts empty.");
            continue;
        }
        std::ostringstream oss;
        oss << to_string(ServiceKind::LoadBalancer) << " at (" << pos.row << "," << pos.col << ")";
        GameEvent e;
        e.kind    = EventKind::InitialPlacement;
        e.player  = static_cast<int>(i);
        e.service = id;
        e.detail  = oss.str();
        logEvent(s, opt, std::move(e));
    }
}

GameState newGame(const GameConfig& cfg, const StepOpts& opt) {
    GameState s;
    initGame(s, cfg, opt);
    return s;
}

} // namespace peril
