#include "persist.hpp"
#include "invariants.hpp"
#include "setup.hpp"
#include "step.hpp"
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

namespace peril {

static constexpr const char* SAVE_TAG     = "PERIL_SAVE";
static constexpr int         SAVE_VERSION = 1;

void writeSnapshot(std::ostream& os, const GameState& s) {
    os << std::setprecision(17);
    os << "round " << s.round << "\n";
    os << "phase " << to_string(s.phase) << "\n";
    os << "entropy " << s.entropy << "\n";
    os << "current_player " << s.currentPlayer << "\n";
    os << "uptime " << calculateUptime(s) << "\n";
    os << "requests " << s.totalRequests << " " << s.successfulRequests << " "
       << s.failedRequests << "\n";
    os << "next_service_id " << s.nextServiceId << "\n";

    os << "uptime_history " << s.uptimeHistory.size();
    for (double u : s.uptimeHistory) os << " " << u;
    os << "\n";

    os << "players " << s.players.size() << "\n";
    for (const auto& p : s.players) {
        os << "p " << p.id << " " << p.name << " " << to_string(p.strategy) << " "
           << p.cpu << " " << p.memory << " " << p.storage << " " << p.score << " "
           << p.actionsRemaining << " " << p.servicesOwned.size();
        for (int id : p.servicesOwned) os << " " << id;
        os << "\n";
    }

    os << "services " << s.services.size() << "\n";
    for (const auto& [id, svc] : s.services) {
        os << "s " << id << " " << to_string(svc.kind) << " " << svc.pos.row << " "
           << svc.pos.col << " " << to_string(svc.state) << " " << svc.load << " "
           << svc.capacity() << " " << svc.bugs << " " << svc.owner << " "
           << svc.connections.size();
        for (int c : svc.connections) os << " " << c;
        os << "\n";
    }
}

bool saveGame(const GameState& s, const std::string& path, const StepOpts& opt) {
    std::ofstream ofs(path, std::ios::out | std::ios::trunc);
    if (!ofs) {
        emit(opt, LogKind::Warning, "Failed to open '" + path + "' for writing.");
        return false;
    }

    const GameConfig& c = s.config;
    ofs << SAVE_TAG << " " << SAVE_VERSION << "\n";
    ofs << std::setprecision(17);
    ofs << "config " << c.boardRows << " " << c.boardCols << " " << c.maxRounds << " "
        << c.uptimeTarget << " " << c.maxEntropy << " " << c.chaosThreshold << " "
        << (c.cooperativeMode ? 1 : 0) << " " << c.playerCount << " " << c.seed << "\n";
    writeSnapshot(ofs, s);
    ofs << "rng " << s.rng.state() << " " << s.rng.inc() << "\n";
    ofs << "end\n";
    if (!ofs) {
        emit(opt, LogKind::Warning, "Failed while writing '" + path + "'.");
        return false;
    }
    emit(opt, LogKind::Info, "Saved to '" + path + "'.");
    return true;
}

static bool readPlayer(std::istream& in, Player& p) {
    std::string tag, strategy;
    size_t owned = 0;
    if (!(in >> tag >> p.id >> p.name >> strategy >> p.cpu >> p.memory >> p.storage
             >> p.score >> p.actionsRemaining >> owned) || tag != "p") {
        return false;
    }
    auto st = parseStrategy(strategy);
    if (!st) return false;
    p.strategy = *st;
    for (size_t i = 0; i < owned; ++i) {
        int id = 0;
        if (!(in >> id)) return false;
        p.servicesOwned.insert(id);
    }
    return true;
}

static bool readService(std::istream& in, Service& svc) {
    std::string tag, kind, state;
    int capacity = 0;
    size_t links = 0;
    if (!(in >> tag >> svc.id >> kind >> svc.pos.row >> svc.pos.col >> state >> svc.load
             >> capacity >> svc.bugs >> svc.owner >> links) || tag != "s") {
        return false;
    }
    auto k = parseServiceKind(kind);
    auto st = parseServiceState(state);
    if (!k || !st) return false;
    svc.kind = *k;
    svc.state = *st;
    for (size_t i = 0; i < links; ++i) {
        int c = 0;
        if (!(in >> c)) return false;
        svc.connections.insert(c);
    }
    return true;
}

bool loadGame(GameState& s, const std::string& path, const StepOpts& opt) {
    std::ifstream ifs(path, std::ios::in);
    if (!ifs) {
        emit(opt, LogKind::Warning, "Failed to open '" + path + "' for reading.");
        return false;
    }

    std::string tag;
    int version = 0;
    if (!(ifs >> tag >> version) || tag != SAVE_TAG || version != SAVE_VERSION) {
        emit(opt, LogKind::Warning, "Unrecognized save file header.");
        return false;
    }

    GameState loaded;
    bool sawEnd = false;
    auto fail = [&](const std::string& what) {
        emit(opt, LogKind::Warning, "Bad save record '" + what + "' in '" + path + "'.");
        return false;
    };

    std::string key;
    while (ifs >> key) {
        if (key == "config") {
            GameConfig& c = loaded.config;
            int coop = 0;
            if (!(ifs >> c.boardRows >> c.boardCols >> c.maxRounds >> c.uptimeTarget
                      >> c.maxEntropy >> c.chaosThreshold >> coop >> c.playerCount >> c.seed))
                return fail(key);
            c.cooperativeMode = (coop != 0);
        } else if (key == "round") {
            if (!(ifs >> loaded.round)) return fail(key);
        } else if (key == "phase") {
            std::string name;
            if (!(ifs >> name)) return fail(key);
            auto ph = parsePhase(name);
            if (!ph) return fail(key);
            loaded.phase = *ph;
        } else if (key == "entropy") {
            if (!(ifs >> loaded.entropy)) return fail(key);
        } else if (key == "current_player") {
            if (!(ifs >> loaded.currentPlayer)) return fail(key);
        } else if (key == "requests") {
            if (!(ifs >> loaded.totalRequests >> loaded.successfulRequests >> loaded.failedRequests))
                return fail(key);
        } else if (key == "next_service_id") {
            if (!(ifs >> loaded.nextServiceId)) return fail(key);
        } else if (key == "uptime_history") {
            size_t n = 0;
            if (!(ifs >> n)) return fail(key);
            // Counts come from the file: grow only as entries actually arrive.
            for (size_t i = 0; i < n; ++i) {
                double u = 0.0;
                if (!(ifs >> u)) return fail(key);
                loaded.uptimeHistory.push_back(u);
            }
        } else if (key == "players") {
            size_t n = 0;
            if (!(ifs >> n)) return fail(key);
            for (size_t i = 0; i < n; ++i) {
                Player p;
                if (!readPlayer(ifs, p) || p.id != static_cast<int>(i)) return fail("p");
                loaded.players.push_back(std::move(p));
            }
        } else if (key == "services") {
            size_t n = 0;
            if (!(ifs >> n)) return fail(key);
            for (size_t i = 0; i < n; ++i) {
                Service svc;
                if (!readService(ifs, svc)) return fail("s");
                loaded.board[svc.pos] = svc.id;
                loaded.services.emplace(svc.id, std::move(svc));
            }
        } else if (key == "rng") {
            uint64_t state = 0, inc = 0;
            if (!(ifs >> state >> inc)) return fail(key);
            loaded.rng.restore(state, inc);
        } else if (key == "end") {
            sawEnd = true;
            break;
        } else {
            // uptime and any newer keys: skip the rest of the line
            ifs.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        }
    }

    if (!sawEnd) return fail("end");
    try {
        validateConfig(loaded.config);
    } catch (const std::invalid_argument& e) {
        emit(opt, LogKind::Warning, e.what());
        return fail("config");
    }
    if (loaded.players.size() != static_cast<size_t>(loaded.config.playerCount)) return fail("players");
    if (!checkInvariants(loaded, opt, true)) {
        emit(opt, LogKind::Warning, "Save '" + path + "' is inconsistent; not loaded.");
        return false;
    }

    s = std::move(loaded);
    emit(opt, LogKind::Info, "Loaded from '" + path + "'.");
    return true;
}

} // namespace peril
