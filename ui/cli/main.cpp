#include <cstdint>
#include <iomanip>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../../engine/actions.hpp"
#include "../../engine/persist.hpp"
#include "../../engine/setup.hpp"
#include "../../engine/state.hpp"
#include "../../engine/state_hash.hpp"
#include "../../engine/step.hpp"

using namespace peril;

static int readInt(const std::string& prompt, int lo, int hi) {
    while (true) {
        std::cout << prompt;
        int v;
        if (std::cin >> v && v >= lo && v <= hi) {
            std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
            return v;
        }
        if (std::cin.eof()) return lo;
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        std::cout << "Enter a number in [" << lo << ", " << hi << "].\n";
    }
}

static std::string readLine(const std::string& prompt, const std::string& defValue) {
    std::cout << prompt << " [" << defValue << "]: ";
    std::string line;
    if (!std::getline(std::cin, line) || line.empty()) return defValue;
    return line;
}

// Uniform pick over the legal actions. A stand-in for real players so the
// engine can be driven headless; it has no strategy of its own.
static ActionPolicy randomPolicy(uint64_t seed) {
    auto rng = std::make_shared<Rng>(seed ^ 0x5EEDF00DULL);
    return [rng](const GameState& s, int playerId) -> std::optional<Action> {
        auto legal = legalActions(s, playerId);
        if (legal.empty()) return std::nullopt;
        return legal[rng->below(static_cast<uint32_t>(legal.size()))];
    };
}

static char kindGlyph(ServiceKind k) {
    switch (k) {
        case ServiceKind::Compute:      return 'C';
        case ServiceKind::Database:     return 'D';
        case ServiceKind::Cache:        return 'K';
        case ServiceKind::Queue:        return 'Q';
        case ServiceKind::LoadBalancer: return 'L';
        case ServiceKind::ApiGateway:   return 'G';
        default:                        return '?';
    }
}

static char stateGlyph(ServiceState st) {
    switch (st) {
        case ServiceState::Healthy:    return ' ';
        case ServiceState::Degraded:   return '~';
        case ServiceState::Overloaded: return '!';
        case ServiceState::Failed:     return 'x';
        case ServiceState::Cascading:  return '*';
        default:                       return '?';
    }
}

static void showBoard(const GameState& s) {
    std::cout << "\n--- Board (" << s.config.boardRows << "x" << s.config.boardCols << ") ---\n";
    for (int r = 0; r < s.config.boardRows; ++r) {
        if (r % 2 == 1) std::cout << "  ";
        for (int c = 0; c < s.config.boardCols; ++c) {
            auto it = s.board.find(Position{r, c});
            if (it == s.board.end()) {
                std::cout << " .. ";
                continue;
            }
            const Service& svc = s.services.at(it->second);
            std::cout << " " << kindGlyph(svc.kind) << svc.owner << stateGlyph(svc.state);
        }
        std::cout << "\n";
    }
    std::cout << "Legend: C compute, D database, K cache, Q queue, L load balancer, G gateway;"
                 " ~ degraded, ! overloaded, x failed, * cascading\n";
}

static void showStatus(const GameState& s) {
    std::cout << "\n=== Network Status ===\n";
    std::cout << "Round " << s.round << "/" << s.config.maxRounds << ", phase "
              << to_string(s.phase) << ", entropy " << s.entropy << "/" << s.config.maxEntropy
              << (s.config.cooperativeMode ? " (cooperative)" : " (competitive)") << "\n";
    std::cout << std::fixed << std::setprecision(1);
    std::cout << "Uptime: " << (calculateUptime(s) * 100.0) << "% ("
              << s.successfulRequests << " ok, " << s.failedRequests << " failed, "
              << s.totalRequests << " total)\n";
    for (const auto& p : s.players) {
        std::cout << "  " << p.name << " [" << to_string(p.strategy) << "] cpu " << p.cpu
                  << ", mem " << p.memory << ", storage " << p.storage << ", score " << p.score
                  << ", actions " << p.actionsRemaining << ", services " << p.servicesOwned.size()
                  << "\n";
    }
    for (const auto& [id, svc] : s.services) {
        std::cout << "  #" << id << " " << to_string(svc.kind) << " @(" << svc.pos.row << ","
                  << svc.pos.col << ") " << to_string(svc.state) << " load " << svc.load << "/"
                  << svc.capacity() << " links " << svc.connections.size() << "\n";
    }
    if (s.lastDiceRoll) {
        std::cout << "Last roll: " << s.lastDiceRoll->rolls.size() << to_string(s.lastDiceRoll->die)
                  << " = " << s.lastDiceRoll->total << "\n";
    }
    std::cout << "Checksum: " << std::hex << stateChecksum(s) << std::dec << "\n";
    std::cout << "======================\n\n";
}

static void showResult(const GameState& s) {
    auto w = getWinner(s);
    if (!w) {
        std::cout << "Game over after round " << s.round << ": no winner.\n";
    } else if (*w == TEAM_WINNER) {
        std::cout << "Game over after round " << s.round << ": the team kept the network up!\n";
    } else {
        std::cout << "Game over after round " << s.round << ": " << s.players[static_cast<size_t>(*w)].name
                  << " wins.\n";
    }
}

static void doAct(GameState& s, const StepOpts& opt) {
    int pid = readInt("Player id: ", 0, static_cast<int>(s.players.size()) - 1);
    auto legal = legalActions(s, pid);
    if (legal.empty()) {
        std::cout << "No legal actions for player " << pid << ".\n";
        return;
    }
    size_t deploys = 0;
    for (const auto& a : legal) {
        if (std::holds_alternative<DeployAction>(a)) {
            ++deploys;
            continue;
        }
        std::cout << "  " << formatAction(a) << "\n";
    }
    std::cout << "  (" << deploys << " deploy options)\n";
    std::string text = readLine("Action, e.g. 'deploy cache 2 3', 'repair 5', 'scale 5'", "");
    auto action = parseAction(text);
    if (!action) {
        std::cout << "Could not parse '" << text << "'.\n";
        return;
    }
    if (executeAction(s, pid, *action, opt)) std::cout << "Done.\n";
    else                                     std::cout << "Action rejected.\n";
}

static int runBatch(const GameConfig& base, int games) {
    StepOpts quiet;
    quiet.sink = null_sink;
    double uptimeSum = 0.0;
    int roundsSum = 0;
    std::map<int, int> winners;  // TEAM_WINNER / player id -> games
    int noWinner = 0;
    for (int i = 0; i < games; ++i) {
        GameConfig cfg = base;
        cfg.seed = base.seed + static_cast<uint64_t>(i);
        GameState s = newGame(cfg, quiet);
        roundsSum += playGame(s, randomPolicy(cfg.seed), quiet);
        uptimeSum += calculateUptime(s);
        if (auto w = getWinner(s)) ++winners[*w];
        else                       ++noWinner;
    }
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "Games: " << games << ", mean rounds " << (double)roundsSum / games
              << ", mean uptime " << uptimeSum / games << "\n";
    for (const auto& [who, n] : winners) {
        if (who == TEAM_WINNER) std::cout << "  team wins: " << n << "\n";
        else                    std::cout << "  player " << who << " wins: " << n << "\n";
    }
    std::cout << "  no winner: " << noWinner << "\n";
    return 0;
}

static int runSelfTest() {
    StepOpts quiet;
    quiet.sink = null_sink;
    quiet.check_invariants = true;

    GameConfig cfg;
    cfg.seed = 123456789u;
    cfg.maxRounds = 8;
    cfg.cooperativeMode = false;

    // 1) Same seed, same policy -> same game.
    GameState a = newGame(cfg, quiet);
    GameState b = newGame(cfg, quiet);
    playGame(a, randomPolicy(cfg.seed), quiet);
    playGame(b, randomPolicy(cfg.seed), quiet);
    if (stateChecksum(a) != stateChecksum(b)) {
        std::cout << "[SelfTest] identical seeds diverged.\n";
        return 2;
    }

    // 2) Save/Load round-trip keeps the checksum.
    const char* tmp = "selftest.peril";
    if (!saveGame(a, tmp, quiet)) return 3;
    GameState c;
    if (!loadGame(c, tmp, quiet)) return 4;
    if (stateChecksum(c) != stateChecksum(a)) {
        std::cout << "[SelfTest] save/load changed the state.\n";
        return 5;
    }

    std::cout << "[SelfTest] OK\n";
    return 0;
}

int main(int argc, char** argv) {
    std::ios::sync_with_stdio(false);

    GameConfig cfg;
    std::string configPath, loadPath, savePath;
    bool seedProvided = false, playersProvided = false, roundsProvided = false, competitive = false;
    uint64_t seed = 0;
    int players = 0, rounds = 0;
    int autorunRounds = 0, games = 0;
    bool checkInvariantsFlag = false, selftest = false, quiet = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--seed" && i + 1 < argc) {
                seed = std::stoull(argv[++i]);
                seedProvided = true;
            } else if (arg == "--players" && i + 1 < argc) {
                players = std::stoi(argv[++i]);
                playersProvided = true;
            } else if (arg == "--rounds" && i + 1 < argc) {
                rounds = std::stoi(argv[++i]);
                roundsProvided = true;
            } else if (arg == "--competitive") {
                competitive = true;
            } else if (arg == "--config" && i + 1 < argc) {
                configPath = argv[++i];
            } else if (arg == "--autorun" && i + 1 < argc) {
                autorunRounds = std::stoi(argv[++i]);
            } else if (arg == "--games" && i + 1 < argc) {
                games = std::stoi(argv[++i]);
            } else if (arg == "--load" && i + 1 < argc) {
                loadPath = argv[++i];
            } else if (arg == "--save" && i + 1 < argc) {
                savePath = argv[++i];
            } else if (arg == "--check-invariants") {
                checkInvariantsFlag = true;
            } else if (arg == "--selftest") {
                selftest = true;
            } else if (arg == "--quiet") {
                quiet = true;
            } else {
                std::cerr << "Unknown argument '" << arg << "'.\n";
                return 1;
            }
        }

        if (selftest) return runSelfTest();

        StepOpts opt;
        opt.check_invariants = checkInvariantsFlag;
        if (quiet) opt.sink = null_sink;

        // Flags override the config file.
        if (!configPath.empty() && !loadConfig(configPath, cfg, opt)) return 1;
        if (seedProvided)    cfg.seed = seed;
        if (playersProvided) cfg.playerCount = players;
        if (roundsProvided)  cfg.maxRounds = rounds;
        if (competitive)     cfg.cooperativeMode = false;

        if (games > 0) {
            validateConfig(cfg);
            return runBatch(cfg, games);
        }

        GameState s = newGame(cfg, opt);
        if (!loadPath.empty() && !loadGame(s, loadPath, opt)) return 1;
        const ActionPolicy policy = randomPolicy(s.config.seed);

        if (autorunRounds > 0) {
            for (int r = 0; r < autorunRounds && !isGameOver(s); ++r) playRound(s, policy, opt);
            showStatus(s);
            if (isGameOver(s)) showResult(s);
            if (!savePath.empty() && !saveGame(s, savePath, opt)) return 1;
            return 0;
        }

        std::cout << "=== Pipeline & Peril (CLI) ===\n";
        bool running = true;
        while (running) {
            std::cout << "\nRound " << s.round << ", phase " << to_string(s.phase) << "\n"
                         "Menu:\n"
                         " 1) Status\n"
                         " 2) Board\n"
                         " 3) Run current phase (auto players)\n"
                         " 4) Play full round (auto players)\n"
                         " 5) Act for a player\n"
                         " 6) Save\n"
                         " 7) Load\n"
                         " 0) Quit\n";
            int c = readInt("Choice: ", 0, 7);
            switch (c) {
                case 1: showStatus(s); break;
                case 2: showBoard(s); break;
                case 3: runPhase(s, policy, opt); break;
                case 4: playRound(s, policy, opt); break;
                case 5: doAct(s, opt); break;
                case 6: saveGame(s, readLine("Save file", "savegame.peril"), opt); break;
                case 7: loadGame(s, readLine("Load file", "savegame.peril"), opt); break;
                case 0: running = false; break;
            }
            if (running && (c == 3 || c == 4) && isGameOver(s)) {
                showResult(s);
                running = false;
            }
        }

        if (!savePath.empty() && !saveGame(s, savePath, opt)) return 1;
        std::cout << "Goodbye.\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\nFatal error: " << e.what() << "\n";
        return 1;
    }
}
