#include "test_support.hpp"
#include "../engine/actions.hpp"
#include "../engine/persist.hpp"
#include "../engine/state_hash.hpp"
#include "../engine/step.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace peril;

static void writeFile(const std::string& path, const std::string& text) {
    std::ofstream f(path, std::ios::out | std::ios::trunc);
    assert(f);
    f << text;
}

static std::optional<Action> lastLegal(const GameState& s, int pid) {
    auto legal = legalActions(s, pid);
    if (legal.empty()) return std::nullopt;
    return legal.back();
}

int main() {
    const StepOpts opt = test::quietOpts();

    // Save, load, and keep playing: both copies stay in lockstep.
    {
        GameConfig cfg;
        cfg.seed = 2718;
        cfg.cooperativeMode = false;
        cfg.maxRounds = 20;
        GameState s = newGame(cfg, opt);
        for (int i = 0; i < 4; ++i) playRound(s, lastLegal, opt);
        runPhase(s, lastLegal, opt); // stop mid-round

        const std::string path = "persist_test.peril";
        assert(saveGame(s, path, opt));

        GameState loaded = test::freshGame(2, 1);
        assert(loadGame(loaded, path, opt));
        assert(stateChecksum(loaded) == stateChecksum(s));
        assert(loaded.phase == s.phase && loaded.round == s.round);
        assert(loaded.config.seed == 2718 && !loaded.config.cooperativeMode);
        assert(loaded.board == s.board);
        assert(loaded.uptimeHistory.size() == s.uptimeHistory.size());
        assert(loaded.eventLog.empty() && loaded.diceHistory.empty());

        for (int i = 0; i < 3; ++i) {
            playRound(s, lastLegal, opt);
            playRound(loaded, lastLegal, opt);
            assert(stateChecksum(loaded) == stateChecksum(s));
        }
        std::remove(path.c_str());
    }

    // Bad files never touch the target.
    {
        GameState target = test::freshGame();
        const uint64_t before = stateChecksum(target);

        assert(!loadGame(target, "does_not_exist.peril", opt));

        writeFile("bad_header.peril", "MARS_SAVE 2\nend\n");
        assert(!loadGame(target, "bad_header.peril", opt));
        std::remove("bad_header.peril");

        // Truncated: no end marker.
        GameState s = test::freshGame();
        assert(saveGame(s, "truncated.peril", opt));
        std::ifstream in("truncated.peril");
        std::stringstream body;
        body << in.rdbuf();
        in.close();
        std::string text = body.str();
        text = text.substr(0, text.find("end\n"));
        writeFile("truncated.peril", text);
        assert(!loadGame(target, "truncated.peril", opt));

        // Edge only recorded on one side.
        std::string broken = body.str();
        const std::string svcLine = "s 1 load_balancer 1 1 healthy 0 10 0 0 0";
        const auto at = broken.find(svcLine);
        assert(at != std::string::npos);
        broken.replace(at, svcLine.size(), "s 1 load_balancer 1 1 healthy 0 10 0 0 1 2");
        writeFile("truncated.peril", broken);
        assert(!loadGame(target, "truncated.peril", opt));
        std::remove("truncated.peril");

        // Counts far beyond what the file holds.
        writeFile("huge_count.peril", "PERIL_SAVE 1\nuptime_history 999999999999999\nend\n");
        assert(!loadGame(target, "huge_count.peril", opt));
        writeFile("huge_count.peril", "PERIL_SAVE 1\nplayers 18446744073709551615\nend\n");
        assert(!loadGame(target, "huge_count.peril", opt));
        std::remove("huge_count.peril");

        // A config newGame would refuse, and misnumbered players.
        const std::string good = body.str();
        const size_t cfgAt = good.find("config ");
        assert(cfgAt != std::string::npos);
        const std::string cfgLine = good.substr(cfgAt, good.find('\n', cfgAt) - cfgAt);
        std::string badCfg = good;
        badCfg.replace(badCfg.find(cfgLine), cfgLine.size(), "config 8 6 0 0.80000000000000004 10 3 1 4 7");
        writeFile("bad_config.peril", badCfg);
        assert(!loadGame(target, "bad_config.peril", opt));
        badCfg = good;
        badCfg.replace(badCfg.find(cfgLine), cfgLine.size(), "config 8 6 10 5 10 3 1 4 7");
        writeFile("bad_config.peril", badCfg);
        assert(!loadGame(target, "bad_config.peril", opt));

        std::string swapped = good;
        const auto p1 = swapped.find("p 1 Player_1");
        assert(p1 != std::string::npos);
        swapped.replace(p1, 3, "p 5");
        writeFile("bad_config.peril", swapped);
        assert(!loadGame(target, "bad_config.peril", opt));

        badCfg = good;
        badCfg.replace(badCfg.find(cfgLine), cfgLine.size(), "config 8 6 10 0.80000000000000004 10 3 1 3 7");
        writeFile("bad_config.peril", badCfg);
        assert(!loadGame(target, "bad_config.peril", opt));

        // The untouched text still loads.
        writeFile("bad_config.peril", good);
        GameState ok = test::freshGame(1, 3);
        assert(loadGame(ok, "bad_config.peril", opt));
        assert(stateChecksum(ok) == stateChecksum(s));
        std::remove("bad_config.peril");

        assert(stateChecksum(target) == before);
    }

    // The snapshot carries the fields a client renders.
    {
        GameState s = test::freshGame();
        std::ostringstream os;
        writeSnapshot(os, s);
        const std::string snap = os.str();
        for (const char* key : {"round 0", "phase traffic", "entropy 0", "uptime 1",
                                "requests 0 0 0", "players 4", "services 4",
                                "uptime_history 0", "p 0 Player_0 aggressive 20 20 20 0 3 1 1"}) {
            assert(snap.find(key) != std::string::npos);
        }
    }

    // Config files: known keys override, unknown keys are skipped, bad values reject.
    {
        writeFile("peril_test.cfg",
                  "# tuning\n"
                  "board_rows = 10\n"
                  "board_cols=7\n"
                  "max_rounds=12\n"
                  "uptime_target=0.75\n"
                  "seed=99\n"
                  "cooperative_mode=false\n"
                  "players=3\n"
                  "colour=blue\n");
        GameConfig cfg;
        assert(loadConfig("peril_test.cfg", cfg, opt));
        assert(cfg.boardRows == 10 && cfg.boardCols == 7 && cfg.maxRounds == 12);
        assert(test::near(cfg.uptimeTarget, 0.75, 1e-12));
        assert(cfg.seed == 99 && !cfg.cooperativeMode && cfg.playerCount == 3);
        assert(cfg.maxEntropy == 10 && cfg.chaosThreshold == 3);

        writeFile("peril_test.cfg", "board_rows=6\nmax_rounds=lots\n");
        GameConfig untouched;
        assert(!loadConfig("peril_test.cfg", untouched, opt));
        assert(untouched.boardRows == 8 && untouched.maxRounds == 10);

        writeFile("peril_test.cfg", "board_rows 6\n");
        assert(!loadConfig("peril_test.cfg", untouched, opt));
        assert(!loadConfig("no_such.cfg", untouched, opt));
        std::remove("peril_test.cfg");
    }

    // Invalid configs are refused before a game is built.
    {
        GameConfig cfg;
        cfg.boardRows = 0;
        bool threw = false;
        try { newGame(cfg, opt); } catch (const std::invalid_argument&) { threw = true; }
        assert(threw);
        cfg = GameConfig{};
        cfg.uptimeTarget = 1.5;
        threw = false;
        try { validateConfig(cfg); } catch (const std::invalid_argument&) { threw = true; }
        assert(threw);
        validateConfig(GameConfig{});
    }
    return 0;
}
