#include "test_support.hpp"
#include "../engine/actions.hpp"
#include "../engine/state_hash.hpp"
#include "../engine/step.hpp"

using namespace peril;

// Always takes the first legal action; deterministic without its own RNG.
static std::optional<Action> firstLegal(const GameState& s, int playerId) {
    auto legal = legalActions(s, playerId);
    if (legal.empty()) return std::nullopt;
    return legal.front();
}

int main() {
    const StepOpts opt = test::quietOpts();

    GameConfig cfg;
    cfg.seed = 12345;
    cfg.maxRounds = 25;
    cfg.cooperativeMode = false;

    GameState a = newGame(cfg, opt), b = newGame(cfg, opt);
    assert(stateChecksum(a) == stateChecksum(b));
    for (int i = 0; i < 25; ++i) {
        playRound(a, firstLegal, opt);
        playRound(b, firstLegal, opt);
        assert(stateChecksum(a) == stateChecksum(b));
    }
    assert(a.diceHistory.size() == b.diceHistory.size());
    assert(a.eventLog.size() == b.eventLog.size());

    // A different seed takes a different path.
    cfg.seed = 54321;
    GameState c = newGame(cfg, opt);
    for (int i = 0; i < 25; ++i) playRound(c, firstLegal, opt);
    assert(stateChecksum(c) != stateChecksum(a));

    // Independent instances share nothing: stepping one leaves the other alone.
    cfg.seed = 99;
    GameState d = newGame(cfg, opt), e = newGame(cfg, opt);
    const uint64_t before = stateChecksum(e);
    for (int i = 0; i < 5; ++i) playRound(d, firstLegal, opt);
    assert(stateChecksum(e) == before);
    return 0;
}
