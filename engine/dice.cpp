#include "dice.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace peril {

DieKind parseDieKind(std::string_view name) {
    static const DieKind all[] = {DieKind::D4, DieKind::D6, DieKind::D8,
                                  DieKind::D10, DieKind::D12, DieKind::D20};
    for (DieKind d : all) {
        if (to_string(d) == name) return d;
    }
    throw std::invalid_argument("unknown die kind '" + std::string(name) + "'");
}

// Every queued face this roll will consume must fit before any is taken.
static void checkLoaded(const GameState& s, DieKind die, int count) {
    const int sides = dieSides(die);
    const size_t used = std::min(s.loadedDice.size(), static_cast<size_t>(std::max(0, count)));
    for (size_t i = 0; i < used; ++i) {
        const int forced = s.loadedDice[i];
        if (forced < 1 || forced > sides) {
            throw std::out_of_range("loaded result " + std::to_string(forced) +
                                    " does not fit a " + std::string(to_string(die)));
        }
    }
}

static int drawFace(GameState& s, DieKind die) {
    if (!s.loadedDice.empty()) {
        const int forced = s.loadedDice.front();
        s.loadedDice.pop_front();
        return forced;
    }
    return s.rng.roll(dieSides(die));
}

const DiceRoll& rollDice(GameState& s, DieKind die, int count) {
    checkLoaded(s, die, count);

    DiceRoll r;
    r.die   = die;
    r.round = s.round;
    r.phase = s.phase;
    r.rolls.reserve(static_cast<size_t>(std::max(0, count)));
    for (int i = 0; i < count; ++i) {
        int face = drawFace(s, die);
        r.rolls.push_back(face);
        r.total += face;
    }
    s.diceHistory.push_back(r);
    s.lastDiceRoll = std::move(r);
    return *s.lastDiceRoll;
}

int rollDie(GameState& s, DieKind die) {
    return rollDice(s, die, 1).total;
}

void loadDice(GameState& s, const std::vector<int>& results) {
    s.loadedDice.insert(s.loadedDice.end(), results.begin(), results.end());
}

} // namespace peril
