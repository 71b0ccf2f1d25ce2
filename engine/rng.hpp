#pragma once
#include <cstdint>

namespace peril {

// SplitMix64 to expand a 64-bit seed into well-distributed 64-bit values.
inline uint64_t splitmix64(uint64_t x) {
    x += 0x9E3779B97F4A7C15ULL;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
    return x ^ (x >> 31);
}

// PCG32 owned by one game. Unlike the std distributions this gives the same
// stream on every standard library, so saves and replays are portable.
class Rng {
public:
    explicit Rng(uint64_t seed = 0xC0FFEEULL) { reseed(seed); }

    void reseed(uint64_t seed) {
        state_ = splitmix64(seed);
        inc_   = (splitmix64(seed ^ 0xDA442D24ULL) << 1u) | 1u; // odd
        next();
    }

    uint32_t next() {
        const uint64_t s = state_;
        state_ = s * 6364136223846793005ULL + inc_;
        const uint32_t mixed = static_cast<uint32_t>(((s >> 18u) ^ s) >> 27u);
        const uint32_t rot   = static_cast<uint32_t>(s >> 59u);
        return (mixed >> rot) | (mixed << ((-static_cast<int32_t>(rot)) & 31));
    }

    // [0, n), unbiased (Lemire). 0 when n == 0.
    uint32_t below(uint32_t n) {
        if (n == 0) return 0;
        const uint32_t threshold = static_cast<uint32_t>(-n) % n;
        uint64_t m = static_cast<uint64_t>(next()) * n;
        while (static_cast<uint32_t>(m) < threshold) {
            m = static_cast<uint64_t>(next()) * n;
        }
        return static_cast<uint32_t>(m >> 32);
    }

    // One face of a fair die, 1..sides.
    int roll(int sides) {
        return 1 + static_cast<int>(below(static_cast<uint32_t>(sides)));
    }

    // [0,1) with 53 bits of precision.
    double unit() {
        const uint64_t hi = next(), lo = next();
        return static_cast<double>(((hi << 32) | lo) >> 11) * (1.0 / 9007199254740992.0);
    }

    // True with probability p.
    bool chance(double p) { return unit() < p; }

    // Raw state for save files.
    uint64_t state() const { return state_; }
    uint64_t inc() const { return inc_; }
    void restore(uint64_t state, uint64_t inc) { state_ = state; inc_ = inc | 1u; }

    bool operator==(const Rng& o) const { return state_ == o.state_ && inc_ == o.inc_; }

private:
    uint64_t state_ = 0;
    uint64_t inc_   = 1;
};

} // namespace peril
