#pragma once

#include <cstdint>
#include <cstdlib>
#include <cmath>

// Linear congruential generator used wherever a palette must be reproducible
// from its input. Not suitable for anything but that.
class SeededRandom {
private:
    int32_t seed;

public:
    explicit SeededRandom(int32_t initialSeed) : seed(initialSeed) {}

    // Returns a value in [0, 1].
    double Next() {
        // 32-bit wrap-around arithmetic, done unsigned to stay well defined.
        seed = static_cast<int32_t>(static_cast<uint32_t>(seed) * 1664525u + 1013904223u);
        return static_cast<double>(std::llabs(static_cast<int64_t>(seed))) / 2147483648.0;
    }

    // Returns an integer in [0, max).
    uint32_t NextInt(uint32_t max) {
        if (max == 0) return 0;
        uint32_t v = static_cast<uint32_t>(std::floor(Next() * max));
        return v >= max ? max - 1 : v;
    }
};

// Folds a value into a 32-bit hash the way every deterministic seed here is built:
// seed = seed * 31 + value, wrapping.
inline int32_t HashStep31(int32_t seed, int64_t value) {
    return static_cast<int32_t>(static_cast<uint32_t>(seed) * 31u + static_cast<uint32_t>(value));
}
