#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>

// Simple, fast RNG with deterministic cross-platform behavior.
// Not cryptographically secure.
//
// Level generation draws every random decision (room sizes and positions,
// tunnel orientation, spawn counts, monster variant) from one instance, so a
// fixed seed reproduces the same level on every platform.
struct RNG {
    uint32_t state;

    explicit RNG(uint32_t seed = 0x12345678u) : state(seed ? seed : 0x12345678u) {}

    uint32_t nextU32() {
        // xorshift32
        uint32_t x = state;
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        state = x;
        return x;
    }

    // Uniform in [lo, hiInclusive]. An empty or single-value span returns lo
    // without advancing the state.
    int range(int lo, int hiInclusive) {
        if (hiInclusive <= lo) return lo;
        uint32_t span = static_cast<uint32_t>(hiInclusive - lo + 1);
        return lo + static_cast<int>(nextU32() % span);
    }

    float next01() {
        // [0,1)
        return (nextU32() / (static_cast<float>(std::numeric_limits<uint32_t>::max()) + 1.0f));
    }

    bool chance(float p) {
        return next01() < p;
    }

    bool coinFlip() {
        return (nextU32() & 1u) != 0;
    }

    template <typename T, size_t N>
    const T& pick(const T (&items)[N]) {
        return items[static_cast<size_t>(range(0, static_cast<int>(N) - 1))];
    }
};
