#pragma once

#include <random>

namespace cardforge::util {

using RandomEngine = std::mt19937_64;

// Per-thread engine seeded from std::random_device. Generation code takes an
// engine by reference so tests can pass a fixed-seed one instead.
inline RandomEngine& threadEngine() {
    static thread_local RandomEngine rng{std::random_device{}()};
    return rng;
}

} // namespace cardforge::util
