#pragma once

#include <random>
#include <string_view>
#include <utility>

#include "../types.h"

namespace sc {
namespace optimizer {

// Seeded random stream passed explicitly to every stochastic operation.
// Only the raw mt19937_64 output is used (its sequence is fixed by the
// standard), so a seed reproduces the same run on every platform.
class Rng {
  public:
    explicit Rng(u64 seed) : m_engine(seed) {}

    u64 next() { return m_engine(); }

    // Uniform integer in [0, n). n must be > 0.
    usize uniformIndex(usize n) {
        const u64 bound = static_cast<u64>(n);
        const u64 limit = std::mt19937_64::max() - (std::mt19937_64::max() % bound);
        u64 value = next();
        while (value >= limit) {
            value = next();
        }
        return static_cast<usize>(value % bound);
    }

    // Uniform double in [0, 1)
    f64 uniform01() { return static_cast<f64>(next() >> 11) * 0x1.0p-53; }

    bool chance(f64 probability) { return uniform01() < probability; }

    // Fisher-Yates over [first, last)
    template <typename It> void shuffle(It first, It last) {
        auto n = static_cast<usize>(last - first);
        for (usize i = n; i > 1; --i) {
            usize j = uniformIndex(i);
            using std::swap;
            swap(first[i - 1], first[j]);
        }
    }

  private:
    std::mt19937_64 m_engine;
};

// Derive an independent seed for a sub-problem (e.g. one profile type)
// from the run seed: FNV-1a of the salt mixed through splitmix64.
inline u64 deriveSeed(u64 base, std::string_view salt) {
    u64 hash = 14695981039346656037ull;
    for (char c : salt) {
        hash ^= static_cast<unsigned char>(c);
        hash *= 1099511628211ull;
    }
    u64 z = base ^ hash;
    z += 0x9e3779b97f4a7c15ull;
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ull;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebull;
    return z ^ (z >> 31);
}

} // namespace optimizer
} // namespace sc
