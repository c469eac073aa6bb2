#pragma once

#include "psm/core/type.hpp"
#include "psm/core/macros.hpp"

#include <array>
#include <cstdint>
#include <utility>

// =============================================================================
// FILE: psm/core/random.hpp
// BRIEF: Small deterministic PRNG for resampling
// =============================================================================

namespace psm::random {

PSM_FORCE_INLINE std::uint64_t hash_combine(std::uint64_t h1, std::uint64_t h2) noexcept {
    return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
}

// Xoshiro128+, state seeded through a splitmix sequence
struct alignas(16) FastRNG {
    std::array<std::uint32_t, 4> s{};

    PSM_FORCE_INLINE explicit FastRNG(std::uint64_t seed) noexcept {
        std::uint64_t z = seed;
        for (std::uint32_t& si : s) {
            z += 0x9e3779b97f4a7c15ULL;
            std::uint64_t x = z;
            x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
            x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
            x ^= (x >> 31);
            si = static_cast<std::uint32_t>(x >> 32);
        }
    }

    [[nodiscard]] static PSM_FORCE_INLINE std::uint32_t rotl(std::uint32_t x, int k) noexcept {
        return (x << k) | (x >> (32 - k));
    }

    PSM_FORCE_INLINE std::uint32_t next() noexcept {
        const std::uint32_t result = s[0] + s[3];
        const std::uint32_t t = s[1] << 9;
        s[2] ^= s[0];
        s[3] ^= s[1];
        s[1] ^= s[2];
        s[0] ^= s[3];
        s[2] ^= t;
        s[3] = rotl(s[3], 11);
        return result;
    }

    // Uniform in [0, max_val) by rejection, max_val > 0
    PSM_FORCE_INLINE Size next_index(Size max_val) noexcept {
        const auto bound = static_cast<std::uint32_t>(max_val);
        const std::uint32_t threshold = (0u - bound) % bound;
        std::uint32_t r = next();
        while (r < threshold) {
            r = next();
        }
        return static_cast<Size>(r % bound);
    }
};

// Fisher-Yates over [first, last)
template <typename T>
inline void shuffle(T* first, Size n, FastRNG& rng) noexcept {
    for (Size i = n; i > 1; --i) {
        Size j = rng.next_index(i);
        std::swap(first[i - 1], first[j]);
    }
}

} // namespace psm::random
