#pragma once
// Simple SplitMix64 PRNG (fast, stateless stepping), header-only.
// Used for origin selection and per-run seed derivation; the state is always
// passed explicitly so runs are reproducible from the master seed.

#include <cstddef>
#include <cstdint>
#include <limits>

struct SplitMix64 {
    using result_type = std::uint64_t;
    std::uint64_t state;

    explicit SplitMix64(std::uint64_t seed = 0x9E3779B97F4A7C15ULL) : state(seed) {}

    static constexpr result_type min() { return std::numeric_limits<result_type>::min(); }
    static constexpr result_type max() { return std::numeric_limits<result_type>::max(); }

    inline std::uint64_t next_u64() {
        std::uint64_t z = (state += 0x9E3779B97F4A7C15ULL);
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
        return z ^ (z >> 31);
    }
    inline result_type operator()() { return next_u64(); }

    // Uniform in [0, n). Rejection sampling avoids modulo bias. n > 0.
    inline std::size_t uniform_index(std::size_t n) {
        const std::uint64_t limit = (std::numeric_limits<std::uint64_t>::max() / n) * n;
        std::uint64_t r;
        do { r = next_u64(); } while (r >= limit);
        return static_cast<std::size_t>(r % n);
    }
};

// One-shot hash of x through a fresh SplitMix64 (seed expander).
inline std::uint64_t splitmix_hash(std::uint64_t x) {
    SplitMix64 sm(x);
    return sm.next_u64();
}
