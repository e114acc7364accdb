#pragma once
// A simple dynamic bitset backed by 64-bit words, indexed by node id.
// Bounds-checked gets only under CORE_HARDENED.

#include <bit>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/config.hpp"

struct BitsetVector {
    std::vector<std::uint64_t> words{};
    std::size_t n_bits{0};

    BitsetVector() = default;
    explicit BitsetVector(std::size_t n) { resize(n); }

    void resize(std::size_t n) {
        n_bits = n;
        words.assign((n + 63) / 64, 0ull);
    }
    std::size_t size() const noexcept { return n_bits; }

    inline void set(std::size_t i, bool val = true) {
        CORE_ASSERT_H(i < n_bits, "BitsetVector::set out of range");
        const std::size_t w = i >> 6;
        const std::uint64_t mask = 1ull << (i & 63);
        if (val) words[w] |= mask; else words[w] &= ~mask;
    }
    inline bool get(std::size_t i) const {
        CORE_ASSERT_H(i < n_bits, "BitsetVector::get out of range");
        return (words[i >> 6] >> (i & 63)) & 1ull;
    }

    // Set bit i and report whether it was clear before.
    inline bool test_and_set(std::size_t i) {
        CORE_ASSERT_H(i < n_bits, "BitsetVector::test_and_set out of range");
        const std::size_t w = i >> 6;
        const std::uint64_t mask = 1ull << (i & 63);
        const bool was_clear = (words[w] & mask) == 0;
        words[w] |= mask;
        return was_clear;
    }

    std::size_t count() const noexcept {
        std::size_t c = 0;
        for (auto w : words) c += static_cast<std::size_t>(std::popcount(w));
        return c;
    }

    // Visit set bits in ascending order.
    template <class F>
    void for_each_set(F&& f) const {
        for (std::size_t w = 0; w < words.size(); ++w) {
            std::uint64_t bits = words[w];
            while (bits) {
                const int b = std::countr_zero(bits);
                f((w << 6) + static_cast<std::size_t>(b));
                bits &= bits - 1;
            }
        }
    }
};
