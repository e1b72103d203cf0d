#pragma once

#include <cstdint>
#include <limits>

namespace utils {

// Unsigned 64-bit arithmetic that reports overflow instead of wrapping.
// On failure `out` is left untouched.

inline bool checked_add(std::uint64_t a, std::uint64_t b, std::uint64_t& out) noexcept {
    if (a > std::numeric_limits<std::uint64_t>::max() - b) {
        return false;
    }
    out = a + b;
    return true;
}

inline bool checked_sub(std::uint64_t a, std::uint64_t b, std::uint64_t& out) noexcept {
    if (b > a) {
        return false;
    }
    out = a - b;
    return true;
}

inline bool checked_mul(std::uint64_t a, std::uint64_t b, std::uint64_t& out) noexcept {
    if (a != 0 && b > std::numeric_limits<std::uint64_t>::max() / a) {
        return false;
    }
    out = a * b;
    return true;
}

// For totals that are reported, not settled: clamps at the maximum.
inline std::uint64_t saturating_add(std::uint64_t a, std::uint64_t b) noexcept {
    std::uint64_t out = 0;
    return checked_add(a, b, out) ? out : std::numeric_limits<std::uint64_t>::max();
}

} // namespace utils
