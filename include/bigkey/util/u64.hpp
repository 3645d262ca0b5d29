#ifndef BIGKEY_U64_HPP
#define BIGKEY_U64_HPP

#include "bigkey/util/assert.hpp"

#include "bigkey/fwd.hpp"
#include "bigkey/settings.hpp"

// Shifts and rotations of 64-bit words which are represented as two 32-bit halves,
// the way 64-bit hash functions (SHA-512, Keccak, BLAKE2b) are commonly implemented
// on 32-bit arithmetic.
// The "small" variants take shift amounts in [1, 32), the "big" variants in (32, 64).

namespace bigkey {

struct U64_Halves {
    Uint32 high;
    Uint32 low;

    [[nodiscard]]
    friend constexpr bool operator==(U64_Halves, U64_Halves)
        = default;
};

[[nodiscard]]
constexpr U64_Halves split_u64(const Uint64 x) noexcept
{
    return { .high = Uint32(x >> 32), .low = Uint32(x) };
}

[[nodiscard]]
constexpr Uint64 join_u64(const Uint32 high, const Uint32 low) noexcept
{
    return (Uint64(high) << 32) | low;
}

[[nodiscard]]
constexpr Uint64 join_u64(const U64_Halves x) noexcept
{
    return join_u64(x.high, x.low);
}

// RIGHT SHIFT =====================================================================================
// shift amounts in [0, 32)

[[nodiscard]]
constexpr Uint32 shr_small_high(const Uint32 high, Uint32, const unsigned s)
{
    BIGKEY_DEBUG_ASSERT(s < 32);
    return high >> s;
}

[[nodiscard]]
constexpr Uint32 shr_small_low(const Uint32 high, const Uint32 low, const unsigned s)
{
    BIGKEY_DEBUG_ASSERT(s < 32);
    if (s == 0) {
        return low;
    }
    return (high << (32 - s)) | (low >> s);
}

// RIGHT ROTATION ==================================================================================

[[nodiscard]]
constexpr Uint32 rotr_small_high(const Uint32 high, const Uint32 low, const unsigned s)
{
    BIGKEY_DEBUG_ASSERT(s > 0 && s < 32);
    return (high >> s) | (low << (32 - s));
}

[[nodiscard]]
constexpr Uint32 rotr_small_low(const Uint32 high, const Uint32 low, const unsigned s)
{
    BIGKEY_DEBUG_ASSERT(s > 0 && s < 32);
    return (high << (32 - s)) | (low >> s);
}

/// @brief Rotation by exactly 32 swaps the halves.
[[nodiscard]]
constexpr Uint32 rotr32_high(Uint32, const Uint32 low) noexcept
{
    return low;
}

[[nodiscard]]
constexpr Uint32 rotr32_low(const Uint32 high, Uint32) noexcept
{
    return high;
}

[[nodiscard]]
constexpr Uint32 rotr_big_high(const Uint32 high, const Uint32 low, const unsigned s)
{
    BIGKEY_DEBUG_ASSERT(s > 32 && s < 64);
    return (high << (64 - s)) | (low >> (s - 32));
}

[[nodiscard]]
constexpr Uint32 rotr_big_low(const Uint32 high, const Uint32 low, const unsigned s)
{
    BIGKEY_DEBUG_ASSERT(s > 32 && s < 64);
    return (high >> (s - 32)) | (low << (64 - s));
}

// LEFT ROTATION ===================================================================================

[[nodiscard]]
constexpr Uint32 rotl_small_high(const Uint32 high, const Uint32 low, const unsigned s)
{
    BIGKEY_DEBUG_ASSERT(s > 0 && s < 32);
    return (high << s) | (low >> (32 - s));
}

[[nodiscard]]
constexpr Uint32 rotl_small_low(const Uint32 high, const Uint32 low, const unsigned s)
{
    BIGKEY_DEBUG_ASSERT(s > 0 && s < 32);
    return (low << s) | (high >> (32 - s));
}

[[nodiscard]]
constexpr Uint32 rotl_big_high(const Uint32 high, const Uint32 low, const unsigned s)
{
    BIGKEY_DEBUG_ASSERT(s > 32 && s < 64);
    return (low << (s - 32)) | (high >> (64 - s));
}

[[nodiscard]]
constexpr Uint32 rotl_big_low(const Uint32 high, const Uint32 low, const unsigned s)
{
    BIGKEY_DEBUG_ASSERT(s > 32 && s < 64);
    return (high << (s - 32)) | (low >> (64 - s));
}

} // namespace bigkey

#endif
