#ifndef BIGKEY_BYTE_CODEC_HPP
#define BIGKEY_BYTE_CODEC_HPP

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include "bigkey/util/result.hpp"

#include "bigkey/big_int_error.hpp"
#include "bigkey/fwd.hpp"
#include "bigkey/settings.hpp"

namespace bigkey {

enum struct Endian : Default_Underlying {
    /// @brief Most significant byte first.
    big,
    /// @brief Least significant byte first.
    little,
};

/// @brief Returns `ceil(bits / 8)`.
[[nodiscard]]
constexpr std::size_t byte_length_for_bits(const std::size_t bits) noexcept
{
    return bits / 8 + (bits % 8 != 0);
}

/// @brief Converts a minimal big-endian magnitude (without leading zeros)
/// into the requested byte order.
/// If `length` is given, the result has exactly that many bytes,
/// with zero bytes at the high-order end:
/// at the front for big endian, at the back for little endian.
/// @return The encoded bytes, or `Big_Int_Error::precision_loss` if `length` is less than
/// the size of the minimal encoding.
[[nodiscard]]
Result<std::vector<Uint8>, Big_Int_Error> encode_magnitude(
    std::vector<Uint8>&& minimal_big_endian,
    Endian endian,
    std::optional<std::size_t> length = {}
);

/// @brief Converts a magnitude in the given byte order into its minimal big-endian encoding,
/// i.e. without leading zeros.
/// An empty `bytes` or one consisting only of zeros yields an empty encoding.
[[nodiscard]]
std::vector<Uint8> decode_magnitude(std::span<const Uint8> bytes, Endian endian);

} // namespace bigkey

#endif
