#include <algorithm>
#include <cstddef>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include "bigkey/util/assert.hpp"
#include "bigkey/util/result.hpp"

#include "bigkey/big_int_error.hpp"
#include "bigkey/byte_codec.hpp"

namespace bigkey {

Result<std::vector<Uint8>, Big_Int_Error> encode_magnitude(
    std::vector<Uint8>&& minimal_big_endian,
    const Endian endian,
    const std::optional<std::size_t> length
)
{
    BIGKEY_DEBUG_ASSERT(minimal_big_endian.empty() || minimal_big_endian.front() != 0);

    std::vector<Uint8> result = std::move(minimal_big_endian);
    if (length) {
        if (*length < result.size()) {
            return Big_Int_Error::precision_loss;
        }
        result.insert(result.begin(), *length - result.size(), Uint8 { 0 });
    }
    if (endian == Endian::little) {
        std::ranges::reverse(result);
    }
    return result;
}

std::vector<Uint8> decode_magnitude(std::span<const Uint8> bytes, const Endian endian)
{
    switch (endian) {
    case Endian::big: {
        const auto first_nonzero
            = std::ranges::find_if(bytes, [](const Uint8 b) { return b != 0; });
        return { first_nonzero, bytes.end() };
    }
    case Endian::little: {
        while (!bytes.empty() && bytes.back() == 0) {
            bytes = bytes.first(bytes.size() - 1);
        }
        return { bytes.rbegin(), bytes.rend() };
    }
    }
    BIGKEY_ASSERT_UNREACHABLE(u8"Invalid byte order.");
}

} // namespace bigkey
