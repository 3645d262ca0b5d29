#ifndef BIGKEY_BIG_INT_OPS_HPP
#define BIGKEY_BIG_INT_OPS_HPP

#include <string>
#include <string_view>

#include "bigkey/util/strings.hpp"

#include "bigkey/big_int.hpp"

namespace bigkey {

/// @brief Returns the digits of `x` in the given `base`, preceded by `-` if `x` is negative.
/// For `base == 10`, this is the canonical decimal representation, without leading zeros.
[[nodiscard]]
inline std::string to_string(const Big_Int& x, const int base = 10, const bool to_upper = false)
{
    std::string result;
    x.print_to([&](const std::string_view str) { result += str; }, base, to_upper);
    return result;
}

[[nodiscard]]
inline std::u8string to_u8string(const Big_Int& x, const int base = 10, const bool to_upper = false)
{
    std::u8string result;
    x.print_to(
        [&](const std::string_view str) { result += as_u8string_view(str); }, base, to_upper
    );
    return result;
}

} // namespace bigkey

#endif
