#ifndef BIGKEY_BIG_INT_ERROR_HPP
#define BIGKEY_BIG_INT_ERROR_HPP

#include <string_view>

#include "bigkey/util/assert.hpp"

#include "bigkey/fwd.hpp"

namespace bigkey {

enum struct Big_Int_Error : Default_Underlying {
    /// @brief An integer was constructed from absent input,
    /// or from a string which is not a decimal or `0x`-prefixed hexadecimal digit sequence.
    invalid_input,
    /// @brief The divisor or modulus of an operation is zero.
    division_by_zero,
    /// @brief A modular inverse was requested for a value that is not coprime to the modulus.
    inverse_does_not_exist,
    /// @brief A backend was installed into a registry which already has one,
    /// without requesting replacement.
    implementation_already_set,
    /// @brief A narrowing conversion would not preserve the value exactly.
    precision_loss,
};

[[nodiscard]]
constexpr std::string_view big_int_error_name(Big_Int_Error error) noexcept
{
    switch (error) {
        using enum Big_Int_Error;
        BIGKEY_ENUM_STRING_CASE(invalid_input);
        BIGKEY_ENUM_STRING_CASE(division_by_zero);
        BIGKEY_ENUM_STRING_CASE(inverse_does_not_exist);
        BIGKEY_ENUM_STRING_CASE(implementation_already_set);
        BIGKEY_ENUM_STRING_CASE(precision_loss);
    }
    BIGKEY_ASSERT_UNREACHABLE(u8"Invalid Big_Int_Error.");
}

} // namespace bigkey

#endif
