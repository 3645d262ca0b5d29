#ifndef BIGKEY_DIAGNOSTIC_HPP
#define BIGKEY_DIAGNOSTIC_HPP

#include <string_view>

#include "bigkey/util/severity.hpp"

#include "bigkey/fwd.hpp"

namespace bigkey {

struct Diagnostic {
    /// @brief The severity of the diagnostic.
    /// `severity_is_emittable(severity)` shall be `true`.
    Severity severity;
    /// @brief The id of the diagnostic,
    /// which is a non-empty string containing a
    /// dot-separated sequence of identifier for this diagnostic.
    std::u8string_view id;
    /// @brief The diagnostic message.
    /// The referenced text only lives as long as the call to the logger.
    std::u8string_view message;
};

namespace diagnostic {

/// @brief A backend was installed into a registry which had none.
inline constexpr std::u8string_view registry_installed = u8"registry.installed";

/// @brief The backend of a registry was replaced explicitly.
inline constexpr std::u8string_view registry_replaced = u8"registry.replaced";

/// @brief An attempt was made to install a backend into a registry which already had one,
/// without requesting replacement.
inline constexpr std::u8string_view registry_already_set = u8"registry.already-set";

/// @brief Construction of an integer was requested from malformed or absent input.
inline constexpr std::u8string_view input_invalid = u8"input.invalid";

} // namespace diagnostic

} // namespace bigkey

#endif
