#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "bigkey/util/ascii_algorithm.hpp"
#include "bigkey/util/assert.hpp"
#include "bigkey/util/chars.hpp"
#include "bigkey/util/result.hpp"
#include "bigkey/util/strings.hpp"

#include "bigkey/big_int.hpp"
#include "bigkey/big_int_backends.hpp"
#include "bigkey/big_int_error.hpp"
#include "bigkey/big_int_registry.hpp"
#include "bigkey/byte_codec.hpp"
#include "bigkey/diagnostic.hpp"

namespace bigkey {

namespace {

struct Parsed_Digits {
    std::u8string_view digits;
    int base;
    bool negative;
};

/// @brief Splits `str` into sign, base prefix, and digits.
/// @return `true` iff `str` is a non-empty decimal digit sequence
/// or a non-empty hexadecimal digit sequence prefixed with `0x`,
/// optionally preceded by `-`.
[[nodiscard]]
bool parse_integer_literal(std::u8string_view str, Parsed_Digits& out)
{
    out.negative = str.starts_with(u8'-');
    if (out.negative) {
        str.remove_prefix(1);
    }
    if (str.starts_with(u8"0x")) {
        str.remove_prefix(2);
        out.base = 16;
        out.digits = str;
        return !str.empty()
            && ascii::length_if(str, [](char8_t c) { return is_ascii_hex_digit(c); })
            == str.size();
    }
    out.base = 10;
    out.digits = str;
    return !str.empty()
        && ascii::length_if(str, [](char8_t c) { return is_ascii_digit(c); }) == str.size();
}

} // namespace

Result<void, Big_Int_Error>
Big_Int_Registry::set_implementation(const Big_Int_Backend& backend, const bool replace)
{
    if (replace) {
        const Big_Int_Backend* const previous
            = m_backend.exchange(&backend, std::memory_order::acq_rel);
        if (previous == nullptr) {
            try_emit(
                Severity::info, diagnostic::registry_installed,
                u8"Installed big integer backend \"" + std::u8string(backend.get_name()) + u8"\"."
            );
        }
        else {
            try_emit(
                Severity::warning, diagnostic::registry_replaced,
                u8"Replaced big integer backend \"" + std::u8string(previous->get_name())
                    + u8"\" with \"" + std::u8string(backend.get_name()) + u8"\"."
            );
        }
        return {};
    }

    const Big_Int_Backend* expected = nullptr;
    if (!m_backend.compare_exchange_strong(expected, &backend, std::memory_order::acq_rel)) {
        BIGKEY_DEBUG_ASSERT(expected != nullptr);
        try_emit(
            Severity::error, diagnostic::registry_already_set,
            u8"Cannot install big integer backend \"" + std::u8string(backend.get_name())
                + u8"\" because \"" + std::u8string(expected->get_name())
                + u8"\" is already installed. Request replacement to override it."
        );
        return Big_Int_Error::implementation_already_set;
    }
    try_emit(
        Severity::info, diagnostic::registry_installed,
        u8"Installed big integer backend \"" + std::u8string(backend.get_name()) + u8"\"."
    );
    return {};
}

Big_Int Big_Int_Registry::make(const Int64 x) const
{
    return Big_Int { get_active_backend().make_i64(x) };
}

Result<Big_Int, Big_Int_Error> Big_Int_Registry::make(const std::u8string_view digits) const
{
    const Big_Int_Backend& backend = get_active_backend();
    Parsed_Digits parsed {};
    if (!parse_integer_literal(digits, parsed)) {
        try_emit(
            Severity::debug, diagnostic::input_invalid,
            digits.empty()
                ? std::u8string(u8"Cannot create an integer from empty input.")
                : u8"Cannot create an integer from \"" + std::u8string(digits)
                    + u8"\", which is neither a decimal nor a 0x-prefixed hexadecimal number."
        );
        return Big_Int_Error::invalid_input;
    }
    const std::string_view ascii_digits = as_string_view(parsed.digits);
    return Big_Int { backend.make_digits(ascii_digits, parsed.base, parsed.negative) };
}

Result<Big_Int, Big_Int_Error> Big_Int_Registry::make(const std::string_view digits) const
{
    return make(as_u8string_view(digits));
}

Big_Int Big_Int_Registry::make(const std::span<const Uint8> bytes, const Endian endian) const
{
    const Big_Int_Backend& backend = get_active_backend();
    if (endian == Endian::big) {
        return Big_Int { backend.make_bytes(bytes) };
    }
    const std::vector<Uint8> big_endian = decode_magnitude(bytes, endian);
    return Big_Int { backend.make_bytes(big_endian) };
}

Big_Int_Registry& global_big_int_registry() noexcept
{
    static Big_Int_Registry registry { default_big_int_backend() };
    return registry;
}

} // namespace bigkey
