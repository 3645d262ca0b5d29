#ifndef BIGKEY_BIG_INT_REGISTRY_HPP
#define BIGKEY_BIG_INT_REGISTRY_HPP

#include <atomic>
#include <span>
#include <string_view>

#include "bigkey/util/assert.hpp"
#include "bigkey/util/result.hpp"

#include "bigkey/big_int.hpp"
#include "bigkey/big_int_error.hpp"
#include "bigkey/big_int_impl.hpp"
#include "bigkey/byte_codec.hpp"
#include "bigkey/diagnostic.hpp"
#include "bigkey/fwd.hpp"
#include "bigkey/services.hpp"
#include "bigkey/settings.hpp"

namespace bigkey {

/// @brief Holds the backend which services the construction of `Big_Int`s.
///
/// A registry is the only sanctioned way of creating integers:
/// all `make` overloads forward to the active backend.
/// Once created, integers carry their own backend,
/// so installing another backend does not affect existing values.
///
/// Installing a backend is atomic,
/// but callers are responsible for ordering installation before any construction that is
/// expected to observe the new backend.
struct Big_Int_Registry {
private:
    std::atomic<const Big_Int_Backend*> m_backend;
    Logger& m_logger;

public:
    /// @brief Creates a registry without a backend.
    /// `set_implementation` shall be called before any integer is made.
    [[nodiscard]]
    explicit Big_Int_Registry(Logger& logger = ignorant_logger) noexcept
        : m_backend { nullptr }
        , m_logger { logger }
    {
    }

    /// @brief Creates a registry with the given backend already installed.
    [[nodiscard]]
    explicit Big_Int_Registry(const Big_Int_Backend& backend, Logger& logger = ignorant_logger)
        noexcept
        : m_backend { &backend }
        , m_logger { logger }
    {
    }

    Big_Int_Registry(const Big_Int_Registry&) = delete;
    Big_Int_Registry& operator=(const Big_Int_Registry&) = delete;

    /// @brief Installs `backend` as the active backend.
    /// @param replace If `true`, an already installed backend is replaced.
    /// @return `Big_Int_Error::implementation_already_set` if a backend is installed and
    /// `replace` is `false`, in which case the active backend is unchanged.
    Result<void, Big_Int_Error>
    set_implementation(const Big_Int_Backend& backend, bool replace = false);

    /// @brief Returns the active backend, or null if none has been installed.
    [[nodiscard]]
    const Big_Int_Backend* get_implementation() const noexcept
    {
        return m_backend.load(std::memory_order::acquire);
    }

    [[nodiscard]]
    bool has_implementation() const noexcept
    {
        return get_implementation() != nullptr;
    }

    [[nodiscard]]
    Logger& get_logger() noexcept
    {
        return m_logger;
    }

    /// @brief Creates an integer with the given value.
    [[nodiscard]]
    Big_Int make(Int64 x) const;

    /// @brief Creates an integer from a decimal digit sequence such as `"-123"`,
    /// or from a hexadecimal digit sequence prefixed with `0x` such as `"0xff"` or `"-0xFF"`.
    /// @return The integer, or `Big_Int_Error::invalid_input` if `digits` is empty
    /// or not of the form above.
    [[nodiscard]]
    Result<Big_Int, Big_Int_Error> make(std::string_view digits) const;

    /// @brief Equivalent to `make(as_string_view(digits))`.
    [[nodiscard]]
    Result<Big_Int, Big_Int_Error> make(std::u8string_view digits) const;

    /// @brief Creates a non-negative integer from an unsigned magnitude in the given byte order.
    /// Leading zero bytes are permitted, and an empty sequence yields zero.
    [[nodiscard]]
    Big_Int make(std::span<const Uint8> bytes, Endian endian = Endian::big) const;

private:
    [[nodiscard]]
    const Big_Int_Backend& get_active_backend() const noexcept
    {
        const Big_Int_Backend* const result = get_implementation();
        BIGKEY_ASSERT(result);
        return *result;
    }

    void try_emit(Severity severity, std::u8string_view id, std::u8string_view message) const
    {
        if (m_logger.can_log(severity)) {
            m_logger({ severity, id, message });
        }
    }
};

/// @brief Returns the process-wide registry,
/// initialized upon first use with `default_big_int_backend()`.
[[nodiscard]]
Big_Int_Registry& global_big_int_registry() noexcept;

} // namespace bigkey

#endif
