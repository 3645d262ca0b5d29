#ifndef BIGKEY_RESULT_HPP
#define BIGKEY_RESULT_HPP

#include <optional>
#include <utility>
#include <variant>

#include "bigkey/util/assert.hpp"

#include "bigkey/fwd.hpp"

namespace bigkey {

/// @brief Either a value of type `T` or an error of type `E`.
/// Both are implicitly convertible to `Result`, so a function returning `Result<T, E>`
/// can simply `return value;` or `return error;`.
template <typename T, typename E>
struct [[nodiscard]] Result {
private:
    std::variant<T, E> m_data;

public:
    [[nodiscard]]
    constexpr Result(const T& value)
        : m_data { std::in_place_index<0>, value }
    {
    }

    [[nodiscard]]
    constexpr Result(T&& value)
        : m_data { std::in_place_index<0>, std::move(value) }
    {
    }

    [[nodiscard]]
    constexpr Result(const E& error)
        : m_data { std::in_place_index<1>, error }
    {
    }

    [[nodiscard]]
    constexpr bool has_value() const noexcept
    {
        return m_data.index() == 0;
    }

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return has_value();
    }

    [[nodiscard]]
    constexpr T& value() &
    {
        BIGKEY_ASSERT(has_value());
        return *std::get_if<0>(&m_data);
    }

    [[nodiscard]]
    constexpr const T& value() const&
    {
        BIGKEY_ASSERT(has_value());
        return *std::get_if<0>(&m_data);
    }

    [[nodiscard]]
    constexpr T&& value() &&
    {
        BIGKEY_ASSERT(has_value());
        return std::move(*std::get_if<0>(&m_data));
    }

    [[nodiscard]]
    constexpr E error() const
    {
        BIGKEY_ASSERT(!has_value());
        return *std::get_if<1>(&m_data);
    }

    [[nodiscard]]
    constexpr T& operator*() &
    {
        return value();
    }

    [[nodiscard]]
    constexpr const T& operator*() const&
    {
        return value();
    }

    [[nodiscard]]
    constexpr T&& operator*() &&
    {
        return std::move(*this).value();
    }

    [[nodiscard]]
    constexpr T* operator->()
    {
        return &value();
    }

    [[nodiscard]]
    constexpr const T* operator->() const
    {
        return &value();
    }
};

/// @brief Either success or an error of type `E`.
/// A default-constructed `Result<void, E>` represents success.
template <typename E>
struct [[nodiscard]] Result<void, E> {
private:
    std::optional<E> m_error;

public:
    [[nodiscard]]
    constexpr Result() noexcept
        = default;

    [[nodiscard]]
    constexpr Result(const E& error)
        : m_error { error }
    {
    }

    [[nodiscard]]
    constexpr bool has_value() const noexcept
    {
        return !m_error.has_value();
    }

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return has_value();
    }

    [[nodiscard]]
    constexpr E error() const
    {
        BIGKEY_ASSERT(m_error.has_value());
        return *m_error;
    }
};

} // namespace bigkey

#endif
