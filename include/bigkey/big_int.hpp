#ifndef BIGKEY_BIG_INT_HPP
#define BIGKEY_BIG_INT_HPP

#include <compare>
#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "bigkey/util/assert.hpp"
#include "bigkey/util/function_ref.hpp"
#include "bigkey/util/result.hpp"

#include "bigkey/big_int_error.hpp"
#include "bigkey/big_int_impl.hpp"
#include "bigkey/byte_codec.hpp"
#include "bigkey/fwd.hpp"
#include "bigkey/settings.hpp"

namespace bigkey {

/// @brief An arbitrary precision signed integer.
///
/// A `Big_Int` exclusively owns a value of some backend (see `Big_Int_Impl`).
/// Copying a `Big_Int` copies that value deeply, so no two `Big_Int` objects share storage.
/// `Big_Int`s are created through a `Big_Int_Registry`,
/// which determines the backend of the created value.
///
/// Every operation exists in two forms:
/// an in-place form (prefixed with `i`) which modifies `*this`,
/// and a pure form which leaves `*this` unmodified and returns the result,
/// as if by copying `*this` and applying the in-place form to the copy.
///
/// Operands may stem from a backend other than that of `*this`.
/// Such operands are converted into the backend of `*this` beforehand,
/// so the result of any operation has the backend of `*this`.
///
/// A moved-from `Big_Int` may only be assigned to or destroyed.
struct Big_Int {
private:
    std::unique_ptr<Big_Int_Impl> m_impl;

public:
    /// @brief Takes ownership of the given backend value, which shall not be null.
    [[nodiscard]]
    explicit Big_Int(std::unique_ptr<Big_Int_Impl> impl) noexcept
        : m_impl { std::move(impl) }
    {
        BIGKEY_ASSERT(m_impl);
    }

    [[nodiscard]]
    Big_Int(const Big_Int& other)
        : m_impl { other.get_impl().clone() }
    {
    }

    [[nodiscard]]
    Big_Int(Big_Int&& other) noexcept
        = default;

    /// @brief Copy assignment operator.
    /// Safe for self-copy-assignment.
    Big_Int& operator=(const Big_Int& other)
    {
        if (this != &other) {
            m_impl = other.get_impl().clone();
        }
        return *this;
    }

    Big_Int& operator=(Big_Int&& other) noexcept = default;

    ~Big_Int() = default;

    /// @brief Returns a deep copy of this value.
    [[nodiscard]]
    Big_Int clone() const
    {
        return *this;
    }

    /// @brief Returns the backend which this value belongs to.
    [[nodiscard]]
    const Big_Int_Backend& get_backend() const noexcept
    {
        return get_impl().get_backend();
    }

    [[nodiscard]]
    const Big_Int_Impl& get_impl() const noexcept
    {
        BIGKEY_ASSERT(m_impl);
        return *m_impl;
    }

    /// @brief Exchanges the value of this object with the given one.
    void swap(Big_Int& other) noexcept
    {
        m_impl.swap(other.m_impl);
    }

    /// @brief Equivalent to `x.swap(y)`.
    friend void swap(Big_Int& x, Big_Int& y) noexcept
    {
        x.swap(y);
    }

    // IN-PLACE ARITHMETIC =========================================================================

    Big_Int& iadd(const Big_Int& y);
    Big_Int& isub(const Big_Int& y);
    Big_Int& imul(const Big_Int& y);

    /// @brief Divides by `y`, rounding towards zero.
    /// @return `Big_Int_Error::division_by_zero` if `y` is zero,
    /// in which case `*this` is unmodified.
    Result<void, Big_Int_Error> idiv(const Big_Int& y);

    /// @brief Replaces `*this` with the Euclidean remainder of the division by `m`,
    /// which lies in `[0, abs(m))` regardless of the sign of `*this`.
    /// @return `Big_Int_Error::division_by_zero` if `m` is zero,
    /// in which case `*this` is unmodified.
    Result<void, Big_Int_Error> imod(const Big_Int& m);

    Big_Int& iinc();
    Big_Int& idec();
    Big_Int& inegate();
    Big_Int& iabs();

    /// @brief Multiplies by `pow(2, s)`.
    /// A negative `s` shifts to the right instead.
    Big_Int& ileft_shift(Int64 s);
    /// @brief Equivalent to `ileft_shift(s)`,
    /// where `s` shall be within the range of `Int64` unless it is negative.
    Big_Int& ileft_shift(const Big_Int& s);

    /// @brief Divides by `pow(2, s)`, rounding towards negative infinity.
    /// A negative `s` shifts to the left instead.
    Big_Int& iright_shift(Int64 s);
    /// @brief Equivalent to `iright_shift(s)`,
    /// where `s` shall be within the range of `Int64` unless it is positive.
    Big_Int& iright_shift(const Big_Int& s);

    // IN-PLACE BITWISE ============================================================================

    Big_Int& ibit_xor(const Big_Int& y);
    Big_Int& ibit_and(const Big_Int& y);
    Big_Int& ibit_or(const Big_Int& y);

    // IN-PLACE MODULAR ============================================================================

    /// @brief Replaces `*this` with `pow(*this, e) mod abs(n)`.
    /// A negative exponent raises the modular inverse of `*this` to `-e`.
    /// @return `Big_Int_Error::division_by_zero` if `n` is zero,
    /// or `Big_Int_Error::inverse_does_not_exist` if `e` is negative and `*this` has no inverse
    /// modulo `n`.
    /// On failure, `*this` is unmodified.
    Result<void, Big_Int_Error> imod_exp(const Big_Int& e, const Big_Int& n);

    /// @brief Replaces `*this` with `x` in `[0, abs(n))` such that `*this * x` is congruent to
    /// `1` modulo `n`.
    /// @return `Big_Int_Error::division_by_zero` if `n` is zero,
    /// or `Big_Int_Error::inverse_does_not_exist` if `*this` and `n` are not coprime.
    /// On failure, `*this` is unmodified.
    Result<void, Big_Int_Error> imod_inv(const Big_Int& n);

    /// @brief Replaces `*this` with the greatest common divisor of `*this` and `y`,
    /// which is never negative.
    Big_Int& igcd(const Big_Int& y);

    // PURE OPERATIONS =============================================================================

    [[nodiscard]]
    Big_Int add(const Big_Int& y) const
    {
        Big_Int result = *this;
        result.iadd(y);
        return result;
    }

    [[nodiscard]]
    Big_Int sub(const Big_Int& y) const
    {
        Big_Int result = *this;
        result.isub(y);
        return result;
    }

    [[nodiscard]]
    Big_Int mul(const Big_Int& y) const
    {
        Big_Int result = *this;
        result.imul(y);
        return result;
    }

    [[nodiscard]]
    Result<Big_Int, Big_Int_Error> div(const Big_Int& y) const;
    [[nodiscard]]
    Result<Big_Int, Big_Int_Error> mod(const Big_Int& m) const;

    [[nodiscard]]
    Big_Int inc() const
    {
        Big_Int result = *this;
        result.iinc();
        return result;
    }

    [[nodiscard]]
    Big_Int dec() const
    {
        Big_Int result = *this;
        result.idec();
        return result;
    }

    [[nodiscard]]
    Big_Int negate() const
    {
        Big_Int result = *this;
        result.inegate();
        return result;
    }

    [[nodiscard]]
    Big_Int abs() const
    {
        Big_Int result = *this;
        result.iabs();
        return result;
    }

    [[nodiscard]]
    Big_Int left_shift(const Int64 s) const
    {
        Big_Int result = *this;
        result.ileft_shift(s);
        return result;
    }

    [[nodiscard]]
    Big_Int left_shift(const Big_Int& s) const
    {
        Big_Int result = *this;
        result.ileft_shift(s);
        return result;
    }

    [[nodiscard]]
    Big_Int right_shift(const Int64 s) const
    {
        Big_Int result = *this;
        result.iright_shift(s);
        return result;
    }

    [[nodiscard]]
    Big_Int right_shift(const Big_Int& s) const
    {
        Big_Int result = *this;
        result.iright_shift(s);
        return result;
    }

    [[nodiscard]]
    Big_Int bit_xor(const Big_Int& y) const
    {
        Big_Int result = *this;
        result.ibit_xor(y);
        return result;
    }

    [[nodiscard]]
    Big_Int bit_and(const Big_Int& y) const
    {
        Big_Int result = *this;
        result.ibit_and(y);
        return result;
    }

    [[nodiscard]]
    Big_Int bit_or(const Big_Int& y) const
    {
        Big_Int result = *this;
        result.ibit_or(y);
        return result;
    }

    [[nodiscard]]
    Result<Big_Int, Big_Int_Error> mod_exp(const Big_Int& e, const Big_Int& n) const;
    [[nodiscard]]
    Result<Big_Int, Big_Int_Error> mod_inv(const Big_Int& n) const;

    [[nodiscard]]
    Big_Int gcd(const Big_Int& y) const
    {
        Big_Int result = *this;
        result.igcd(y);
        return result;
    }

    // COMPARISONS AND PREDICATES ==================================================================

    [[nodiscard]]
    std::strong_ordering compare(const Big_Int& y) const;
    [[nodiscard]]
    std::strong_ordering compare(Int64 y) const;

    [[nodiscard]]
    bool equal(const Big_Int& y) const
    {
        return compare(y) == 0;
    }

    [[nodiscard]]
    bool lt(const Big_Int& y) const
    {
        return compare(y) < 0;
    }

    [[nodiscard]]
    bool lte(const Big_Int& y) const
    {
        return compare(y) <= 0;
    }

    [[nodiscard]]
    bool gt(const Big_Int& y) const
    {
        return compare(y) > 0;
    }

    [[nodiscard]]
    bool gte(const Big_Int& y) const
    {
        return compare(y) >= 0;
    }

    /// @brief Equivalent to `(*this > 0) - (*this < 0)`.
    [[nodiscard]]
    int get_signum() const noexcept
    {
        return get_impl().get_signum();
    }

    [[nodiscard]]
    bool is_zero() const noexcept
    {
        return get_signum() == 0;
    }

    [[nodiscard]]
    bool is_negative() const noexcept
    {
        return get_signum() < 0;
    }

    [[nodiscard]]
    bool is_one() const noexcept
    {
        return get_impl().is_one();
    }

    [[nodiscard]]
    bool is_even() const noexcept
    {
        return get_impl().is_even();
    }

    // INTROSPECTION ===============================================================================

    /// @brief Returns the position of the highest set bit of the magnitude plus one.
    /// For zero, returns zero.
    [[nodiscard]]
    std::size_t bit_length() const noexcept
    {
        return get_impl().bit_length();
    }

    /// @brief Returns the amount of bytes in the minimal encoding of the magnitude,
    /// i.e. `ceil(bit_length() / 8)`.
    [[nodiscard]]
    std::size_t byte_length() const noexcept
    {
        return byte_length_for_bits(bit_length());
    }

    /// @brief Returns bit `i` of this value as `0` or `1`.
    /// Negative values are treated as two's complement with infinitely many leading one-bits,
    /// so `get_bit(i)` equals `right_shift(i).bit_and(1)` for all values.
    [[nodiscard]]
    int get_bit(const std::size_t i) const
    {
        return get_impl().get_bit(i) ? 1 : 0;
    }

    // CONVERSIONS =================================================================================

    /// @brief Returns the value as `Int64`,
    /// or `Big_Int_Error::precision_loss` if it is not representable as such.
    [[nodiscard]]
    Result<Int64, Big_Int_Error> to_number() const
    {
        const auto [value, lossy] = as_i64();
        if (lossy) {
            return Big_Int_Error::precision_loss;
        }
        return value;
    }

    /// @brief Returns the value truncated to 64 bits (two's complement),
    /// and whether that truncation lost information.
    [[nodiscard]]
    Conversion_Result<Int64> as_i64() const noexcept
    {
        return get_impl().as_i64();
    }

    /// @brief Returns the magnitude of this value as bytes in the given order.
    /// @param length If present, the exact amount of bytes in the result.
    /// Zero bytes are added at the high-order end of the minimal encoding.
    /// @return The bytes, or `Big_Int_Error::precision_loss` if `length` is less than
    /// `byte_length()`.
    [[nodiscard]]
    Result<std::vector<Uint8>, Big_Int_Error>
    to_bytes(const Endian endian = Endian::big, const std::optional<std::size_t> length = {}) const
    {
        return encode_magnitude(get_impl().magnitude_bytes(), endian, length);
    }

    /// @brief Prints the digits representing this integer.
    /// @param base The base of the digits.
    /// Shall be in [2, 36].
    /// @param to_upper If `true`, outputs digits for base 11 or more in uppercase.
    void print_to(
        Function_Ref<void(std::string_view)> out, //
        const int base = 10,
        const bool to_upper = false
    ) const
    {
        BIGKEY_ASSERT(base >= 2 && base <= 36);
        get_impl().print_to(out, base, to_upper);
    }

    // OPERATORS ===================================================================================

    [[nodiscard]]
    Big_Int operator-() const
    {
        return negate();
    }

    [[nodiscard]]
    friend Big_Int operator+(const Big_Int& x, const Big_Int& y)
    {
        return x.add(y);
    }

    [[nodiscard]]
    friend Big_Int operator-(const Big_Int& x, const Big_Int& y)
    {
        return x.sub(y);
    }

    [[nodiscard]]
    friend Big_Int operator*(const Big_Int& x, const Big_Int& y)
    {
        return x.mul(y);
    }

    Big_Int& operator+=(const Big_Int& y)
    {
        return iadd(y);
    }

    Big_Int& operator-=(const Big_Int& y)
    {
        return isub(y);
    }

    Big_Int& operator*=(const Big_Int& y)
    {
        return imul(y);
    }

    Big_Int& operator++()
    {
        return iinc();
    }

    Big_Int& operator--()
    {
        return idec();
    }

    [[nodiscard]]
    friend bool operator==(const Big_Int& x, const Big_Int& y)
    {
        return x.compare(y) == 0;
    }

    [[nodiscard]]
    friend std::strong_ordering operator<=>(const Big_Int& x, const Big_Int& y)
    {
        return x.compare(y);
    }

    [[nodiscard]]
    friend bool operator==(const Big_Int& x, const Int64 y)
    {
        return x.compare(y) == 0;
    }

    [[nodiscard]]
    friend std::strong_ordering operator<=>(const Big_Int& x, const Int64 y)
    {
        return x.compare(y);
    }

private:
    [[nodiscard]]
    Big_Int_Impl& get_mutable_impl() noexcept
    {
        BIGKEY_ASSERT(m_impl);
        return *m_impl;
    }

    /// @brief Returns the backend value of `y` if it belongs to the backend of `*this`.
    /// Otherwise, converts `y` into that backend, stores it in `storage`,
    /// and returns a reference to the stored value.
    [[nodiscard]]
    const Big_Int_Impl& operand(const Big_Int& y, std::unique_ptr<Big_Int_Impl>& storage) const;
};

} // namespace bigkey

#endif
