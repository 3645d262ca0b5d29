#ifndef BIGKEY_BIG_INT_IMPL_HPP
#define BIGKEY_BIG_INT_IMPL_HPP

#include <cstddef>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

#include "bigkey/util/function_ref.hpp"

#include "bigkey/fwd.hpp"
#include "bigkey/settings.hpp"

namespace bigkey {

template <typename T>
struct Conversion_Result {
    T value;
    /// @brief True if the conversions has an inexact result,
    /// such as a truncated result.
    bool lossy;

    friend bool operator==(const Conversion_Result&, const Conversion_Result&) = default;
};

/// @brief The value contract which every backend implements.
///
/// Operations taking another `Big_Int_Impl` require that operand to have been created by the
/// same backend as the receiver, i.e. `&y.get_backend() == &get_backend()`.
/// `Big_Int` establishes this by converting operands from other backends first,
/// so implementations may downcast operands to their own concrete type.
///
/// Preconditions stated on members are checked by `Big_Int`, not by implementations.
struct Big_Int_Impl {
    virtual ~Big_Int_Impl() = default;

    /// @brief Returns the backend which created this value.
    [[nodiscard]]
    virtual const Big_Int_Backend& get_backend() const noexcept
        = 0;

    /// @brief Returns a deep, independent copy of this value.
    [[nodiscard]]
    virtual std::unique_ptr<Big_Int_Impl> clone() const
        = 0;

    // ARITHMETIC ==================================================================================

    virtual void iadd(const Big_Int_Impl& y) = 0;
    virtual void isub(const Big_Int_Impl& y) = 0;
    virtual void imul(const Big_Int_Impl& y) = 0;

    /// @brief Divides by `y`, rounding towards zero.
    /// `y` shall not be zero.
    virtual void idiv(const Big_Int_Impl& y) = 0;

    /// @brief Replaces this value with the Euclidean remainder of the division by `y`,
    /// which lies in `[0, abs(y))`.
    /// `y` shall not be zero.
    virtual void imod(const Big_Int_Impl& y) = 0;

    virtual void iinc() = 0;
    virtual void idec() = 0;
    virtual void inegate() = 0;
    virtual void iabs() = 0;

    /// @brief Multiplies by `pow(2, s)`.
    virtual void ileft_shift(Uint64 s) = 0;

    /// @brief Divides by `pow(2, s)`, rounding towards negative infinity.
    /// Shifting by at least `bit_length()` yields zero for non-negative values
    /// and `-1` for negative values.
    virtual void iright_shift(Uint64 s) = 0;

    // BITWISE =====================================================================================
    // Negative values are treated as two's complement with infinitely many leading one-bits.

    virtual void ibit_xor(const Big_Int_Impl& y) = 0;
    virtual void ibit_and(const Big_Int_Impl& y) = 0;
    virtual void ibit_or(const Big_Int_Impl& y) = 0;

    // MODULAR =====================================================================================

    /// @brief Replaces this value with `pow(*this, e) mod n`.
    /// `n` shall be positive and `e` shall not be negative.
    /// The result lies in `[0, n)`; in particular, `pow(x, 0) mod 1` is zero.
    virtual void imod_exp(const Big_Int_Impl& e, const Big_Int_Impl& n) = 0;

    /// @brief Replaces this value with its inverse modulo `n`, in `[0, n)`.
    /// `n` shall be positive.
    /// @return `false` if no inverse exists, in which case this value is unmodified.
    [[nodiscard]]
    virtual bool imod_inv(const Big_Int_Impl& n)
        = 0;

    /// @brief Replaces this value with the non-negative greatest common divisor of
    /// this value and `y`.
    virtual void igcd(const Big_Int_Impl& y) = 0;

    // QUERIES =====================================================================================

    /// @brief Returns `0` if `*this == y`, a negative value if `*this < y`,
    /// and a positive value otherwise.
    [[nodiscard]]
    virtual int compare(const Big_Int_Impl& y) const
        = 0;

    /// @brief Equivalent to `(*this > 0) - (*this < 0)`.
    [[nodiscard]]
    virtual int get_signum() const noexcept
        = 0;

    [[nodiscard]]
    virtual bool is_one() const noexcept
        = 0;

    [[nodiscard]]
    virtual bool is_even() const noexcept
        = 0;

    /// @brief Returns the position of the highest set bit of the magnitude plus one,
    /// or zero if this value is zero.
    [[nodiscard]]
    virtual std::size_t bit_length() const noexcept
        = 0;

    /// @brief Returns bit `i` of the two's complement representation of this value.
    [[nodiscard]]
    virtual bool get_bit(std::size_t i) const
        = 0;

    [[nodiscard]]
    virtual Conversion_Result<Int64> as_i64() const noexcept
        = 0;

    /// @brief Prints the digits of this value in the given base, preceded by `-` if negative.
    /// `base` shall be in `[2, 36]`.
    virtual void print_to(Function_Ref<void(std::string_view)> out, int base, bool to_upper) const
        = 0;

    /// @brief Returns the minimal big-endian encoding of the magnitude of this value.
    /// The encoding of zero is empty.
    [[nodiscard]]
    virtual std::vector<Uint8> magnitude_bytes() const
        = 0;
};

/// @brief A factory for values of one concrete `Big_Int_Impl` type.
/// Backends are stateless and live for the duration of the program.
struct Big_Int_Backend {
    [[nodiscard]]
    virtual std::u8string_view get_name() const noexcept
        = 0;

    [[nodiscard]]
    virtual std::unique_ptr<Big_Int_Impl> make_i64(Int64 x) const
        = 0;

    /// @brief Creates a value from a non-empty digit sequence without sign or prefix,
    /// optionally negated.
    /// Every character in `digits` shall be a valid digit in the given `base`,
    /// which shall be in `[2, 36]`.
    [[nodiscard]]
    virtual std::unique_ptr<Big_Int_Impl>
    make_digits(std::string_view digits, int base, bool negative) const
        = 0;

    /// @brief Creates a non-negative value from the given big-endian magnitude.
    /// Leading zeros are permitted, and an empty sequence yields zero.
    [[nodiscard]]
    virtual std::unique_ptr<Big_Int_Impl> make_bytes(std::span<const Uint8> big_endian) const
        = 0;
};

} // namespace bigkey

#endif
