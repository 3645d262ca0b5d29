#include <algorithm>
#include <bit>
#include <charconv>
#include <cstddef>
#include <ios>
#include <iterator>
#include <limits>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

#include "bigkey/util/assert.hpp"
#include "bigkey/util/chars.hpp"
#include "bigkey/util/function_ref.hpp"

#include "bigkey/big_int_backends.hpp"
#include "bigkey/big_int_impl.hpp"
#include "bigkey/byte_codec.hpp"
#include "bigkey/settings.hpp"

namespace bigkey {

using boost::multiprecision::cpp_int;

namespace {

struct Boost_Big_Int_Backend final : Big_Int_Backend {
    [[nodiscard]]
    std::u8string_view get_name() const noexcept final
    {
        return u8"boost";
    }

    [[nodiscard]]
    std::unique_ptr<Big_Int_Impl> make_i64(Int64 x) const final;

    [[nodiscard]]
    std::unique_ptr<Big_Int_Impl>
    make_digits(std::string_view digits, int base, bool negative) const final;

    [[nodiscard]]
    std::unique_ptr<Big_Int_Impl> make_bytes(std::span<const Uint8> big_endian) const final;
};

const Boost_Big_Int_Backend boost_backend {};


/// @brief Returns `abs(x)`.
/// Boost does not support bit queries such as `msb` on negative values.
[[nodiscard]]
cpp_int magnitude_of(const cpp_int& x)
{
    return x.sign() < 0 ? cpp_int { -x } : x;
}

// LIMB ACCESS =====================================================================================
// cpp_int stores a sign and a magnitude.
// Its limbs are those of the magnitude, least significant first.

using boost::multiprecision::limb_type;

inline constexpr std::size_t limb_bits = std::numeric_limits<limb_type>::digits;

/// @brief Returns the number of significant bits in the magnitude of `x`.
[[nodiscard]]
std::size_t magnitude_bit_length(const cpp_int& x) noexcept
{
    const auto& backend = x.backend();
    const std::size_t size = backend.size();
    const limb_type top = backend.limbs()[size - 1];
    return (size - 1) * limb_bits + std::size_t(std::bit_width(top));
}

/// @brief Returns the magnitude of `x` modulo `pow(2, 64)`.
[[nodiscard]]
Uint64 low_magnitude_bits(const cpp_int& x) noexcept
{
    const auto& backend = x.backend();
    Uint64 result = 0;
    for (std::size_t i = 0; i < backend.size() && i * limb_bits < 64; ++i) {
        result |= Uint64(backend.limbs()[i]) << (i * limb_bits);
    }
    return result;
}

// NUMBER THEORY ===================================================================================

/// @brief Returns `x` mod `m` in `[0, abs(m))`.
[[nodiscard]]
cpp_int euclidean_mod(const cpp_int& x, const cpp_int& m)
{
    BIGKEY_ASSERT(!m.is_zero());
    cpp_int result = x % m;
    if (result.sign() < 0) {
        result += magnitude_of(m);
    }
    return result;
}

/// @brief Binary (Stein's) greatest common divisor.
/// The result is never negative, and `binary_gcd(0, 0)` is zero.
[[nodiscard]]
cpp_int binary_gcd(const cpp_int& x, const cpp_int& y)
{
    cpp_int a = magnitude_of(x);
    cpp_int b = magnitude_of(y);
    if (a.is_zero()) {
        return b;
    }
    if (b.is_zero()) {
        return a;
    }
    const auto a_zeros = lsb(a);
    const auto b_zeros = lsb(b);
    const auto common_zeros = std::min(a_zeros, b_zeros);
    a >>= a_zeros;
    do {
        b >>= lsb(b);
        if (a > b) {
            a.swap(b);
        }
        b -= a;
    } while (!b.is_zero());
    a <<= common_zeros;
    return a;
}

/// @brief Returns the inverse of `a` modulo `n`, computed with the extended Euclidean algorithm.
/// `a` shall be in `[0, n)` and coprime to `n`.
[[nodiscard]]
cpp_int extended_euclid_inverse(const cpp_int& a, const cpp_int& n)
{
    cpp_int old_r = a;
    cpp_int r = n;
    cpp_int old_s = 1;
    cpp_int s = 0;
    cpp_int quotient;
    cpp_int remainder;
    while (!r.is_zero()) {
        divide_qr(old_r, r, quotient, remainder);
        old_r = std::exchange(r, std::move(remainder));
        cpp_int next_s = old_s - quotient * s;
        old_s = std::exchange(s, std::move(next_s));
    }
    BIGKEY_ASSERT(old_r == 1);
    return euclidean_mod(old_s, n);
}

/// @brief Montgomery arithmetic modulo an odd `n`, with `R = pow(2, shift)` and `R > n`.
struct Montgomery_Context {
    const cpp_int& modulus;
    unsigned shift;
    cpp_int mask;
    /// @brief `-pow(n, -1) mod R`.
    cpp_int inverse;

    [[nodiscard]]
    explicit Montgomery_Context(const cpp_int& n)
        : modulus { n }
        , shift { unsigned(msb(n)) + 1 }
        , mask { (cpp_int { 1 } << shift) - 1 }
    {
        BIGKEY_ASSERT(n.sign() > 0 && bit_test(n, 0));
        // Newton's iteration doubles the amount of correct low bits of n^-1 each step.
        // Since n is odd, 1 is the inverse of n modulo 2.
        const cpp_int r = mask + 1;
        cpp_int x = 1;
        for (unsigned correct_bits = 1; correct_bits < shift; correct_bits *= 2) {
            const cpp_int correction = (r + 2 - ((n * x) & mask)) & mask;
            x = (x * correction) & mask;
        }
        inverse = (r - x) & mask;
    }

    /// @brief Returns `t * pow(R, -1) mod n` for `t` in `[0, n * R)`.
    [[nodiscard]]
    cpp_int reduce(const cpp_int& t) const
    {
        const cpp_int m = ((t & mask) * inverse) & mask;
        cpp_int u = (t + m * modulus) >> shift;
        if (u >= modulus) {
            u -= modulus;
        }
        return u;
    }

    [[nodiscard]]
    cpp_int multiply(const cpp_int& x, const cpp_int& y) const
    {
        return reduce(x * y);
    }

    [[nodiscard]]
    cpp_int to_montgomery(const cpp_int& x) const
    {
        return (x << shift) % modulus;
    }
};

/// @brief Left-to-right square-and-multiply.
/// `x` shall be in `[0, n)`, `e` shall not be negative, and `n` shall be greater than one.
template <typename Multiply>
[[nodiscard]]
cpp_int square_and_multiply(cpp_int result, const cpp_int& x, const cpp_int& e, Multiply multiply)
{
    if (e.is_zero()) {
        return result;
    }
    for (auto i = msb(e) + 1; i-- > 0;) {
        result = multiply(result, result);
        if (bit_test(e, i)) {
            result = multiply(result, x);
        }
    }
    return result;
}

/// @brief Returns `pow(x, e) mod n`.
/// `e` shall not be negative, and `n` shall be positive.
[[nodiscard]]
cpp_int mod_pow(const cpp_int& x, const cpp_int& e, const cpp_int& n)
{
    BIGKEY_ASSERT(e.sign() >= 0);
    BIGKEY_ASSERT(n.sign() > 0);
    if (n == 1) {
        return 0;
    }
    const cpp_int base = euclidean_mod(x, n);
    if (bit_test(n, 0)) {
        const Montgomery_Context context { n };
        const cpp_int one = context.to_montgomery(1);
        const cpp_int result = square_and_multiply(
            one, context.to_montgomery(base), e,
            [&](const cpp_int& a, const cpp_int& b) { return context.multiply(a, b); }
        );
        return context.reduce(result);
    }
    return square_and_multiply(cpp_int { 1 }, base, e, [&](const cpp_int& a, const cpp_int& b) {
        return cpp_int { (a * b) % n };
    });
}

// STRING CONVERSION ===============================================================================

void append_digits(std::string& out, const cpp_int& x, const int base)
{
    BIGKEY_ASSERT(x.sign() > 0);
    switch (base) {
    case 2: {
        const auto limit = int(msb(x));
        out.reserve(out.size() + std::size_t(limit) + 1);
        for (int b = limit; b >= 0; --b) {
            out += bit_test(x, unsigned(b)) ? '1' : '0';
        }
        break;
    }
    case 10: {
        out += x.str();
        break;
    }
    case 8:
    case 16: {
        const auto flags = base == 16 ? std::ios_base::hex : std::ios_base::oct;
        out += x.str(0, flags);
        break;
    }
    default: {
        const std::size_t start = out.size();
        cpp_int quotient;
        cpp_int remainder;
        cpp_int temp = x;
        const cpp_int cpp_base { base };
        while (!temp.is_zero()) {
            divide_qr(temp, cpp_base, quotient, remainder);
            temp = quotient;
            char buffer[2] {};
            const auto int_remainder = remainder.convert_to<int>();
            const auto [p, ec] = std::to_chars(buffer, std::end(buffer), int_remainder, base);
            BIGKEY_ASSERT(ec == std::errc {});
            out += std::string_view { buffer, p };
        }
        std::reverse(out.begin() + std::ptrdiff_t(start), out.end());
        break;
    }
    }
}

[[nodiscard]]
int digit_value(const char c)
{
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'A' && c <= 'Z') {
        return c - 'A' + 10;
    }
    BIGKEY_ASSERT(c >= 'a' && c <= 'z');
    return c - 'a' + 10;
}

[[nodiscard]]
cpp_int parse_digits(std::string_view digits, const int base)
{
    if (base == 10) {
        // Boost interprets a leading zero as an octal prefix.
        const std::size_t first_significant = digits.find_first_not_of('0');
        if (first_significant == std::string_view::npos) {
            return 0;
        }
        digits.remove_prefix(first_significant);
        return cpp_int { std::string { digits } };
    }

    cpp_int result;
    const int pow_2_shift
        = std::has_single_bit(unsigned(base)) ? std::countr_zero(unsigned(base)) : 0;
    for (const char c : digits) {
        const int digit = digit_value(c);
        BIGKEY_ASSERT(digit < base);
        if (pow_2_shift) {
            result <<= pow_2_shift;
            result |= digit;
        }
        else {
            result *= base;
            result += digit;
        }
    }
    return result;
}

// VALUE ===========================================================================================

struct Boost_Big_Int final : Big_Int_Impl {
    cpp_int value;

    [[nodiscard]]
    explicit Boost_Big_Int(cpp_int v)
        : value { std::move(v) }
    {
    }

    [[nodiscard]]
    static const cpp_int& get(const Big_Int_Impl& x) noexcept
    {
        BIGKEY_DEBUG_ASSERT(&x.get_backend() == &boost_backend);
        return static_cast<const Boost_Big_Int&>(x).value;
    }

    [[nodiscard]]
    const Big_Int_Backend& get_backend() const noexcept final
    {
        return boost_backend;
    }

    [[nodiscard]]
    std::unique_ptr<Big_Int_Impl> clone() const final
    {
        return std::make_unique<Boost_Big_Int>(value);
    }

    void iadd(const Big_Int_Impl& y) final
    {
        value += get(y);
    }

    void isub(const Big_Int_Impl& y) final
    {
        value -= get(y);
    }

    void imul(const Big_Int_Impl& y) final
    {
        value *= get(y);
    }

    void idiv(const Big_Int_Impl& y) final
    {
        value /= get(y);
    }

    void imod(const Big_Int_Impl& y) final
    {
        value = euclidean_mod(value, get(y));
    }

    void iinc() final
    {
        ++value;
    }

    void idec() final
    {
        --value;
    }

    void inegate() final
    {
        value = -value;
    }

    void iabs() final
    {
        if (value.sign() < 0) {
            value = -value;
        }
    }

    void ileft_shift(const Uint64 s) final
    {
        if (!value.is_zero()) {
            value <<= s;
        }
    }

    void iright_shift(const Uint64 s) final
    {
        if (s >= bit_length()) {
            value = value.sign() < 0 ? -1 : 0;
            return;
        }
        if (value.sign() >= 0) {
            value >>= s;
            return;
        }
        // floor(x / 2^s) is -ceil(|x| / 2^s) for negative x.
        cpp_int magnitude = -value;
        --magnitude;
        magnitude >>= s;
        value = -magnitude - 1;
    }

    void ibit_xor(const Big_Int_Impl& y) final
    {
        value ^= get(y);
    }

    void ibit_and(const Big_Int_Impl& y) final
    {
        value &= get(y);
    }

    void ibit_or(const Big_Int_Impl& y) final
    {
        value |= get(y);
    }

    void imod_exp(const Big_Int_Impl& e, const Big_Int_Impl& n) final
    {
        value = mod_pow(value, get(e), get(n));
    }

    [[nodiscard]]
    bool imod_inv(const Big_Int_Impl& n) final
    {
        const cpp_int& modulus = get(n);
        BIGKEY_ASSERT(modulus.sign() > 0);
        const cpp_int normalized = euclidean_mod(value, modulus);
        if (binary_gcd(normalized, modulus) != 1) {
            return false;
        }
        value = extended_euclid_inverse(normalized, modulus);
        return true;
    }

    void igcd(const Big_Int_Impl& y) final
    {
        value = binary_gcd(value, get(y));
    }

    [[nodiscard]]
    int compare(const Big_Int_Impl& y) const final
    {
        return value.compare(get(y));
    }

    [[nodiscard]]
    int get_signum() const noexcept final
    {
        return value.sign();
    }

    [[nodiscard]]
    bool is_one() const noexcept final
    {
        return value == 1;
    }

    [[nodiscard]]
    bool is_even() const noexcept final
    {
        return (value.backend().limbs()[0] & 1) == 0;
    }

    [[nodiscard]]
    std::size_t bit_length() const noexcept final
    {
        return magnitude_bit_length(value);
    }

    [[nodiscard]]
    bool get_bit(const std::size_t i) const final
    {
        if (value.sign() >= 0) {
            return i < bit_length() && bit_test(value, unsigned(i));
        }
        // In two's complement, -x has the bits of x - 1, inverted.
        const cpp_int complement = -value - 1;
        if (complement.is_zero() || i > msb(complement)) {
            return true;
        }
        return !bit_test(complement, unsigned(i));
    }

    [[nodiscard]]
    Conversion_Result<Int64> as_i64() const noexcept final
    {
        constexpr auto min = std::numeric_limits<Int64>::min();
        constexpr auto max = std::numeric_limits<Int64>::max();
        if (value >= min && value <= max) {
            return { value.convert_to<Int64>(), false };
        }
        // Two's complement truncation of -m is the negation of m modulo pow(2, 64).
        const Uint64 low = low_magnitude_bits(value);
        return { Int64(value.sign() < 0 ? Uint64(0) - low : low), true };
    }

    void print_to(
        const Function_Ref<void(std::string_view)> out,
        const int base,
        const bool to_upper
    ) const final
    {
        BIGKEY_ASSERT(base >= 2 && base <= 36);
        const int sign = value.sign();
        if (sign == 0) {
            out("0");
            return;
        }
        std::string result;
        if (sign < 0) {
            // Boost does not print negative octal and hexadecimal numbers.
            result += '-';
            append_digits(result, magnitude_of(value), base);
        }
        else {
            append_digits(result, value, base);
        }
        if (base > 10 && to_upper) {
            for (char& c : result) {
                c = char(to_ascii_upper(char8_t(c)));
            }
        }
        out(result);
    }

    [[nodiscard]]
    std::vector<Uint8> magnitude_bytes() const final
    {
        std::vector<Uint8> result;
        if (value.is_zero()) {
            return result;
        }
        result.reserve(byte_length_for_bits(bit_length()));
        export_bits(magnitude_of(value), std::back_inserter(result), 8);
        return result;
    }
};

std::unique_ptr<Big_Int_Impl> Boost_Big_Int_Backend::make_i64(const Int64 x) const
{
    return std::make_unique<Boost_Big_Int>(cpp_int { x });
}

std::unique_ptr<Big_Int_Impl> Boost_Big_Int_Backend::make_digits(
    const std::string_view digits,
    const int base,
    const bool negative
) const
{
    BIGKEY_ASSERT(!digits.empty());
    BIGKEY_ASSERT(base >= 2 && base <= 36);
    cpp_int result = parse_digits(digits, base);
    if (negative) {
        result = -result;
    }
    return std::make_unique<Boost_Big_Int>(std::move(result));
}

std::unique_ptr<Big_Int_Impl>
Boost_Big_Int_Backend::make_bytes(const std::span<const Uint8> big_endian) const
{
    cpp_int result;
    if (!big_endian.empty()) {
        import_bits(result, big_endian.begin(), big_endian.end(), 8);
    }
    return std::make_unique<Boost_Big_Int>(std::move(result));
}

} // namespace

const Big_Int_Backend& boost_big_int_backend() noexcept
{
    return boost_backend;
}

} // namespace bigkey
