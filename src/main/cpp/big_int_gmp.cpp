#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gmp.h>
#include <gmpxx.h>

#include "bigkey/util/assert.hpp"
#include "bigkey/util/chars.hpp"
#include "bigkey/util/function_ref.hpp"

#include "bigkey/big_int_backends.hpp"
#include "bigkey/big_int_impl.hpp"
#include "bigkey/byte_codec.hpp"
#include "bigkey/settings.hpp"

namespace bigkey {

namespace {

static_assert(sizeof(long) == sizeof(Int64), "GMP's signed long conversions must cover Int64.");

// Arguments of mpz_import and mpz_export which describe a plain big-endian byte sequence.
constexpr int word_order_msb_first = 1;
constexpr std::size_t word_size = 1;
constexpr int word_endian_native = 0;
constexpr std::size_t nail_bits = 0;

struct Gmp_Big_Int_Backend final : Big_Int_Backend {
    [[nodiscard]]
    std::u8string_view get_name() const noexcept final
    {
        return u8"gmp";
    }

    [[nodiscard]]
    std::unique_ptr<Big_Int_Impl> make_i64(Int64 x) const final;

    [[nodiscard]]
    std::unique_ptr<Big_Int_Impl>
    make_digits(std::string_view digits, int base, bool negative) const final;

    [[nodiscard]]
    std::unique_ptr<Big_Int_Impl> make_bytes(std::span<const Uint8> big_endian) const final;
};

const Gmp_Big_Int_Backend gmp_backend {};

struct Gmp_Big_Int final : Big_Int_Impl {
    mpz_class value;

    [[nodiscard]]
    explicit Gmp_Big_Int(mpz_class v)
        : value { std::move(v) }
    {
    }

    [[nodiscard]]
    static const mpz_class& get(const Big_Int_Impl& x) noexcept
    {
        BIGKEY_DEBUG_ASSERT(&x.get_backend() == &gmp_backend);
        return static_cast<const Gmp_Big_Int&>(x).value;
    }

    [[nodiscard]]
    const Big_Int_Backend& get_backend() const noexcept final
    {
        return gmp_backend;
    }

    [[nodiscard]]
    std::unique_ptr<Big_Int_Impl> clone() const final
    {
        return std::make_unique<Gmp_Big_Int>(value);
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
        mpz_tdiv_q(value.get_mpz_t(), value.get_mpz_t(), get(y).get_mpz_t());
    }

    void imod(const Big_Int_Impl& y) final
    {
        // mpz_mod ignores the sign of the divisor and yields a non-negative result.
        mpz_mod(value.get_mpz_t(), value.get_mpz_t(), get(y).get_mpz_t());
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
        mpz_neg(value.get_mpz_t(), value.get_mpz_t());
    }

    void iabs() final
    {
        mpz_abs(value.get_mpz_t(), value.get_mpz_t());
    }

    void ileft_shift(const Uint64 s) final
    {
        if (value == 0) {
            return;
        }
        mpz_mul_2exp(value.get_mpz_t(), value.get_mpz_t(), mp_bitcnt_t(s));
    }

    void iright_shift(const Uint64 s) final
    {
        if (s >= bit_length()) {
            value = sgn(value) < 0 ? -1 : 0;
            return;
        }
        mpz_fdiv_q_2exp(value.get_mpz_t(), value.get_mpz_t(), mp_bitcnt_t(s));
    }

    void ibit_xor(const Big_Int_Impl& y) final
    {
        mpz_xor(value.get_mpz_t(), value.get_mpz_t(), get(y).get_mpz_t());
    }

    void ibit_and(const Big_Int_Impl& y) final
    {
        mpz_and(value.get_mpz_t(), value.get_mpz_t(), get(y).get_mpz_t());
    }

    void ibit_or(const Big_Int_Impl& y) final
    {
        mpz_ior(value.get_mpz_t(), value.get_mpz_t(), get(y).get_mpz_t());
    }

    void imod_exp(const Big_Int_Impl& e, const Big_Int_Impl& n) final
    {
        const mpz_class& exponent = get(e);
        const mpz_class& modulus = get(n);
        BIGKEY_ASSERT(sgn(exponent) >= 0);
        BIGKEY_ASSERT(sgn(modulus) > 0);
        if (modulus == 1) {
            value = 0;
            return;
        }
        mpz_class result;
        mpz_powm(result.get_mpz_t(), value.get_mpz_t(), exponent.get_mpz_t(), modulus.get_mpz_t());
        value = std::move(result);
    }

    [[nodiscard]]
    bool imod_inv(const Big_Int_Impl& n) final
    {
        const mpz_class& modulus = get(n);
        BIGKEY_ASSERT(sgn(modulus) > 0);
        mpz_class normalized;
        mpz_mod(normalized.get_mpz_t(), value.get_mpz_t(), modulus.get_mpz_t());

        mpz_class divisor;
        mpz_gcd(divisor.get_mpz_t(), normalized.get_mpz_t(), modulus.get_mpz_t());
        if (divisor != 1) {
            return false;
        }
        if (modulus == 1) {
            value = 0;
            return true;
        }
        mpz_class result;
        const int invertible
            = mpz_invert(result.get_mpz_t(), normalized.get_mpz_t(), modulus.get_mpz_t());
        BIGKEY_ASSERT(invertible != 0);
        value = std::move(result);
        return true;
    }

    void igcd(const Big_Int_Impl& y) final
    {
        mpz_gcd(value.get_mpz_t(), value.get_mpz_t(), get(y).get_mpz_t());
    }

    [[nodiscard]]
    int compare(const Big_Int_Impl& y) const final
    {
        return cmp(value, get(y));
    }

    [[nodiscard]]
    int get_signum() const noexcept final
    {
        return sgn(value);
    }

    [[nodiscard]]
    bool is_one() const noexcept final
    {
        return value == 1;
    }

    [[nodiscard]]
    bool is_even() const noexcept final
    {
        return mpz_even_p(value.get_mpz_t()) != 0;
    }

    [[nodiscard]]
    std::size_t bit_length() const noexcept final
    {
        // mpz_sizeinbase yields 1 rather than 0 for zero.
        if (value == 0) {
            return 0;
        }
        return mpz_sizeinbase(value.get_mpz_t(), 2);
    }

    [[nodiscard]]
    bool get_bit(const std::size_t i) const final
    {
        return mpz_tstbit(value.get_mpz_t(), mp_bitcnt_t(i)) != 0;
    }

    [[nodiscard]]
    Conversion_Result<Int64> as_i64() const noexcept final
    {
        if (mpz_fits_slong_p(value.get_mpz_t())) {
            return { Int64(mpz_get_si(value.get_mpz_t())), false };
        }
        mpz_class truncated;
        mpz_fdiv_r_2exp(truncated.get_mpz_t(), value.get_mpz_t(), 64);
        return { Int64(Uint64(mpz_get_ui(truncated.get_mpz_t()))), true };
    }

    void print_to(
        const Function_Ref<void(std::string_view)> out,
        const int base,
        const bool to_upper
    ) const final
    {
        BIGKEY_ASSERT(base >= 2 && base <= 36);
        std::string result = value.get_str(base);
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
        std::vector<Uint8> result(byte_length_for_bits(bit_length()));
        if (result.empty()) {
            return result;
        }
        std::size_t written = 0;
        mpz_export(
            result.data(), &written, word_order_msb_first, word_size, word_endian_native,
            nail_bits, value.get_mpz_t()
        );
        BIGKEY_ASSERT(written == result.size());
        return result;
    }
};

std::unique_ptr<Big_Int_Impl> Gmp_Big_Int_Backend::make_i64(const Int64 x) const
{
    return std::make_unique<Gmp_Big_Int>(mpz_class { static_cast<signed long>(x) });
}

std::unique_ptr<Big_Int_Impl> Gmp_Big_Int_Backend::make_digits(
    const std::string_view digits,
    const int base,
    const bool negative
) const
{
    BIGKEY_ASSERT(!digits.empty());
    BIGKEY_ASSERT(base >= 2 && base <= 36);
    mpz_class result;
    const int status = result.set_str(std::string { digits }, base);
    BIGKEY_ASSERT(status == 0);
    if (negative) {
        mpz_neg(result.get_mpz_t(), result.get_mpz_t());
    }
    return std::make_unique<Gmp_Big_Int>(std::move(result));
}

std::unique_ptr<Big_Int_Impl>
Gmp_Big_Int_Backend::make_bytes(const std::span<const Uint8> big_endian) const
{
    mpz_class result;
    if (!big_endian.empty()) {
        mpz_import(
            result.get_mpz_t(), big_endian.size(), word_order_msb_first, word_size,
            word_endian_native, nail_bits, big_endian.data()
        );
    }
    return std::make_unique<Gmp_Big_Int>(std::move(result));
}

} // namespace

const Big_Int_Backend& gmp_big_int_backend() noexcept
{
    return gmp_backend;
}

} // namespace bigkey
