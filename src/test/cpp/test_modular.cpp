#include <cstddef>
#include <string_view>

#include <gtest/gtest.h>

#include "bigkey/big_int.hpp"
#include "bigkey/big_int_error.hpp"
#include "bigkey/big_int_ops.hpp"

#include "big_int_test.hpp"

namespace bigkey {
namespace {

constexpr std::string_view string_x
    = "417653931840771530406225971293556769925351769207235721650257629558293828796031115397206059"
      "067934284452829611906818956352854418342467914729341523414945427019410284762464062112274326"
      "172407819051167058569790660930309496043254270888417520676082271432948852231332576271876251"
      "597199882908964994070268531832274431027";
constexpr std::string_view string_e
    = "211393560108725692391599227815263795215873481690742092851879104816675330721684680116171946"
      "951812554832887925854133653597336920970843732491987581487043692077938739989018705772622549"
      "717841914731022658301930588132158987652387846704696965744075801791531189378588905720952343"
      "16482449291777882525949871374961971753";
constexpr std::string_view string_n
    = "129189808515414783602892982235788912674846062846614219472827821758734760420002631653235573"
      "915244294540972376140705505703576175711417114803419704967903726436285518767606681184247119"
      "430411311152556442947708732584954518890222684529678365388350886907287414896703685680210648"
      "760841628375425909680236584021041565183";

/// @brief Computes `pow(x, e) mod n` by square-and-multiply using only `mul` and `mod`.
[[nodiscard]]
Big_Int reference_mod_exp(const Big_Int& x, const Big_Int& e, const Big_Int& n)
{
    // One, reduced so that a modulus of one yields zero.
    Big_Int result = *x.sub(x).inc().mod(n);
    const Big_Int base = *x.mod(n);
    for (std::size_t i = e.bit_length(); i-- > 0;) {
        result = *result.mul(result).mod(n);
        if (e.get_bit(i)) {
            result = *result.mul(base).mod(n);
        }
    }
    return result;
}

using Big_Int_Modular = Big_Int_Test;

TEST_P(Big_Int_Modular, mod_exp_small)
{
    EXPECT_EQ(*make(4).mod_exp(make(13), make(497)), 445);
    EXPECT_EQ(*make(2).mod_exp(make(10), make(1000)), 24);
    EXPECT_EQ(*make(3).mod_exp(make(0), make(7)), 1);
    EXPECT_EQ(*make(0).mod_exp(make(0), make(7)), 1);
    EXPECT_EQ(*make(3).mod_exp(make(5), make(1)), 0);
    EXPECT_EQ(*make(3).mod_exp(make(0), make(1)), 0);
}

TEST_P(Big_Int_Modular, mod_exp_negative_base)
{
    // (-2)^3 = -8, which is 5 mod 13.
    EXPECT_EQ(*make(-2).mod_exp(make(3), make(13)), 5);
    EXPECT_EQ(*make(-2).mod_exp(make(3), make(14)), 6);
}

TEST_P(Big_Int_Modular, mod_exp_negative_modulus)
{
    EXPECT_EQ(*make(4).mod_exp(make(13), make(-497)), 445);
}

TEST_P(Big_Int_Modular, mod_exp_negative_exponent)
{
    // 3^-1 mod 7 is 5, so 3^-2 mod 7 is 25 mod 7 = 4.
    EXPECT_EQ(*make(3).mod_exp(make(-1), make(7)), 5);
    EXPECT_EQ(*make(3).mod_exp(make(-2), make(7)), 4);

    const Result<Big_Int, Big_Int_Error> result = make(2).mod_exp(make(-1), make(8));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), Big_Int_Error::inverse_does_not_exist);
}

TEST_P(Big_Int_Modular, mod_exp_zero_modulus)
{
    Big_Int x = make(3);
    const Result<void, Big_Int_Error> result = x.imod_exp(make(2), make(0));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), Big_Int_Error::division_by_zero);
    EXPECT_EQ(x, 3);
}

TEST_P(Big_Int_Modular, mod_exp_large_odd_modulus)
{
    const Big_Int x = make(string_x);
    const Big_Int e = make(string_e);
    const Big_Int n = make(string_n);

    const Result<Big_Int, Big_Int_Error> got = x.mod_exp(e, n);
    ASSERT_TRUE(got);
    EXPECT_EQ(*got, reference_mod_exp(x, e, n));
    EXPECT_TRUE(got->lt(n));
    EXPECT_FALSE(got->is_negative());
}

TEST_P(Big_Int_Modular, mod_exp_large_even_modulus)
{
    const Big_Int x = make(string_x);
    const Big_Int e = make(string_e);
    const Big_Int n = make(string_n).left_shift(3);

    const Result<Big_Int, Big_Int_Error> got = x.mod_exp(e, n);
    ASSERT_TRUE(got);
    EXPECT_EQ(*got, reference_mod_exp(x, e, n));
}

TEST_P(Big_Int_Modular, mod_exp_matches_reference)
{
    const Big_Int moduli[] { make(3), make(97), make(1024), make("0xfffffffffffffffffffffffd"),
                             make("0x1000000000000000000000000") };
    const Big_Int bases[] { make(0), make(1), make(2), make(-5), make("0x123456789abcdef0123") };
    const Big_Int exponents[] { make(1), make(2), make(65537), make("0xdeadbeefcafe") };
    for (const Big_Int& n : moduli) {
        for (const Big_Int& x : bases) {
            for (const Big_Int& e : exponents) {
                EXPECT_EQ(*x.mod_exp(e, n), reference_mod_exp(x, e, n))
                    << x << " ^ " << e << " mod " << n;
            }
        }
    }
}

TEST_P(Big_Int_Modular, mod_exp_in_place_matches_pure)
{
    const Big_Int x = make(string_x);
    const Big_Int e = make(65537);
    const Big_Int n = make(string_n);

    Big_Int in_place = x;
    ASSERT_TRUE(in_place.imod_exp(e, n));
    EXPECT_EQ(in_place, *x.mod_exp(e, n));
    EXPECT_EQ(x, make(string_x));
}

TEST_P(Big_Int_Modular, gcd)
{
    EXPECT_EQ(make(12).gcd(make(18)), 6);
    EXPECT_EQ(make(-12).gcd(make(18)), 6);
    EXPECT_EQ(make(12).gcd(make(-18)), 6);
    EXPECT_EQ(make(-12).gcd(make(-18)), 6);
    EXPECT_EQ(make(0).gcd(make(-5)), 5);
    EXPECT_EQ(make(7).gcd(make(0)), 7);
    EXPECT_EQ(make(0).gcd(make(0)), 0);
    EXPECT_EQ(make(17).gcd(make(31)), 1);
}

TEST_P(Big_Int_Modular, gcd_divides_operands)
{
    const Big_Int common = make("0x1fffffffffffffff");
    const Big_Int values[] { make(string_x).mul(common), make(string_n).negate().mul(common),
                             make(199), make(-3).mul(common), make(1).left_shift(130) };
    for (const Big_Int& a : values) {
        for (const Big_Int& b : values) {
            const Big_Int divisor = a.gcd(b);
            EXPECT_FALSE(divisor.is_negative());
            ASSERT_FALSE(divisor.is_zero());
            EXPECT_TRUE(a.mod(divisor)->is_zero()) << a << " gcd " << b;
            EXPECT_TRUE(b.mod(divisor)->is_zero()) << a << " gcd " << b;
        }
    }
    EXPECT_TRUE(values[0].gcd(values[1]).mod(common)->is_zero());
}

TEST_P(Big_Int_Modular, mod_inv_prime)
{
    const Big_Int p = make(229);
    for (Int64 i = 1; i < 229; ++i) {
        const Big_Int a = make(i);
        const Result<Big_Int, Big_Int_Error> inverse = a.mod_inv(p);
        ASSERT_TRUE(inverse) << i;
        EXPECT_TRUE(a.mul(*inverse).mod(p)->is_one()) << i;
        EXPECT_TRUE(inverse->lt(p));
        EXPECT_FALSE(inverse->is_negative());

        const Result<Big_Int, Big_Int_Error> negated_inverse = a.negate().mod_inv(p);
        ASSERT_TRUE(negated_inverse) << i;
        EXPECT_TRUE(a.negate().mul(*negated_inverse).mod(p)->is_one()) << i;
        EXPECT_EQ(*negated_inverse, p.sub(*inverse).mod(p).value());
    }
}

TEST_P(Big_Int_Modular, mod_inv_does_not_exist)
{
    const Big_Int p = make(229);
    const Big_Int a = make(57);

    Big_Int multiple = a.mul(p);
    const Result<void, Big_Int_Error> result = multiple.imod_inv(p);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), Big_Int_Error::inverse_does_not_exist);
    EXPECT_EQ(multiple, a.mul(p));

    EXPECT_EQ(make(6).mod_inv(make(9)).error(), Big_Int_Error::inverse_does_not_exist);
    EXPECT_EQ(make(0).mod_inv(make(9)).error(), Big_Int_Error::inverse_does_not_exist);
}

TEST_P(Big_Int_Modular, mod_inv_zero_modulus)
{
    EXPECT_EQ(make(3).mod_inv(make(0)).error(), Big_Int_Error::division_by_zero);
}

TEST_P(Big_Int_Modular, mod_inv_edge_cases)
{
    EXPECT_EQ(*make(5).mod_inv(make(1)), 0);
    EXPECT_EQ(*make(3).mod_inv(make(-7)), 5);
    EXPECT_EQ(*make(10).mod_inv(make(7)), 5);
}

TEST_P(Big_Int_Modular, mod_inv_large)
{
    const Big_Int n = make(string_n);
    const Big_Int x = make(string_x);
    const Result<Big_Int, Big_Int_Error> inverse = x.mod_inv(n);
    if (x.gcd(n).is_one()) {
        ASSERT_TRUE(inverse);
        EXPECT_TRUE(x.mul(*inverse).mod(n)->is_one());
    }
    else {
        ASSERT_FALSE(inverse);
        EXPECT_EQ(inverse.error(), Big_Int_Error::inverse_does_not_exist);
    }
}

BIGKEY_INSTANTIATE_FOR_ALL_BACKENDS(Big_Int_Modular);

} // namespace
} // namespace bigkey
