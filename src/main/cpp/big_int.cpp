#include <compare>
#include <limits>
#include <memory>
#include <vector>

#include "bigkey/util/assert.hpp"
#include "bigkey/util/result.hpp"

#include "bigkey/big_int.hpp"
#include "bigkey/big_int_error.hpp"
#include "bigkey/big_int_impl.hpp"

namespace bigkey {

namespace {

[[nodiscard]]
std::strong_ordering ordering_of(const int comparison) noexcept
{
    return comparison <=> 0;
}

/// @brief Returns the magnitude of `s` as an unsigned amount,
/// which is correct even for `std::numeric_limits<Int64>::min()`.
[[nodiscard]]
constexpr Uint64 shift_magnitude(const Int64 s) noexcept
{
    return s < 0 ? Uint64(0) - Uint64(s) : Uint64(s);
}

/// @brief A right shift by this amount clears every bit of any representable value.
inline constexpr Uint64 saturating_shift = std::numeric_limits<Uint64>::max();

} // namespace

const Big_Int_Impl& Big_Int::operand(const Big_Int& y, std::unique_ptr<Big_Int_Impl>& storage) const
{
    const Big_Int_Backend& backend = get_backend();
    const Big_Int_Impl& y_impl = y.get_impl();
    if (&y_impl.get_backend() == &backend) {
        return y_impl;
    }
    storage = backend.make_bytes(y_impl.magnitude_bytes());
    if (y_impl.get_signum() < 0) {
        storage->inegate();
    }
    return *storage;
}

Big_Int& Big_Int::iadd(const Big_Int& y)
{
    std::unique_ptr<Big_Int_Impl> storage;
    get_mutable_impl().iadd(operand(y, storage));
    return *this;
}

Big_Int& Big_Int::isub(const Big_Int& y)
{
    std::unique_ptr<Big_Int_Impl> storage;
    get_mutable_impl().isub(operand(y, storage));
    return *this;
}

Big_Int& Big_Int::imul(const Big_Int& y)
{
    std::unique_ptr<Big_Int_Impl> storage;
    get_mutable_impl().imul(operand(y, storage));
    return *this;
}

Result<void, Big_Int_Error> Big_Int::idiv(const Big_Int& y)
{
    if (y.is_zero()) {
        return Big_Int_Error::division_by_zero;
    }
    std::unique_ptr<Big_Int_Impl> storage;
    get_mutable_impl().idiv(operand(y, storage));
    return {};
}

Result<void, Big_Int_Error> Big_Int::imod(const Big_Int& m)
{
    if (m.is_zero()) {
        return Big_Int_Error::division_by_zero;
    }
    std::unique_ptr<Big_Int_Impl> storage;
    get_mutable_impl().imod(operand(m, storage));
    return {};
}

Big_Int& Big_Int::iinc()
{
    get_mutable_impl().iinc();
    return *this;
}

Big_Int& Big_Int::idec()
{
    get_mutable_impl().idec();
    return *this;
}

Big_Int& Big_Int::inegate()
{
    get_mutable_impl().inegate();
    return *this;
}

Big_Int& Big_Int::iabs()
{
    get_mutable_impl().iabs();
    return *this;
}

Big_Int& Big_Int::ileft_shift(const Int64 s)
{
    if (s >= 0) {
        get_mutable_impl().ileft_shift(Uint64(s));
    }
    else {
        get_mutable_impl().iright_shift(shift_magnitude(s));
    }
    return *this;
}

Big_Int& Big_Int::ileft_shift(const Big_Int& s)
{
    const auto [amount, lossy] = s.as_i64();
    if (lossy) {
        // Only a right shift can be carried out by an amount this large.
        BIGKEY_ASSERT(s.is_negative());
        get_mutable_impl().iright_shift(saturating_shift);
        return *this;
    }
    return ileft_shift(amount);
}

Big_Int& Big_Int::iright_shift(const Int64 s)
{
    if (s >= 0) {
        get_mutable_impl().iright_shift(Uint64(s));
    }
    else {
        BIGKEY_ASSERT(s != std::numeric_limits<Int64>::min());
        get_mutable_impl().ileft_shift(shift_magnitude(s));
    }
    return *this;
}

Big_Int& Big_Int::iright_shift(const Big_Int& s)
{
    const auto [amount, lossy] = s.as_i64();
    if (lossy) {
        BIGKEY_ASSERT(!s.is_negative());
        get_mutable_impl().iright_shift(saturating_shift);
        return *this;
    }
    return iright_shift(amount);
}

Big_Int& Big_Int::ibit_xor(const Big_Int& y)
{
    std::unique_ptr<Big_Int_Impl> storage;
    get_mutable_impl().ibit_xor(operand(y, storage));
    return *this;
}

Big_Int& Big_Int::ibit_and(const Big_Int& y)
{
    std::unique_ptr<Big_Int_Impl> storage;
    get_mutable_impl().ibit_and(operand(y, storage));
    return *this;
}

Big_Int& Big_Int::ibit_or(const Big_Int& y)
{
    std::unique_ptr<Big_Int_Impl> storage;
    get_mutable_impl().ibit_or(operand(y, storage));
    return *this;
}

Result<void, Big_Int_Error> Big_Int::imod_exp(const Big_Int& e, const Big_Int& n)
{
    if (n.is_zero()) {
        return Big_Int_Error::division_by_zero;
    }
    std::unique_ptr<Big_Int_Impl> n_storage;
    std::unique_ptr<Big_Int_Impl> e_storage;
    std::unique_ptr<Big_Int_Impl> modulus = operand(n, n_storage).clone();
    modulus->iabs();

    if (!e.is_negative()) {
        get_mutable_impl().imod_exp(operand(e, e_storage), *modulus);
        return {};
    }

    // x^-k mod n is (x^-1)^k mod n.
    std::unique_ptr<Big_Int_Impl> base = get_impl().clone();
    base->imod(*modulus);
    if (!base->imod_inv(*modulus)) {
        return Big_Int_Error::inverse_does_not_exist;
    }
    std::unique_ptr<Big_Int_Impl> exponent = operand(e, e_storage).clone();
    exponent->inegate();
    base->imod_exp(*exponent, *modulus);
    m_impl = std::move(base);
    return {};
}

Result<void, Big_Int_Error> Big_Int::imod_inv(const Big_Int& n)
{
    if (n.is_zero()) {
        return Big_Int_Error::division_by_zero;
    }
    std::unique_ptr<Big_Int_Impl> n_storage;
    std::unique_ptr<Big_Int_Impl> modulus = operand(n, n_storage).clone();
    modulus->iabs();

    std::unique_ptr<Big_Int_Impl> normalized = get_impl().clone();
    normalized->imod(*modulus);
    if (!normalized->imod_inv(*modulus)) {
        return Big_Int_Error::inverse_does_not_exist;
    }
    m_impl = std::move(normalized);
    return {};
}

Big_Int& Big_Int::igcd(const Big_Int& y)
{
    std::unique_ptr<Big_Int_Impl> storage;
    get_mutable_impl().igcd(operand(y, storage));
    return *this;
}

Result<Big_Int, Big_Int_Error> Big_Int::div(const Big_Int& y) const
{
    Big_Int result = *this;
    if (const Result<void, Big_Int_Error> r = result.idiv(y); !r) {
        return r.error();
    }
    return result;
}

Result<Big_Int, Big_Int_Error> Big_Int::mod(const Big_Int& m) const
{
    Big_Int result = *this;
    if (const Result<void, Big_Int_Error> r = result.imod(m); !r) {
        return r.error();
    }
    return result;
}

Result<Big_Int, Big_Int_Error> Big_Int::mod_exp(const Big_Int& e, const Big_Int& n) const
{
    Big_Int result = *this;
    if (const Result<void, Big_Int_Error> r = result.imod_exp(e, n); !r) {
        return r.error();
    }
    return result;
}

Result<Big_Int, Big_Int_Error> Big_Int::mod_inv(const Big_Int& n) const
{
    Big_Int result = *this;
    if (const Result<void, Big_Int_Error> r = result.imod_inv(n); !r) {
        return r.error();
    }
    return result;
}

std::strong_ordering Big_Int::compare(const Big_Int& y) const
{
    std::unique_ptr<Big_Int_Impl> storage;
    return ordering_of(get_impl().compare(operand(y, storage)));
}

std::strong_ordering Big_Int::compare(const Int64 y) const
{
    const std::unique_ptr<Big_Int_Impl> y_impl = get_backend().make_i64(y);
    return ordering_of(get_impl().compare(*y_impl));
}

} // namespace bigkey
