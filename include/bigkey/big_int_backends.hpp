#ifndef BIGKEY_BIG_INT_BACKENDS_HPP
#define BIGKEY_BIG_INT_BACKENDS_HPP

#include "bigkey/big_int_impl.hpp"
#include "bigkey/fwd.hpp"
#include "bigkey/settings.hpp"

namespace bigkey {

/// @brief Returns the native backend, built on `boost::multiprecision::cpp_int`.
[[nodiscard]]
const Big_Int_Backend& boost_big_int_backend() noexcept;

/// @brief Returns the fallback backend, built on GMP.
[[nodiscard]]
const Big_Int_Backend& gmp_big_int_backend() noexcept;

/// @brief Returns the backend which the process-wide registry starts out with:
/// the native backend, unless the build opts out of it.
[[nodiscard]]
inline const Big_Int_Backend& default_big_int_backend() noexcept
{
    if constexpr (has_native_big_int) {
        return boost_big_int_backend();
    }
    else {
        return gmp_big_int_backend();
    }
}

} // namespace bigkey

#endif
