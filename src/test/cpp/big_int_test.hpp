#ifndef BIGKEY_TEST_BIG_INT_TEST_HPP
#define BIGKEY_TEST_BIG_INT_TEST_HPP

#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>

#include <gtest/gtest.h>

#include "bigkey/util/strings.hpp"

#include "bigkey/big_int.hpp"
#include "bigkey/big_int_backends.hpp"
#include "bigkey/big_int_registry.hpp"

namespace bigkey {

std::ostream& operator<<(std::ostream& out, const Big_Int& x);

/// @brief Fixture for tests which must hold for every backend.
/// Each test owns a registry with the backend under test installed.
struct Big_Int_Test : testing::TestWithParam<const Big_Int_Backend*> {
    Big_Int_Registry registry { *GetParam() };

    [[nodiscard]]
    Big_Int make(const Int64 x) const
    {
        return registry.make(x);
    }

    /// @brief Makes an integer from a literal which is known to be valid.
    [[nodiscard]]
    Big_Int make(const std::string_view digits) const
    {
        Result<Big_Int, Big_Int_Error> result = registry.make(digits);
        EXPECT_TRUE(result) << "Invalid test literal: " << digits;
        return std::move(*result);
    }

    /// @brief Returns the backend other than the one under test.
    [[nodiscard]]
    static const Big_Int_Backend& other_backend()
    {
        return GetParam() == &boost_big_int_backend() ? gmp_big_int_backend()
                                                      : boost_big_int_backend();
    }
};

struct Backend_Name {
    [[nodiscard]]
    std::string operator()(const testing::TestParamInfo<const Big_Int_Backend*>& info) const
    {
        return std::string { as_string_view(info.param->get_name()) };
    }
};

} // namespace bigkey

#define BIGKEY_INSTANTIATE_FOR_ALL_BACKENDS(suite)                                                 \
    INSTANTIATE_TEST_SUITE_P(                                                                      \
        All_Backends, suite,                                                                       \
        testing::Values(&::bigkey::boost_big_int_backend(), &::bigkey::gmp_big_int_backend()),     \
        ::bigkey::Backend_Name {}                                                                  \
    )

#endif
