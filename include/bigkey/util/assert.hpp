#ifndef BIGKEY_ASSERT_HPP
#define BIGKEY_ASSERT_HPP

#include "ulight/impl/assert.hpp"

namespace bigkey {

using ulight::assert_fail;
using ulight::Assertion_Error;
using ulight::Assertion_Error_Type;
using ulight::assertion_handler;
using ulight::handle_assertion;

#define BIGKEY_ASSERT(...) ULIGHT_ASSERT(__VA_ARGS__)
#define BIGKEY_DEBUG_ASSERT(...) ULIGHT_DEBUG_ASSERT(__VA_ARGS__)

#define BIGKEY_ASSERT_UNREACHABLE(...) ULIGHT_ASSERT_UNREACHABLE(__VA_ARGS__)

} // namespace bigkey

#endif
