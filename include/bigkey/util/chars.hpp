#ifndef BIGKEY_CHARS_HPP
#define BIGKEY_CHARS_HPP

#include "ulight/impl/ascii_chars.hpp"

namespace bigkey {

using ulight::is_ascii_digit;
using ulight::is_ascii_hex_digit;
using ulight::to_ascii_upper;

} // namespace bigkey

#endif
