#ifndef BIGKEY_ASCII_ALGORITHM_HPP
#define BIGKEY_ASCII_ALGORITHM_HPP

#include "ulight/impl/ascii_algorithm.hpp"

namespace bigkey::ascii {

using ulight::ascii::length_if;

} // namespace bigkey::ascii

#endif
