#ifndef BIGKEY_FWD_HPP
#define BIGKEY_FWD_HPP

#include "bigkey/settings.hpp"

BIGKEY_IF_DEBUG() // silence unused warning for settings.hpp

namespace bigkey {

/// @brief The default underlying type for scoped enumerations.
using Default_Underlying = unsigned char;

#define BIGKEY_ENUM_STRING_CASE(...)                                                               \
    case __VA_ARGS__: return #__VA_ARGS__

struct Big_Int;
struct Big_Int_Backend;
enum struct Big_Int_Error : Default_Underlying;
struct Big_Int_Impl;
struct Big_Int_Registry;
struct Collecting_Logger;
template <typename>
struct Conversion_Result;
struct Diagnostic;
enum struct Endian : Default_Underlying;
struct Ignorant_Logger;
struct Logger;
template <typename, typename>
struct Result;
enum struct Severity : Default_Underlying;
struct U64_Halves;

} // namespace bigkey

#endif
