#ifndef BIGKEY_STRINGS_HPP
#define BIGKEY_STRINGS_HPP

#include <string_view>

namespace bigkey {

[[nodiscard]]
inline std::string_view as_string_view(std::u8string_view str)
{
    return { reinterpret_cast<const char*>(str.data()), str.size() };
}

[[nodiscard]]
inline std::u8string_view as_u8string_view(std::string_view str)
{
    return { reinterpret_cast<const char8_t*>(str.data()), str.size() };
}

} // namespace bigkey

#endif
