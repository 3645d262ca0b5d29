#ifndef BIGKEY_FUNCTION_REF_HPP
#define BIGKEY_FUNCTION_REF_HPP

#include "ulight/function_ref.hpp"

namespace bigkey {

template <typename F>
using Function_Ref = ulight::Function_Ref<F>;

} // namespace bigkey

#endif
