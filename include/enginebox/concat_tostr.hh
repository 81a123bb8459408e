#pragma once

#include <string>
#include <string_view>
#include <type_traits>

namespace detail {

template <class T>
void append_tostr(std::string& str, const T& val) {
    using U = std::decay_t<T>;
    if constexpr (std::is_same_v<U, char>) {
        str += val;
    } else if constexpr (std::is_same_v<U, bool>) {
        str += val ? "true" : "false";
    } else if constexpr (std::is_arithmetic_v<U>) {
        str += std::to_string(val);
    } else {
        str += std::string_view{val};
    }
}

} // namespace detail

template <class... Args>
std::string concat_tostr(const Args&... args) {
    std::string res;
    (detail::append_tostr(res, args), ...);
    return res;
}
