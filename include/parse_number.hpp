#pragma once

#include <charconv>
#include <concepts>
#include <string>
#include <string_view>
#include <system_error>

#include "errors.hpp"

// parses the whole of s as a decimal number, throws InvalidArgumentError naming what on anything else
template<std::integral T>
T parse_number(std::string_view const s, std::string const& what) {
    T x = 0;
    auto const* last = s.data() + s.size();
    auto const r = std::from_chars(s.data(), last, x);
    if(s.empty() || r.ec != std::errc() || r.ptr != last) {
        throw InvalidArgumentError("invalid " + what + ": \"" + std::string(s) + "\"");
    }
    return x;
}
