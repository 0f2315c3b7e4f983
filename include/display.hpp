#pragma once

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

inline std::string display_inline(char const x) {
    std::ostringstream oss;
    if(x == '"' || x == '\\') {
        oss << '\\' << x;
    } else if(x >= 32 && x < 127) {
        oss << x;
    } else {
        oss << "<0x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0') << (unsigned int)uint8_t(x) << ">";
    }
    return oss.str();
}

// renders phrase bytes on one line, quoted, with non-printable bytes spelled out
inline std::string display_phrase(std::string_view const phrase, size_t const max_len = SIZE_MAX) {
    std::string s = "\"";
    auto const n = std::min(phrase.size(), max_len);
    for(size_t i = 0; i < n; i++) {
        s += display_inline(phrase[i]);
    }
    s += "\"";
    if(n < phrase.size()) {
        s += "... (" + std::to_string(phrase.size()) + " bytes)";
    }
    return s;
}
