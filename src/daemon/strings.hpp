#pragma once

#include <string>
#include <string_view>

inline std::string trim(std::string_view s) {
    constexpr std::string_view ws = " \t\n\r\f\v";
    auto start = s.find_first_not_of(ws);
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(ws);
    return std::string(s.substr(start, end - start + 1));
}
