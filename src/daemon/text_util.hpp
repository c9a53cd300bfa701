#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace text {

inline std::string trim(std::string_view s) {
    constexpr std::string_view ws = " \t\n\r\f\v";
    auto start = s.find_first_not_of(ws);
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(ws);
    return std::string(s.substr(start, end - start + 1));
}

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Text after the last '.', lower-cased. Empty if there is no dot.
inline std::string extension_of(std::string_view filename) {
    auto pos = filename.rfind('.');
    if (pos == std::string_view::npos) return {};
    return to_lower(std::string(filename.substr(pos + 1)));
}

} // namespace text
