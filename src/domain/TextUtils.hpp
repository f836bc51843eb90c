/**
 * @file TextUtils.hpp
 * @brief Small string helpers shared by the bounded projections (trim, UTF-8 aware truncation).
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace reflectcore::domain {

inline std::string Trim(const std::string& s) {
    const char* ws = " \t\n\r\f\v";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

inline bool IsBlank(const std::string& s) {
    return Trim(s).empty();
}

inline std::string ToLowerAscii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/**
 * @brief Keeps at most @p maxChars code points, never splitting a UTF-8 sequence.
 */
inline std::string TruncateUtf8(const std::string& s, std::size_t maxChars) {
    std::size_t chars = 0;
    std::size_t i = 0;
    while (i < s.size()) {
        if (chars == maxChars) return s.substr(0, i);
        unsigned char c = static_cast<unsigned char>(s[i]);
        std::size_t len = 1;
        if (c >= 0xF0) len = 4;
        else if (c >= 0xE0) len = 3;
        else if (c >= 0xC0) len = 2;
        i = std::min(s.size(), i + len);
        ++chars;
    }
    return s;
}

inline std::size_t Utf8Length(const std::string& s) {
    std::size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

} // namespace reflectcore::domain
