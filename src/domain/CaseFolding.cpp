/**
 * @file CaseFolding.cpp
 * @brief ICU-backed implementation of the case folding helpers.
 */

#include "domain/CaseFolding.hpp"

#include <unicode/uchar.h>
#include <unicode/utf8.h>

namespace reflectcore::domain {

FoldedText FoldForMatching(const std::string& utf8) {
    FoldedText out;
    out.codePoints.reserve(utf8.size());
    out.offsets.reserve(utf8.size() + 1);

    const auto* bytes = reinterpret_cast<const std::uint8_t*>(utf8.data());
    const auto length = static_cast<std::int32_t>(utf8.size());
    std::int32_t i = 0;
    while (i < length) {
        out.offsets.push_back(static_cast<std::size_t>(i));
        UChar32 c = 0;
        U8_NEXT(bytes, i, length, c);
        if (c < 0) c = 0xFFFD;
        out.codePoints.push_back(u_foldCase(c, U_FOLD_CASE_DEFAULT));
    }
    out.offsets.push_back(utf8.size());
    return out;
}

std::string FoldCase(const std::string& utf8) {
    FoldedText folded = FoldForMatching(utf8);
    std::string out;
    out.reserve(utf8.size());
    for (std::int32_t c : folded.codePoints) {
        char buffer[U8_MAX_LENGTH];
        std::int32_t n = 0;
        UBool failed = false;
        U8_APPEND(reinterpret_cast<std::uint8_t*>(buffer), n, U8_MAX_LENGTH, c, failed);
        if (!failed) out.append(buffer, static_cast<std::size_t>(n));
    }
    return out;
}

bool IsWordCodePoint(std::int32_t c) {
    if (c == '_') return true;
    if (u_isalnum(c)) return true;
    auto type = u_charType(c);
    return type == U_NON_SPACING_MARK || type == U_COMBINING_SPACING_MARK;
}

} // namespace reflectcore::domain
