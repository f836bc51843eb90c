/**
 * @file CaseFolding.hpp
 * @brief Unicode simple case folding over UTF-8 text, with byte offsets kept for each code point.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace reflectcore::domain {

/**
 * @struct FoldedText
 * @brief Case-folded code points of a UTF-8 string.
 *
 * offsets has one entry per code point plus a final entry equal to the byte length,
 * so the span [i, j) of code points maps to bytes [offsets[i], offsets[j]).
 * Invalid UTF-8 sequences decode to U+FFFD.
 */
struct FoldedText {
    std::vector<std::int32_t> codePoints;
    std::vector<std::size_t> offsets;
};

FoldedText FoldForMatching(const std::string& utf8);

/// Case-folded copy, re-encoded as UTF-8. Used for case-insensitive comparison keys.
std::string FoldCase(const std::string& utf8);

/// Letters, digits, combining marks and '_' continue a word.
bool IsWordCodePoint(std::int32_t c);

} // namespace reflectcore::domain
