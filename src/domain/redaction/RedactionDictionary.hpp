/**
 * @file RedactionDictionary.hpp
 * @brief User-maintained list of sensitive tokens plus its version.
 */

#pragma once

#include <string>
#include <vector>

namespace reflectcore::domain::redaction {

/**
 * @struct RedactionDictionary
 * @brief Versioned token list. The version increases on every edit and is stamped
 * onto each Turn as its redaction version.
 */
struct RedactionDictionary {
    int version = 1;
    std::vector<std::string> tokens;
};

} // namespace reflectcore::domain::redaction
