/**
 * @file TendencyStatements.hpp
 * @brief Maps a learned (kind, key) to a short, neutral, human-readable statement.
 */

#pragma once

#include <string>
#include "domain/learning/PatternKind.hpp"

namespace reflectcore::application::capsule {

/**
 * @brief Statement surfaced for a learned pattern. Never echoes user text; unknown keys fall
 * back to a generic sentence built from the key with underscores as spaces.
 */
std::string StatementFor(domain::learning::PatternKind kind, const std::string& key);

} // namespace reflectcore::application::capsule
