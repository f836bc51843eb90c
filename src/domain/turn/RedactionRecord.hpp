/**
 * @file RedactionRecord.hpp
 * @brief Append-only provenance entry for one redaction application.
 */

#pragma once

#include <string>
#include "domain/TimeFormat.hpp"

namespace reflectcore::domain::turn {

struct RedactionRecord {
    std::string id;
    std::string turnId;
    int version = 1;
    Timestamp timestamp;
    std::string inputHash;    ///< Fingerprint of the pre-redaction text.
    std::string textRedacted;
};

} // namespace reflectcore::domain::turn
