/**
 * @file PatternStatRepository.hpp
 * @brief Persistence port for pattern statistics.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "domain/learning/PatternStat.hpp"

namespace reflectcore::domain::learning {

class PatternStatRepository {
public:
    virtual ~PatternStatRepository() = default;

    virtual std::optional<PatternStat> find(PatternKind kind, const std::string& key) = 0;
    virtual std::vector<PatternStat> findAll() = 0;

    // Insert or replace the row for (stat.kind, stat.key).
    virtual void upsert(const PatternStat& stat) = 0;

    virtual void removeAll() = 0;
};

} // namespace reflectcore::domain::learning
