/**
 * @file SnapshotExporter.hpp
 * @brief Projects the Capsule into the bounded payload attached to outbound reasoning requests.
 */

#pragma once

#include <string>
#include <vector>
#include "application/learning/PatternLearningService.hpp"
#include "domain/capsule/Capsule.hpp"
#include "domain/capsule/ExportSnapshot.hpp"

namespace reflectcore::application::capsule {

using domain::Timestamp;
using domain::capsule::Capsule;
using domain::capsule::CapsuleMode;
using domain::capsule::ExportSnapshot;

/**
 * @class SnapshotExporter
 * @brief Stateless projection with fixed caps. Never throws: oversized or malformed input is
 * truncated or dropped.
 *
 * Preferences: typed fields first (only when set), then list preferences as compact JSON arrays
 * (<= 512 chars), then extras in key order, at most 24 in total, keys <= 32 chars, other values
 * <= 128 chars, blank values dropped. The pseudonym is never exported.
 * Learned cues: omitted entirely unless learning is enabled and at least one cue survives;
 * at most 12 in reflect mode and 6 in talk mode.
 */
class SnapshotExporter {
public:
    static constexpr std::size_t kMaxPreferences = 24;
    static constexpr std::size_t kMaxKeyLength = 32;
    static constexpr std::size_t kMaxValueLength = 128;
    static constexpr std::size_t kMaxListValueLength = 512;
    static constexpr std::size_t kMaxStatementLength = 140;
    static constexpr std::size_t kMaxReflectCues = 12;
    static constexpr std::size_t kMaxTalkCues = 6;
    static constexpr int kMaxEvidenceCount = 999;

    /**
     * @brief Uses the Capsule's curated tendencies as the cue source.
     */
    static ExportSnapshot project(const Capsule& capsule, CapsuleMode mode) noexcept;

    /**
     * @brief Curates cues directly from @p patterns (decayed as of @p now) instead of the
     * stored tendencies.
     */
    static ExportSnapshot project(const Capsule& capsule, CapsuleMode mode,
                                  const std::vector<learning::RankedPattern>& patterns,
                                  Timestamp now) noexcept;

    /**
     * @brief Stable content hash recorded on a Turn as the snapshot that produced an output.
     */
    static std::string fingerprint(const ExportSnapshot& snapshot);

private:
    static ExportSnapshot build(const Capsule& capsule, CapsuleMode mode,
                                const std::vector<domain::capsule::CapsuleTendency>& tendencies);
};

} // namespace reflectcore::application::capsule
