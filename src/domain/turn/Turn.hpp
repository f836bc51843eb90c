/**
 * @file Turn.hpp
 * @brief One capture/reflection unit tracked by the lifecycle state machine.
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "domain/TimeFormat.hpp"
#include "domain/turn/TurnTypes.hpp"

namespace reflectcore::domain::turn {

inline constexpr const char* kUntitledPlaceholder = "Untitled";
inline constexpr const char* kEmptyLearningSnapshot = "{}";

/**
 * @struct ToolOutput
 * @brief Latest result of one single-shot tool for this Turn.
 */
struct ToolOutput {
    std::string text;
    std::string promptVersion;
    Timestamp updatedAt;
};

struct TalkMessage {
    std::string role; ///< "user" or "assistant"
    std::string text;
    Timestamp at;
};

/**
 * @struct Turn
 * @brief Persisted capture record.
 *
 * Invariants maintained by TurnLifecycleService:
 * - audioBytes > 0 implies audioPath is set.
 * - redactionVersion never decreases.
 * - error is set if and only if state == Failed.
 */
struct Turn {
    std::string id;
    TurnSource source = TurnSource::Captured;
    Timestamp recordedAt;
    std::optional<Timestamp> endedAt;
    std::optional<double> durationSeconds;
    std::optional<Timestamp> sourceOriginalDate;
    CaptureContext captureContext = CaptureContext::Unknown;
    std::string title;

    std::optional<std::string> audioPath;
    std::int64_t audioBytes = 0;

    std::optional<std::string> transcriptRaw; ///< Local only. Never transmitted.
    std::string transcriptRedactedActive;

    std::map<ReflectTool, ToolOutput> toolOutputs;

    std::vector<TalkMessage> talkMessages;
    std::optional<std::string> talkLastResponseId; ///< Opaque continuation token.
    std::optional<std::string> talkPromptVersion;
    std::optional<Timestamp> talkUpdatedAt;

    std::string learningSnapshotJson = kEmptyLearningSnapshot;
    int learningSnapshotVersion = 1;
    std::optional<Timestamp> learningSnapshotUpdatedAt;

    int redactionVersion = 1;
    std::optional<Timestamp> redactionTimestamp;
    std::optional<std::string> redactionInputHash;

    TurnState state = TurnState::Queued;

    TranscriptionProvider transcriptionProvider = TranscriptionProvider::Unknown;
    std::optional<std::string> transcriptionLocale;
    ReflectProvider reflectProvider = ReflectProvider::None;
    std::optional<std::string> promptVersion;
    std::optional<std::string> toolchainVersion;
    std::optional<std::string> capsuleSnapshotHash;

    std::optional<Timestamp> processingStartedAt;
    std::optional<Timestamp> processingFinishedAt;

    std::optional<TurnError> error;
};

} // namespace reflectcore::domain::turn
