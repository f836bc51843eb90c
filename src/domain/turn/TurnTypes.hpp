/**
 * @file TurnTypes.hpp
 * @brief Closed enums describing a Turn, with stable wire strings for persisted storage.
 */

#pragma once

#include <optional>
#include <string>

namespace reflectcore::domain::turn {

/**
 * @enum TurnState
 * @brief Lifecycle state of a capture unit.
 *
 * Pipeline order: Queued -> Recording -> Captured -> Transcribing -> (TranscribedRaw) -> Redacting
 * -> {Ready | ReadyPartial | Interrupted | Failed}.
 */
enum class TurnState {
    Queued,
    Recording,
    Captured,
    Transcribing,
    TranscribedRaw,     ///< Raw text arrived, redaction not yet applied.
    Redacting,
    Ready,
    ReadyPartial,       ///< Usable transcript, but the pipeline did not finish cleanly.
    Interrupted,        ///< Suspended/torn down mid-pipeline. Also the fallback for unknown stored values.
    Failed
};

inline std::string StateToString(TurnState state) {
    switch (state) {
        case TurnState::Queued: return "queued";
        case TurnState::Recording: return "recording";
        case TurnState::Captured: return "captured";
        case TurnState::Transcribing: return "transcribing";
        case TurnState::TranscribedRaw: return "transcribedRaw";
        case TurnState::Redacting: return "redacting";
        case TurnState::Ready: return "ready";
        case TurnState::ReadyPartial: return "readyPartial";
        case TurnState::Interrupted: return "interrupted";
        case TurnState::Failed: return "failed";
        default: return "interrupted";
    }
}

/**
 * @brief Parses a stored state. Unrecognized values decode to Interrupted so that records
 * written by newer builds still load.
 */
inline TurnState StateFromString(const std::string& raw) {
    if (raw == "queued") return TurnState::Queued;
    if (raw == "recording") return TurnState::Recording;
    if (raw == "captured") return TurnState::Captured;
    if (raw == "transcribing") return TurnState::Transcribing;
    if (raw == "transcribedRaw") return TurnState::TranscribedRaw;
    if (raw == "redacting") return TurnState::Redacting;
    if (raw == "ready") return TurnState::Ready;
    if (raw == "readyPartial") return TurnState::ReadyPartial;
    if (raw == "interrupted") return TurnState::Interrupted;
    if (raw == "failed") return TurnState::Failed;
    return TurnState::Interrupted;
}

inline bool IsTerminal(TurnState state) {
    switch (state) {
        case TurnState::Ready:
        case TurnState::ReadyPartial:
        case TurnState::Interrupted:
        case TurnState::Failed:
            return true;
        default:
            return false;
    }
}

enum class TurnSource {
    Captured,
    ImportedAudio,
    ImportedText
};

inline std::string SourceToString(TurnSource source) {
    switch (source) {
        case TurnSource::Captured: return "captured";
        case TurnSource::ImportedAudio: return "importedAudio";
        case TurnSource::ImportedText: return "importedText";
        default: return "captured";
    }
}

inline TurnSource SourceFromString(const std::string& raw) {
    if (raw == "importedAudio") return TurnSource::ImportedAudio;
    if (raw == "importedText") return TurnSource::ImportedText;
    return TurnSource::Captured;
}

enum class CaptureContext {
    Unknown,
    Handheld,
    Handsfree,
    Car,
    Intent
};

inline std::string ContextToString(CaptureContext ctx) {
    switch (ctx) {
        case CaptureContext::Handheld: return "handheld";
        case CaptureContext::Handsfree: return "handsfree";
        case CaptureContext::Car: return "carplay";
        case CaptureContext::Intent: return "intent";
        default: return "unknown";
    }
}

inline CaptureContext ContextFromString(const std::string& raw) {
    if (raw == "handheld") return CaptureContext::Handheld;
    if (raw == "handsfree") return CaptureContext::Handsfree;
    if (raw == "carplay") return CaptureContext::Car;
    if (raw == "intent") return CaptureContext::Intent;
    return CaptureContext::Unknown;
}

enum class TranscriptionProvider {
    Unknown,
    OnDevice,
    Server
};

inline std::string TranscriptionProviderToString(TranscriptionProvider p) {
    switch (p) {
        case TranscriptionProvider::OnDevice: return "onDevice";
        case TranscriptionProvider::Server: return "server";
        default: return "unknown";
    }
}

inline TranscriptionProvider TranscriptionProviderFromString(const std::string& raw) {
    if (raw == "onDevice") return TranscriptionProvider::OnDevice;
    if (raw == "server") return TranscriptionProvider::Server;
    return TranscriptionProvider::Unknown;
}

enum class ReflectProvider {
    None,
    OnDevice,
    Gateway
};

inline std::string ReflectProviderToString(ReflectProvider p) {
    switch (p) {
        case ReflectProvider::OnDevice: return "onDevice";
        case ReflectProvider::Gateway: return "gateway";
        default: return "none";
    }
}

inline ReflectProvider ReflectProviderFromString(const std::string& raw) {
    if (raw == "onDevice") return ReflectProvider::OnDevice;
    if (raw == "gateway") return ReflectProvider::Gateway;
    return ReflectProvider::None;
}

/**
 * @enum ReflectTool
 * @brief Single-shot tools offered by the remote reasoning service.
 */
enum class ReflectTool {
    Reflect,
    Options,
    Questions,
    Perspective
};

inline std::string ToolToString(ReflectTool tool) {
    switch (tool) {
        case ReflectTool::Reflect: return "reflect";
        case ReflectTool::Options: return "options";
        case ReflectTool::Questions: return "questions";
        case ReflectTool::Perspective: return "perspective";
        default: return "reflect";
    }
}

inline std::optional<ReflectTool> ToolFromString(const std::string& raw) {
    if (raw == "reflect") return ReflectTool::Reflect;
    if (raw == "options") return ReflectTool::Options;
    if (raw == "questions") return ReflectTool::Questions;
    if (raw == "perspective") return ReflectTool::Perspective;
    return std::nullopt;
}

/**
 * @struct TurnError
 * @brief Failure details. Present on a Turn if and only if its state is Failed.
 */
struct TurnError {
    std::string domain;
    int code = 0;
    std::optional<std::string> userFacingKey;
    std::optional<std::string> debugMessage;
};

} // namespace reflectcore::domain::turn
