/**
 * @file ReasoningGateway.hpp
 * @brief Request/response boundary to the remote reasoning service.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "domain/capsule/ExportSnapshot.hpp"
#include "domain/turn/TurnTypes.hpp"

namespace reflectcore::domain::gateway {

struct ReflectRequest {
    std::string text;                           ///< Redacted transcript only.
    std::optional<std::string> recordedAtISO;
    std::string client;
    std::string appVersion;
    std::optional<capsule::ExportSnapshot> capsule;
};

struct ReflectResponse {
    std::string text;
    std::string promptVersion;
};

struct TalkRequest {
    std::string text;
    std::optional<std::string> recordedAtISO;
    std::string client;
    std::string appVersion;
    std::optional<std::string> previousResponseId;  ///< Forwarded unmodified.
    std::optional<capsule::ExportSnapshot> capsule;
};

struct TalkResponse {
    std::string text;
    std::string responseId;
    std::string promptVersion;
};

enum class StepsLane {
    Reflect,
    Focus,
    Practice
};

inline std::string LaneToString(StepsLane lane) {
    switch (lane) {
        case StepsLane::Focus: return "focus";
        case StepsLane::Practice: return "practice";
        default: return "reflect";
    }
}

struct TeachingStep {
    int stepIndex = 0;
    std::string title;
    std::string body;
    std::vector<std::string> tags;
    std::optional<int> version;
};

struct StepsResponse {
    std::string programmeSlug;
    int count = 0;
    int maxVersion = 0;
    std::vector<TeachingStep> steps;
};

/**
 * @class ReasoningGateway
 * @brief Abstract remote reasoning service.
 *
 * Every call may block for network latency. Implementations throw a GatewayError
 * subclass on failure.
 */
class ReasoningGateway {
public:
    virtual ~ReasoningGateway() = default;

    /**
     * @brief True if configuration is present. When false, calls throw GatewayUnavailableError.
     */
    virtual bool isAvailable() const = 0;

    /**
     * @brief Runs one single-shot tool over the request text.
     */
    virtual ReflectResponse runTool(turn::ReflectTool tool, const ReflectRequest& request) = 0;

    /**
     * @brief Multi-turn continuation.
     */
    virtual TalkResponse talkItThrough(const TalkRequest& request) = 0;

    /**
     * @brief Fetches a teaching content list for a programme.
     */
    virtual StepsResponse fetchSteps(StepsLane lane, const std::string& programme) = 0;
};

} // namespace reflectcore::domain::gateway
