/**
 * @file ReflectionService.cpp
 * @brief Implementation of ReflectionService.
 */

#include "application/ReflectionService.hpp"
#include <iostream>
#include "application/capsule/SnapshotExporter.hpp"
#include "domain/DomainErrors.hpp"
#include "domain/TextUtils.hpp"
#include "domain/gateway/GatewayErrors.hpp"

namespace reflectcore::application {

using capsule::SnapshotExporter;
using domain::NotFoundError;
using domain::ValidationError;
using domain::capsule::CapsuleMode;
using domain::gateway::GatewayError;

ReflectionService::ReflectionService(std::shared_ptr<TurnLifecycleService> lifecycle,
                                     std::shared_ptr<capsule::CapsuleService> capsule,
                                     std::shared_ptr<domain::gateway::ReasoningGateway> gateway,
                                     std::string client,
                                     std::string appVersion)
    : m_lifecycle(std::move(lifecycle)),
      m_capsule(std::move(capsule)),
      m_gateway(std::move(gateway)),
      m_client(std::move(client)),
      m_appVersion(std::move(appVersion)) {}

Turn ReflectionService::requireTranscript(const std::string& turnId) {
    auto turn = m_lifecycle->get(turnId);
    if (!turn) {
        throw NotFoundError("Turn not found: " + turnId);
    }
    if (domain::IsBlank(turn->transcriptRedactedActive)) {
        throw ValidationError("Turn has no transcript yet");
    }
    return *turn;
}

ReflectionResult ReflectionService::runTool(const std::string& turnId, ReflectTool tool) {
    Turn turn = requireTranscript(turnId);

    auto snapshot = SnapshotExporter::project(m_capsule->get(), CapsuleMode::Reflect);
    std::string snapshotHash = SnapshotExporter::fingerprint(snapshot);

    domain::gateway::ReflectRequest request;
    request.text = turn.transcriptRedactedActive;
    request.recordedAtISO = domain::ToIso8601(turn.recordedAt);
    request.client = m_client;
    request.appVersion = m_appVersion;
    request.capsule = std::move(snapshot);

    if (!m_gateway || !m_gateway->isAvailable()) {
        std::cout << "[ReflectionService] Gateway unavailable, using local " << ToolToString(tool) << std::endl;
        return {FallbackFor(tool), kFallbackPromptVersion, true};
    }

    try {
        auto response = m_gateway->runTool(tool, request);
        m_lifecycle->recordToolOutput(turnId, tool, response.text, response.promptVersion, snapshotHash);
        return {response.text, response.promptVersion, false};
    } catch (const GatewayError& e) {
        std::cerr << "[ReflectionService] " << ToolToString(tool) << " failed, using local content: "
                  << e.what() << std::endl;
        return {FallbackFor(tool), kFallbackPromptVersion, true};
    }
}

ReflectionResult ReflectionService::talk(const std::string& turnId, const std::string& message) {
    std::string text = domain::Trim(message);
    if (text.empty()) {
        throw ValidationError("Message is empty");
    }
    Turn turn = requireTranscript(turnId);

    auto snapshot = SnapshotExporter::project(m_capsule->get(), CapsuleMode::Talk);
    std::string snapshotHash = SnapshotExporter::fingerprint(snapshot);

    domain::gateway::TalkRequest request;
    // The first exchange carries the transcript; later ones only the new message.
    request.text = turn.talkMessages.empty() ? turn.transcriptRedactedActive + "\n\n" + text : text;
    request.recordedAtISO = domain::ToIso8601(turn.recordedAt);
    request.client = m_client;
    request.appVersion = m_appVersion;
    request.previousResponseId = turn.talkLastResponseId;
    request.capsule = std::move(snapshot);

    if (!m_gateway || !m_gateway->isAvailable()) {
        std::cout << "[ReflectionService] Gateway unavailable, using local talk reply" << std::endl;
        return {TalkFallback(), kFallbackPromptVersion, true};
    }

    try {
        auto response = m_gateway->talkItThrough(request);
        std::optional<std::string> responseId;
        if (!response.responseId.empty()) responseId = response.responseId;
        m_lifecycle->recordTalkExchange(turnId, text, response.text, responseId, response.promptVersion, snapshotHash);
        return {response.text, response.promptVersion, false};
    } catch (const GatewayError& e) {
        std::cerr << "[ReflectionService] talk failed, using local content: " << e.what() << std::endl;
        return {TalkFallback(), kFallbackPromptVersion, true};
    }
}

std::string ReflectionService::FallbackFor(ReflectTool tool) {
    switch (tool) {
        case ReflectTool::Options:
            return "Options are not available offline.\n"
                   "- Name the smallest next step you could take today.\n"
                   "- Name one thing you could drop or postpone.\n"
                   "- Name one person who could help.";
        case ReflectTool::Questions:
            return "Questions are not available offline. Try one of these:\n"
                   "- What matters most here?\n"
                   "- What would make this 10% easier?\n"
                   "- What are you assuming that might not be true?";
        case ReflectTool::Perspective:
            return "Perspective is not available offline. Try describing the situation as a "
                   "friend would see it, then as you might see it a year from now.";
        default:
            return "Reflection is not available offline. Read your note back slowly and mark "
                   "the sentence that carries the most weight.";
    }
}

std::string ReflectionService::TalkFallback() {
    return "I can't reach the reasoning service right now. Your message was not sent; "
           "try again when you are back online.";
}

} // namespace reflectcore::application
