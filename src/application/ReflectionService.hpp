/**
 * @file ReflectionService.hpp
 * @brief Sends a Turn's redacted transcript and the capsule snapshot to the reasoning gateway.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include "application/TurnLifecycleService.hpp"
#include "application/capsule/CapsuleService.hpp"
#include "domain/gateway/ReasoningGateway.hpp"

namespace reflectcore::application {

using domain::turn::ReflectTool;

struct ReflectionResult {
    std::string text;
    std::string promptVersion;
    bool usedFallback = false;   ///< Local content; not written to the Turn.
};

/**
 * @class ReflectionService
 * @brief Builds outbound requests from the canonical (redacted) transcript only.
 *
 * Remote results are recorded on the Turn through the lifecycle service together with the
 * snapshot fingerprint. Gateway failures of any kind yield local fallback text instead of an
 * error; local failures (unknown id, empty transcript, storage) propagate.
 */
class ReflectionService {
public:
    static constexpr const char* kFallbackPromptVersion = "local-fallback";

    ReflectionService(std::shared_ptr<TurnLifecycleService> lifecycle,
                      std::shared_ptr<capsule::CapsuleService> capsule,
                      std::shared_ptr<domain::gateway::ReasoningGateway> gateway,
                      std::string client,
                      std::string appVersion);

    /**
     * @throws domain::NotFoundError for an unknown id.
     * @throws domain::ValidationError if the Turn has no redacted transcript yet.
     */
    ReflectionResult runTool(const std::string& turnId, ReflectTool tool);

    /**
     * @brief Continues the Turn's talk thread. The previous response id stored on the Turn is
     * forwarded unmodified.
     * @throws domain::ValidationError for a blank message.
     */
    ReflectionResult talk(const std::string& turnId, const std::string& message);

    static std::string FallbackFor(ReflectTool tool);
    static std::string TalkFallback();

private:
    Turn requireTranscript(const std::string& turnId);

    std::shared_ptr<TurnLifecycleService> m_lifecycle;
    std::shared_ptr<capsule::CapsuleService> m_capsule;
    std::shared_ptr<domain::gateway::ReasoningGateway> m_gateway;
    std::string m_client;
    std::string m_appVersion;
};

} // namespace reflectcore::application
