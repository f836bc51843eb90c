/**
 * @file ReasoningGatewayClient.hpp
 * @brief HTTP implementation of the reasoning gateway (cpp-httplib + nlohmann::json).
 */

#pragma once

#include <optional>
#include <string>
#include "domain/gateway/ReasoningGateway.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/GatewayTrace.hpp"

namespace reflectcore::infrastructure {

struct EndpointTarget {
    std::string origin;   ///< scheme://host[:port]
    std::string path;     ///< absolute path of the endpoint
};

/**
 * @class ReasoningGatewayClient
 * @brief POSTs JSON to the generative endpoints and GETs content lists.
 *
 * Every request carries "Authorization: Bearer <key>" and "apikey: <key>". Generative calls
 * time out after 90 s, content lists after 30 s. A new connection is opened per call.
 */
class ReasoningGatewayClient : public domain::gateway::ReasoningGateway {
public:
    static constexpr int kGenerativeTimeoutSeconds = 90;
    static constexpr int kListTimeoutSeconds = 30;
    static constexpr int kConnectTimeoutSeconds = 10;

    explicit ReasoningGatewayClient(GatewaySettings settings);

    bool isAvailable() const override;
    domain::gateway::ReflectResponse runTool(domain::turn::ReflectTool tool,
                                             const domain::gateway::ReflectRequest& request) override;
    domain::gateway::TalkResponse talkItThrough(const domain::gateway::TalkRequest& request) override;
    domain::gateway::StepsResponse fetchSteps(domain::gateway::StepsLane lane,
                                              const std::string& programme) override;

    static std::string EndpointFor(domain::turn::ReflectTool tool);
    static std::string StepsEndpointFor(domain::gateway::StepsLane lane);
    static std::string DefaultProgramme(domain::gateway::StepsLane lane);

    /**
     * @brief Splits the configured base URL and appends @p endpoint. If the base URL already
     * ends in an endpoint name (e.g. ".../reasoning-reflect"), that component is replaced.
     * @return nullopt if the base URL is not an http(s) URL.
     */
    static std::optional<EndpointTarget> ResolveEndpoint(const std::string& baseUrl, const std::string& endpoint);

private:
    std::string post(const std::string& endpoint, const std::string& body,
                     const std::optional<domain::capsule::ExportSnapshot>& capsule);
    std::string get(const std::string& endpoint, const std::string& query);
    EndpointTarget target(const std::string& endpoint) const;

    GatewaySettings m_settings;
    GatewayTrace m_trace;
};

} // namespace reflectcore::infrastructure
