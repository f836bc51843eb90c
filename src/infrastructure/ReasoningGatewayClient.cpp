/**
 * @file ReasoningGatewayClient.cpp
 * @brief Implementation of ReasoningGatewayClient.
 */

#include "infrastructure/ReasoningGatewayClient.hpp"
#include <cctype>
#include <cstdio>
#include <iostream>
#include <httplib.h>
#include "domain/gateway/GatewayErrors.hpp"
#include "infrastructure/JsonMapping.hpp"

namespace reflectcore::infrastructure {

using domain::gateway::GatewayDecodeError;
using domain::gateway::GatewayHttpError;
using domain::gateway::GatewayNetworkError;
using domain::gateway::GatewayUnavailableError;
using domain::gateway::StepsLane;
using domain::turn::ReflectTool;

namespace {

bool IsEndpointName(const std::string& component) {
    return component.rfind("reasoning-", 0) == 0 ||
           (component.size() > 6 && component.compare(component.size() - 6, 6, "-steps") == 0);
}

std::string PercentEncode(const std::string& raw) {
    std::string out;
    for (unsigned char c : raw) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

httplib::Headers AuthHeaders(const std::string& key) {
    return {
        {"Accept", "application/json"},
        {"Authorization", "Bearer " + key},
        {"apikey", key}
    };
}

json ParseBody(const std::string& body) {
    try {
        return json::parse(body);
    } catch (const json::exception& e) {
        throw GatewayDecodeError(e.what());
    }
}

} // namespace

ReasoningGatewayClient::ReasoningGatewayClient(GatewaySettings settings)
    : m_settings(std::move(settings)), m_trace(m_settings.trace) {}

bool ReasoningGatewayClient::isAvailable() const {
    return m_settings.isConfigured() && ResolveEndpoint(m_settings.baseUrl, "reasoning-reflect").has_value();
}

std::string ReasoningGatewayClient::EndpointFor(ReflectTool tool) {
    switch (tool) {
        case ReflectTool::Options: return "reasoning-options";
        case ReflectTool::Questions: return "reasoning-questions";
        case ReflectTool::Perspective: return "reasoning-perspective";
        default: return "reasoning-reflect";
    }
}

std::string ReasoningGatewayClient::StepsEndpointFor(StepsLane lane) {
    return domain::gateway::LaneToString(lane) + "-steps";
}

std::string ReasoningGatewayClient::DefaultProgramme(StepsLane lane) {
    return lane == StepsLane::Reflect ? "starter_5day" : "core";
}

std::optional<EndpointTarget> ReasoningGatewayClient::ResolveEndpoint(const std::string& baseUrl,
                                                                      const std::string& endpoint) {
    auto schemeEnd = baseUrl.find("://");
    if (schemeEnd == std::string::npos) return std::nullopt;
    std::string scheme = baseUrl.substr(0, schemeEnd);
    if (scheme != "http" && scheme != "https") return std::nullopt;

    auto pathStart = baseUrl.find('/', schemeEnd + 3);
    std::string origin = baseUrl.substr(0, pathStart);
    if (origin.size() <= schemeEnd + 3) return std::nullopt;

    std::string path = pathStart == std::string::npos ? "" : baseUrl.substr(pathStart);
    auto query = path.find_first_of("?#");
    if (query != std::string::npos) path.erase(query);
    while (!path.empty() && path.back() == '/') path.pop_back();

    auto lastSlash = path.rfind('/');
    if (lastSlash != std::string::npos && IsEndpointName(path.substr(lastSlash + 1))) {
        path.erase(lastSlash);
    }
    return EndpointTarget{origin, path + "/" + endpoint};
}

EndpointTarget ReasoningGatewayClient::target(const std::string& endpoint) const {
    if (!m_settings.isConfigured()) throw GatewayUnavailableError();
    auto resolved = ResolveEndpoint(m_settings.baseUrl, endpoint);
    if (!resolved) {
        std::cerr << "[ReasoningGateway] Invalid base URL" << std::endl;
        throw GatewayUnavailableError();
    }
    return *resolved;
}

std::string ReasoningGatewayClient::post(const std::string& endpoint, const std::string& body,
                                         const std::optional<domain::capsule::ExportSnapshot>& capsule) {
    EndpointTarget t = target(endpoint);

    httplib::Client cli(t.origin);
    if (!cli.is_valid()) throw GatewayUnavailableError();
    cli.set_connection_timeout(kConnectTimeoutSeconds);
    cli.set_read_timeout(kGenerativeTimeoutSeconds);
    cli.set_write_timeout(kGenerativeTimeoutSeconds);

    m_trace.request(endpoint, body, capsule);
    auto res = cli.Post(t.path, AuthHeaders(m_settings.anonKey), body, "application/json");
    if (!res) {
        std::cerr << "[ReasoningGateway] " << endpoint << " connection failed: "
                  << static_cast<int>(res.error()) << std::endl;
        throw GatewayNetworkError("error " + std::to_string(static_cast<int>(res.error())));
    }
    m_trace.response(endpoint, res->status, res->body);
    if (res->status < 200 || res->status >= 300) {
        std::cerr << "[ReasoningGateway] " << endpoint << " HTTP " << res->status << std::endl;
        throw GatewayHttpError(res->status, res->body);
    }
    return res->body;
}

std::string ReasoningGatewayClient::get(const std::string& endpoint, const std::string& query) {
    EndpointTarget t = target(endpoint);

    httplib::Client cli(t.origin);
    if (!cli.is_valid()) throw GatewayUnavailableError();
    cli.set_connection_timeout(kConnectTimeoutSeconds);
    cli.set_read_timeout(kListTimeoutSeconds);

    std::string path = query.empty() ? t.path : t.path + "?" + query;
    m_trace.request(endpoint, "", std::nullopt);
    auto res = cli.Get(path, AuthHeaders(m_settings.anonKey));
    if (!res) {
        std::cerr << "[ReasoningGateway] " << endpoint << " connection failed: "
                  << static_cast<int>(res.error()) << std::endl;
        throw GatewayNetworkError("error " + std::to_string(static_cast<int>(res.error())));
    }
    m_trace.response(endpoint, res->status, res->body);
    if (res->status < 200 || res->status >= 300) {
        std::cerr << "[ReasoningGateway] " << endpoint << " HTTP " << res->status << std::endl;
        throw GatewayHttpError(res->status, res->body);
    }
    return res->body;
}

domain::gateway::ReflectResponse ReasoningGatewayClient::runTool(ReflectTool tool,
                                                                 const domain::gateway::ReflectRequest& request) {
    std::string body = ReflectRequestToWireJson(request).dump(-1, ' ', false, json::error_handler_t::replace);
    return ReflectResponseFromWireJson(ParseBody(post(EndpointFor(tool), body, request.capsule)));
}

domain::gateway::TalkResponse ReasoningGatewayClient::talkItThrough(const domain::gateway::TalkRequest& request) {
    std::string body = TalkRequestToWireJson(request).dump(-1, ' ', false, json::error_handler_t::replace);
    return TalkResponseFromWireJson(ParseBody(post("reasoning-talk", body, request.capsule)));
}

domain::gateway::StepsResponse ReasoningGatewayClient::fetchSteps(StepsLane lane, const std::string& programme) {
    std::string slug = programme.empty() ? DefaultProgramme(lane) : programme;
    return StepsResponseFromWireJson(ParseBody(get(StepsEndpointFor(lane), "programme=" + PercentEncode(slug))));
}

} // namespace reflectcore::infrastructure
