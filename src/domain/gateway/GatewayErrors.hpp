/**
 * @file GatewayErrors.hpp
 * @brief Failures of the remote reasoning boundary. Callers fall back to local content.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace reflectcore::domain::gateway {

class GatewayError : public std::runtime_error {
public:
    explicit GatewayError(const std::string& msg) : std::runtime_error(msg) {}
};

/// Missing or invalid remote configuration. No request was attempted.
class GatewayUnavailableError : public GatewayError {
public:
    GatewayUnavailableError() : GatewayError("Reasoning gateway is not configured") {}
};

/// Non-2xx response. Not retried.
class GatewayHttpError : public GatewayError {
public:
    GatewayHttpError(int status, std::string body)
        : GatewayError("Reasoning gateway HTTP " + std::to_string(status)),
          m_status(status), m_body(std::move(body)) {}

    int getStatus() const { return m_status; }
    const std::string& getBody() const { return m_body; }

private:
    int m_status;
    std::string m_body;
};

/// Response body did not match the expected shape.
class GatewayDecodeError : public GatewayError {
public:
    explicit GatewayDecodeError(const std::string& detail)
        : GatewayError("Reasoning gateway decode error: " + detail) {}
};

class GatewayNetworkError : public GatewayError {
public:
    explicit GatewayNetworkError(const std::string& detail)
        : GatewayError("Reasoning gateway network error: " + detail) {}
};

} // namespace reflectcore::domain::gateway
