/**
 * @file GatewayTrace.hpp
 * @brief Opt-in diagnostics for gateway traffic. Logs fingerprints and counts, never request text.
 */

#pragma once

#include <optional>
#include <string>
#include "domain/capsule/ExportSnapshot.hpp"

namespace reflectcore::infrastructure {

class GatewayTrace {
public:
    static constexpr std::size_t kMaxSummaryKeys = 10;
    static constexpr std::size_t kResponseSnippetLength = 400;

    explicit GatewayTrace(bool enabled) : m_enabled(enabled) {}

    /**
     * @brief "prefs=N cues=M keys=a,b,..." (first 10 preference keys), or "no-capsule".
     */
    static std::string Summarize(const std::optional<domain::capsule::ExportSnapshot>& capsule);

    void request(const std::string& endpoint, const std::string& body,
                 const std::optional<domain::capsule::ExportSnapshot>& capsule) const noexcept;
    void response(const std::string& endpoint, int status, const std::string& body) const noexcept;

    bool isEnabled() const { return m_enabled; }

private:
    bool m_enabled;
};

} // namespace reflectcore::infrastructure
