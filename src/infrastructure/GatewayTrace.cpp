/**
 * @file GatewayTrace.cpp
 * @brief Implementation of GatewayTrace.
 */

#include "infrastructure/GatewayTrace.hpp"
#include <iostream>
#include <sstream>
#include "domain/Fingerprint.hpp"
#include "domain/TextUtils.hpp"

namespace reflectcore::infrastructure {

std::string GatewayTrace::Summarize(const std::optional<domain::capsule::ExportSnapshot>& capsule) {
    if (!capsule) return "no-capsule";

    std::ostringstream out;
    out << "prefs=" << capsule->preferences.size()
        << " cues=" << (capsule->learnedCues ? capsule->learnedCues->size() : 0)
        << " keys=";
    std::size_t n = 0;
    for (const auto& [key, _] : capsule->preferences) {
        if (n == kMaxSummaryKeys) break;
        if (n > 0) out << ',';
        out << key;
        ++n;
    }
    return out.str();
}

void GatewayTrace::request(const std::string& endpoint, const std::string& body,
                           const std::optional<domain::capsule::ExportSnapshot>& capsule) const noexcept {
    if (!m_enabled) return;
    try {
        std::string summary = body.empty() ? "no-body" : Summarize(capsule);
        std::cout << "[GatewayTrace] -> " << endpoint
                  << " fp=" << domain::Fingerprint(body)
                  << " " << summary << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[GatewayTrace] " << e.what() << std::endl;
    }
}

void GatewayTrace::response(const std::string& endpoint, int status, const std::string& body) const noexcept {
    if (!m_enabled) return;
    try {
        std::cout << "[GatewayTrace] <- " << endpoint << " status=" << status
                  << " fp=" << domain::Fingerprint(body)
                  << " snippet=" << domain::TruncateUtf8(body, kResponseSnippetLength) << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[GatewayTrace] " << e.what() << std::endl;
    }
}

} // namespace reflectcore::infrastructure
