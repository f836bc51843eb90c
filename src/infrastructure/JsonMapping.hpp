/**
 * @file JsonMapping.hpp
 * @brief nlohmann::json mapping for persisted records and the gateway wire format.
 *
 * Storage timestamps are epoch milliseconds ("..._ms"); wire timestamps are ISO-8601 strings.
 */

#pragma once

#include <nlohmann/json.hpp>
#include "domain/capsule/Capsule.hpp"
#include "domain/capsule/ExportSnapshot.hpp"
#include "domain/gateway/ReasoningGateway.hpp"
#include "domain/learning/PatternStat.hpp"
#include "domain/redaction/RedactionDictionary.hpp"
#include "domain/turn/RedactionRecord.hpp"
#include "domain/turn/Turn.hpp"

namespace reflectcore::infrastructure {

using json = nlohmann::json;

// Persistence
json TurnToJson(const domain::turn::Turn& turn);
domain::turn::Turn TurnFromJson(const json& j);

json RedactionRecordToJson(const domain::turn::RedactionRecord& record);
domain::turn::RedactionRecord RedactionRecordFromJson(const json& j);

json PatternStatToJson(const domain::learning::PatternStat& stat);
/// Returns nullopt for rows with an unknown kind.
std::optional<domain::learning::PatternStat> PatternStatFromJson(const json& j);

json CapsuleToJson(const domain::capsule::Capsule& capsule);
domain::capsule::Capsule CapsuleFromJson(const json& j);

json DictionaryToJson(const domain::redaction::RedactionDictionary& dict);
domain::redaction::RedactionDictionary DictionaryFromJson(const json& j);

// Wire
json SnapshotToWireJson(const domain::capsule::ExportSnapshot& snapshot);
json ReflectRequestToWireJson(const domain::gateway::ReflectRequest& request);
json TalkRequestToWireJson(const domain::gateway::TalkRequest& request);

/// Throws GatewayDecodeError if required fields are missing.
domain::gateway::ReflectResponse ReflectResponseFromWireJson(const json& j);
domain::gateway::TalkResponse TalkResponseFromWireJson(const json& j);
domain::gateway::StepsResponse StepsResponseFromWireJson(const json& j);

} // namespace reflectcore::infrastructure
