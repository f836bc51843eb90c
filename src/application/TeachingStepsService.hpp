/**
 * @file TeachingStepsService.hpp
 * @brief Remote-first teaching content lists with a bundled local seed.
 */

#pragma once

#include <memory>
#include <optional>
#include <utility>
#include <string>
#include <vector>
#include "domain/gateway/ReasoningGateway.hpp"

namespace reflectcore::application {

using domain::gateway::StepsLane;

struct Teaching {
    int stepIndex = 0;
    std::string title;
    std::string body;
    std::string prompt;     ///< Empty when the step has no reflection prompt.
};

struct TeachingList {
    std::string programme;
    std::vector<Teaching> teachings;
    bool fromRemote = false;
};

class TeachingStepsService {
public:
    explicit TeachingStepsService(std::shared_ptr<domain::gateway::ReasoningGateway> gateway);

    /**
     * @brief Fetches the programme's steps ordered by step index. Falls back to the local seed
     * when the gateway is unavailable, fails, or returns no steps.
     */
    TeachingList fetch(StepsLane lane, const std::string& programme = "");

    /**
     * @brief Splits "<body>\n\nPrompt: <prompt>" into its two parts.
     */
    static std::pair<std::string, std::string> SplitBodyAndPrompt(const std::string& body);

    static std::vector<Teaching> LocalSeed();

private:
    std::shared_ptr<domain::gateway::ReasoningGateway> m_gateway;
};

} // namespace reflectcore::application
