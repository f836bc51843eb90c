/**
 * @file TeachingStepsService.cpp
 * @brief Implementation of TeachingStepsService.
 */

#include "application/TeachingStepsService.hpp"
#include <algorithm>
#include <iostream>
#include "domain/TextUtils.hpp"
#include "domain/gateway/GatewayErrors.hpp"

namespace reflectcore::application {

TeachingStepsService::TeachingStepsService(std::shared_ptr<domain::gateway::ReasoningGateway> gateway)
    : m_gateway(std::move(gateway)) {}

TeachingList TeachingStepsService::fetch(StepsLane lane, const std::string& programme) {
    TeachingList list;
    list.programme = programme;

    if (m_gateway && m_gateway->isAvailable()) {
        try {
            auto response = m_gateway->fetchSteps(lane, programme);
            auto steps = response.steps;
            std::sort(steps.begin(), steps.end(),
                      [](const auto& a, const auto& b) { return a.stepIndex < b.stepIndex; });
            for (const auto& step : steps) {
                auto [body, prompt] = SplitBodyAndPrompt(step.body);
                list.teachings.push_back({step.stepIndex, step.title, body, prompt});
            }
            if (!list.teachings.empty()) {
                list.programme = response.programmeSlug;
                list.fromRemote = true;
                std::cout << "[TeachingSteps] Loaded " << list.teachings.size() << " "
                          << domain::gateway::LaneToString(lane) << " steps" << std::endl;
                return list;
            }
        } catch (const domain::gateway::GatewayError& e) {
            std::cerr << "[TeachingSteps] Fetch failed, using local seed: " << e.what() << std::endl;
        }
    }

    list.teachings = LocalSeed();
    return list;
}

std::pair<std::string, std::string> TeachingStepsService::SplitBodyAndPrompt(const std::string& body) {
    static const std::string marker = "\n\nPrompt:";
    auto pos = body.find(marker);
    if (pos == std::string::npos) {
        return {domain::Trim(body), ""};
    }
    return {domain::Trim(body.substr(0, pos)), domain::Trim(body.substr(pos + marker.size()))};
}

std::vector<Teaching> TeachingStepsService::LocalSeed() {
    return {
        {0, "Training attention",
         "Notice where the mind goes when nothing is directing it.\n"
         "Nothing needs stopping or improving.\n"
         "Watch how it moves by itself.",
         "What do you notice about how your attention moves?"},
        {1, "Working with change",
         "Whatever appears also changes: thoughts, moods and situations alike.\n"
         "Nothing has to be held in place.",
         "Where do you notice change happening right now?"},
        {2, "Softening effort",
         "We often add effort on top of experience.\n"
         "See what happens when that effort relaxes a little.",
         "What eases when effort softens?"}
    };
}

} // namespace reflectcore::application
