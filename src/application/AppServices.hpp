/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/ReflectionService.hpp"
#include "application/TeachingStepsService.hpp"
#include "application/TurnLifecycleService.hpp"
#include "application/capsule/CapsuleService.hpp"
#include "application/learning/PatternLearningService.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/RedactionDictionaryStore.hpp"

namespace reflectcore::application {

struct AppServices {
    std::shared_ptr<TurnLifecycleService> turnLifecycle;
    std::shared_ptr<learning::PatternLearningService> patternLearning;
    std::shared_ptr<capsule::CapsuleService> capsuleService;
    std::shared_ptr<ReflectionService> reflectionService;
    std::unique_ptr<TeachingStepsService> teachingSteps;
    std::shared_ptr<infrastructure::RedactionDictionaryStore> dictionaryStore;
    std::shared_ptr<infrastructure::PersistenceService> persistenceService;
};

} // namespace reflectcore::application
