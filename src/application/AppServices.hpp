/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/DefenseService.hpp"
#include "application/PracticeService.hpp"

namespace mindshield::application {

struct AppServices {
    std::unique_ptr<DefenseService> defenseService;
    std::unique_ptr<PracticeService> practiceService;
};

} // namespace mindshield::application
