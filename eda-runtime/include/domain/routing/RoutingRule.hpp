#pragma once

#include "domain/OutputDestination.hpp"
#include "domain/routing/Filter.hpp"
#include <string>

namespace eda::domain::routing {

/**
 * @brief Правило маршрутизации: фильтр -> приёмник
 */
struct RoutingRule {
    std::string name;
    FilterPtr filter;
    OutputDestination destination;
};

} // namespace eda::domain::routing
