#pragma once

#include "domain/OutputDestination.hpp"
#include "domain/routing/Filter.hpp"
#include "domain/routing/RoutingTable.hpp"
#include <string>

namespace YAML {
class Node;
}

namespace eda::adapters::secondary {

/**
 * @brief Загрузка таблицы маршрутизации из YAML
 *
 * Формат:
 * ```yaml
 * routing:
 *   default: { type: broker, target: events, cluster: default }
 *   rules:
 *     - name: orders
 *       filter:
 *         all:
 *           - prefix: { type: order. }
 *           - sql: "source = '/shop'"
 *       destination: { type: broker, target: orders }
 * ```
 *
 * Правило без filter совпадает с любым событием.
 * Если default не задан, используется fallbackDefault.
 */
class RoutingConfigLoader {
public:
    /**
     * @throws domain::ConfigurationError при ошибке чтения или разбора
     */
    static domain::routing::RoutingTable loadFile(const std::string& path,
                                                  const domain::OutputDestination& fallbackDefault);

    /**
     * @throws domain::ConfigurationError при ошибке разбора
     */
    static domain::routing::RoutingTable loadString(const std::string& yaml,
                                                    const domain::OutputDestination& fallbackDefault);

private:
    static domain::routing::RoutingTable parse(const YAML::Node& root,
                                               const domain::OutputDestination& fallbackDefault);
    static domain::OutputDestination parseDestination(const YAML::Node& node, const std::string& where);
    static domain::routing::FilterPtr parseFilter(const YAML::Node& node, const std::string& where);
};

} // namespace eda::adapters::secondary
