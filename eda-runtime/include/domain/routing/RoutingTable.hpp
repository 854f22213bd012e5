#pragma once

#include "domain/Event.hpp"
#include "domain/OutputDestination.hpp"
#include "domain/routing/RoutingRule.hpp"
#include <vector>

namespace eda::domain::routing {

/**
 * @brief Упорядоченный набор правил маршрутизации
 *
 * Правила проверяются по порядку, выигрывает первое совпавшее.
 * Если ни одно не совпало - используется приёмник по умолчанию.
 */
class RoutingTable {
public:
    explicit RoutingTable(OutputDestination defaultDestination,
                          std::vector<RoutingRule> rules = {})
        : defaultDestination_(std::move(defaultDestination))
        , rules_(std::move(rules))
    {}

    const OutputDestination& resolve(const Event& event) const {
        for (const auto& rule : rules_) {
            if (rule.filter && rule.filter->matches(event)) {
                return rule.destination;
            }
        }
        return defaultDestination_;
    }

    /**
     * @brief Имя совпавшего правила или пустая строка для default
     */
    std::string matchedRule(const Event& event) const {
        for (const auto& rule : rules_) {
            if (rule.filter && rule.filter->matches(event)) {
                return rule.name;
            }
        }
        return "";
    }

    const OutputDestination& defaultDestination() const { return defaultDestination_; }
    const std::vector<RoutingRule>& rules() const { return rules_; }
    size_t ruleCount() const { return rules_.size(); }

private:
    OutputDestination defaultDestination_;
    std::vector<RoutingRule> rules_;
};

} // namespace eda::domain::routing
