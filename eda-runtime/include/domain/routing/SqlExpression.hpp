#pragma once

#include "domain/Event.hpp"
#include <memory>
#include <stdexcept>
#include <string>

namespace eda::domain::routing {

/**
 * @brief Синтаксическая ошибка в выражении CESQL
 */
class SqlSyntaxError : public std::invalid_argument {
public:
    explicit SqlSyntaxError(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * @brief Разобранное выражение CloudEvents SQL (CESQL v1)
 *
 * Поддерживаемое подмножество:
 * - литералы: 'строка', "строка", целые, TRUE, FALSE
 * - идентификаторы атрибутов: type, source, myextension, ...
 * - NOT, унарный минус, * / %, + -, = != <> < <= > >=
 * - [NOT] LIKE с шаблонами % и _, [NOT] IN (...), EXISTS attr
 * - AND, XOR, OR, скобки
 * - функции: LENGTH, CONCAT, LOWER, UPPER, TRIM, ABS, INT, BOOL, STRING
 *
 * Приоритет операторов соответствует грамматике CESQL: унарные
 * операторы связывают сильнее всех.
 *
 * @example
 * ```cpp
 * auto expr = SqlExpression::parse("type LIKE 'order.%' AND source = '/shop'");
 * if (expr.evaluate(event)) { ... }
 * ```
 */
class SqlExpression {
public:
    struct Node;

    /**
     * @throws SqlSyntaxError при ошибке разбора
     */
    static SqlExpression parse(const std::string& text);

    /**
     * @brief Вычислить выражение на событии
     *
     * Ошибки вычисления (нет атрибута, неприводимые типы,
     * деление на ноль) дают false.
     */
    bool evaluate(const Event& event) const;

    const std::string& text() const { return text_; }

private:
    SqlExpression(std::shared_ptr<const Node> root, std::string text)
        : root_(std::move(root))
        , text_(std::move(text))
    {}

    std::shared_ptr<const Node> root_;
    std::string text_;
};

} // namespace eda::domain::routing
