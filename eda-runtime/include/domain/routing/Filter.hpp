#pragma once

#include "domain/Event.hpp"
#include "domain/routing/SqlExpression.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace eda::domain::routing {

/**
 * @brief Фильтр событий в духе CloudEvents Subscriptions API
 *
 * Диалекты: exact, prefix, suffix, all, any, not, sql.
 * Фильтр по атрибуту, которого нет у события, не совпадает.
 */
class Filter {
public:
    virtual ~Filter() = default;

    virtual bool matches(const Event& event) const = 0;

    /**
     * @brief Имя диалекта (для логов)
     */
    virtual std::string dialect() const = 0;
};

using FilterPtr = std::shared_ptr<const Filter>;

/**
 * @brief Все перечисленные атрибуты равны заданным значениям
 */
class ExactFilter : public Filter {
public:
    explicit ExactFilter(std::map<std::string, std::string> attributes);

    bool matches(const Event& event) const override;
    std::string dialect() const override { return "exact"; }

private:
    std::map<std::string, std::string> attributes_;
};

class PrefixFilter : public Filter {
public:
    explicit PrefixFilter(std::map<std::string, std::string> attributes);

    bool matches(const Event& event) const override;
    std::string dialect() const override { return "prefix"; }

private:
    std::map<std::string, std::string> attributes_;
};

class SuffixFilter : public Filter {
public:
    explicit SuffixFilter(std::map<std::string, std::string> attributes);

    bool matches(const Event& event) const override;
    std::string dialect() const override { return "suffix"; }

private:
    std::map<std::string, std::string> attributes_;
};

/**
 * @brief Конъюнкция вложенных фильтров
 */
class AllFilter : public Filter {
public:
    explicit AllFilter(std::vector<FilterPtr> filters);

    bool matches(const Event& event) const override;
    std::string dialect() const override { return "all"; }

private:
    std::vector<FilterPtr> filters_;
};

/**
 * @brief Дизъюнкция вложенных фильтров
 */
class AnyFilter : public Filter {
public:
    explicit AnyFilter(std::vector<FilterPtr> filters);

    bool matches(const Event& event) const override;
    std::string dialect() const override { return "any"; }

private:
    std::vector<FilterPtr> filters_;
};

class NotFilter : public Filter {
public:
    explicit NotFilter(FilterPtr filter);

    bool matches(const Event& event) const override;
    std::string dialect() const override { return "not"; }

private:
    FilterPtr filter_;
};

/**
 * @brief Фильтр на выражении CESQL
 *
 * Ошибка вычисления (например, отсутствующий атрибут) даёт false.
 */
class SqlFilter : public Filter {
public:
    explicit SqlFilter(const std::string& expression);

    bool matches(const Event& event) const override;
    std::string dialect() const override { return "sql"; }

    const std::string& expression() const { return expression_.text(); }

private:
    SqlExpression expression_;
};

/**
 * @brief Фильтр, совпадающий с любым событием (правило без filter)
 */
class MatchAllFilter : public Filter {
public:
    bool matches(const Event&) const override { return true; }
    std::string dialect() const override { return "match-all"; }
};

} // namespace eda::domain::routing
