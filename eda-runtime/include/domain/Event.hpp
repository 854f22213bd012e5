#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>

namespace eda::domain {

/**
 * @brief Событие в формате CloudEvents v1.0
 *
 * Единый конверт для входящих и исходящих событий.
 * Передаётся по значению: каждая граница (декодер, handler, роутер)
 * получает собственную копию.
 *
 * Обязательные атрибуты: id, type, source.
 * Атрибуты-расширения хранят исходный JSON-тип (string, integer, boolean)
 * и в исходящий конверт записываются с тем же типом. Фильтры видят их
 * строковую форму.
 */
class Event {
public:
    std::string id;
    std::string type;
    std::string source;
    std::string specVersion = "1.0";
    std::optional<std::string> time;
    std::optional<std::string> dataContentType;
    std::optional<std::string> dataSchema;
    std::optional<std::string> subject;
    std::optional<nlohmann::json> data;
    std::optional<std::string> dataBase64;
    std::map<std::string, nlohmann::json> extensions;

    Event() = default;

    Event(std::string id, std::string type, std::string source)
        : id(std::move(id))
        , type(std::move(type))
        , source(std::move(source))
    {}

    /**
     * @brief Получить значение атрибута по имени
     *
     * Ищет среди атрибутов контекста (id, type, source, ...) и расширений.
     * Атрибут data не является атрибутом контекста.
     *
     * @return Значение или std::nullopt, если атрибут не задан
     */
    std::optional<std::string> attribute(const std::string& name) const;

    /**
     * @brief Сериализовать в JSON (structured mode)
     */
    nlohmann::json toJson() const;

    /**
     * @brief Создать событие из JSON-конверта
     * @throws std::invalid_argument если конверт не является CloudEvent
     */
    static Event fromJson(const nlohmann::json& json);
};

} // namespace eda::domain
