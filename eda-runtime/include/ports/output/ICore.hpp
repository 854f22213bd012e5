#pragma once

#include "domain/ConnectionConfig.hpp"
#include "domain/OutputDestination.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace eda::ports::output {

/**
 * @brief Контракт бэкенда решений (Core)
 *
 * Движок зависит только от этой абстракции. Реализации:
 * InProcessCore (по умолчанию) и NativeLibraryCore (C ABI через dlopen).
 *
 * Все методы при сбое бросают domain::CoreError.
 */
class ICore {
public:
    virtual ~ICore() = default;

    /**
     * @brief Параметры подключения к брокеру
     *
     * Вызывается один раз до любого обращения к брокеру.
     */
    virtual domain::ConnectionConfig getConnectionConfig() = 0;

    /**
     * @brief Повторять ли обработку после ошибки handler'а
     * @param errorMessage Текст ошибки
     * @param attempt Номер попытки (с 1)
     */
    virtual bool shouldRetry(const std::string& errorMessage, uint32_t attempt) = 0;

    /**
     * @brief Задержка перед повтором, миллисекунды
     */
    virtual uint64_t calculateBackoff(uint32_t attempt) = 0;

    /**
     * @brief Куда отправить выходное событие
     * @param eventJson Сериализованный конверт CloudEvent
     */
    virtual domain::OutputDestination getOutputDestination(const std::string& eventJson) = 0;

    /**
     * @brief Загрузить правила маршрутизации из YAML-файла
     */
    virtual void loadRoutingConfig(const std::string& path) = 0;

    /**
     * @brief Освободить ресурсы бэкенда. Идемпотентен.
     */
    virtual void close() = 0;
};

/**
 * @brief Фабрика Core: создаёт бэкенд или бросает исключение
 */
using CoreFactory = std::function<std::unique_ptr<ICore>()>;

} // namespace eda::ports::output
