#pragma once

#include "domain/routing/RoutingTable.hpp"
#include "ports/output/ICore.hpp"
#include "settings/ConnectionSettings.hpp"
#include <memory>
#include <mutex>

namespace eda::adapters::secondary {

/**
 * @brief Встроенный бэкенд решений
 *
 * - конфигурация подключения из ConnectionSettings (ENV);
 * - заглушка повторов: никогда не повторять, задержка 0;
 * - маршрутизация выходных событий по RoutingTable.
 *
 * Без routing.yaml все события уходят в broker/events/default.
 * Потокобезопасен: таблица заменяется атомарно под мьютексом.
 */
class InProcessCore : public ports::output::ICore {
public:
    static domain::OutputDestination builtInDefaultDestination() {
        return domain::OutputDestination(domain::DestinationType::BROKER, "events", std::string("default"));
    }

    explicit InProcessCore(std::shared_ptr<settings::ConnectionSettings> settings);

    domain::ConnectionConfig getConnectionConfig() override;
    bool shouldRetry(const std::string& errorMessage, uint32_t attempt) override;
    uint64_t calculateBackoff(uint32_t attempt) override;
    domain::OutputDestination getOutputDestination(const std::string& eventJson) override;

    /**
     * @brief Заменить таблицу маршрутизации
     *
     * При ошибке прежняя таблица остаётся в силе.
     */
    void loadRoutingConfig(const std::string& path) override;

    void close() override;

    bool isClosed() const;

    std::shared_ptr<const domain::routing::RoutingTable> routingTable() const;

private:
    void ensureOpen(const char* operation) const;

    std::shared_ptr<settings::ConnectionSettings> settings_;
    mutable std::mutex mutex_;
    std::shared_ptr<const domain::routing::RoutingTable> table_;
    bool closed_ = false;
};

} // namespace eda::adapters::secondary
