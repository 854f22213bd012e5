#pragma once

#include <boost/di.hpp>

// Settings
#include "settings/ConnectionSettings.hpp"
#include "settings/RabbitMQSettings.hpp"
#include "settings/RuntimeSettings.hpp"

// Ports
#include "ports/input/Handler.hpp"
#include "ports/output/ICore.hpp"

// Application
#include "application/CancellationToken.hpp"
#include "application/DispatchEngine.hpp"

#include <memory>
#include <string>

namespace eda {

/**
 * @brief Приложение-обёртка над DispatchEngine
 *
 * Template Method run():
 * 1. loadEnvironment() - каталог исполняемого файла, путь к routing.yaml
 * 2. configureInjection() - настройки через Boost.DI, фабрики Core и брокера
 * 3. start() - блокирующий цикл движка до stop()
 *
 * @example
 * ```cpp
 * eda::EdaApp app(eda::ports::input::makeHandler(
 *     [](const eda::domain::Event& e) { std::cout << e.type << std::endl; }));
 * return app.run(argc, argv);
 * ```
 */
class EdaApp {
public:
    explicit EdaApp(ports::input::Handler handler);
    virtual ~EdaApp();

    /**
     * @return 0 при штатной остановке, 1 при фатальной ошибке
     */
    int run(int argc, char* argv[]);

    /**
     * @brief Запросить остановку (безопасно из обработчика сигнала)
     */
    void stop();

protected:
    virtual void loadEnvironment(int argc, char* argv[]);
    virtual void configureInjection();
    virtual void start();

    ports::output::CoreFactory makeCoreFactory() const;

    ports::input::Handler handler_;
    std::string executableDir_;

    std::shared_ptr<settings::RuntimeSettings> runtimeSettings_;
    std::shared_ptr<settings::ConnectionSettings> connectionSettings_;
    std::shared_ptr<settings::RabbitMQSettings> rabbitSettings_;

    application::CancellationToken token_;
    std::unique_ptr<application::DispatchEngine> engine_;
};

} // namespace eda
