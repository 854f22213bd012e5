#include "EdaApp.hpp"

#include "adapters/secondary/codec/CloudEventJsonCodec.hpp"
#include "adapters/secondary/core/InProcessCore.hpp"
#include "adapters/secondary/core/NativeLibraryCore.hpp"
#include "adapters/secondary/events/RabbitMQConsumer.hpp"
#include "adapters/secondary/events/RabbitMQPublisher.hpp"
#include <filesystem>
#include <iostream>

namespace di = boost::di;
namespace fs = std::filesystem;

namespace eda {

EdaApp::EdaApp(ports::input::Handler handler)
    : handler_(std::move(handler))
{
    std::cout << "[EdaApp] Initializing..." << std::endl;
}

EdaApp::~EdaApp() {
    std::cout << "[EdaApp] Shutting down..." << std::endl;
}

int EdaApp::run(int argc, char* argv[]) {
    try {
        loadEnvironment(argc, argv);
        configureInjection();
        start();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[EdaApp] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}

void EdaApp::stop() {
    token_.cancel();
}

void EdaApp::loadEnvironment(int argc, char* argv[]) {
    std::error_code ec;
    fs::path executable = fs::read_symlink("/proc/self/exe", ec);
    if (ec && argc > 0 && argv[0]) {
        executable = fs::absolute(argv[0], ec);
    }
    executableDir_ = executable.has_parent_path() ? executable.parent_path().string() : ".";

    std::cout << "[EdaApp] Environment loaded executable_dir=" << executableDir_ << std::endl;
}

void EdaApp::configureInjection() {
    std::cout << "[EdaApp] Configuring DI..." << std::endl;

    auto injector = di::make_injector(
        di::bind<settings::RuntimeSettings>().in(di::singleton),
        di::bind<settings::ConnectionSettings>().in(di::singleton),
        di::bind<settings::RabbitMQSettings>().in(di::singleton));

    runtimeSettings_ = injector.create<std::shared_ptr<settings::RuntimeSettings>>();
    connectionSettings_ = injector.create<std::shared_ptr<settings::ConnectionSettings>>();
    rabbitSettings_ = injector.create<std::shared_ptr<settings::RabbitMQSettings>>();

    application::EngineOptions options;
    options.pollTimeout = std::chrono::milliseconds(runtimeSettings_->getPollTimeoutMs());
    options.maxConsecutiveErrors = runtimeSettings_->getMaxConsecutiveErrors();
    options.flushTimeout = std::chrono::milliseconds(runtimeSettings_->getFlushTimeoutMs());
    options.requireRouting = runtimeSettings_->isRoutingRequired();
    options.routingConfigPath = runtimeSettings_->getRoutingConfig().empty()
        ? (fs::path(executableDir_) / "routing.yaml").string()
        : runtimeSettings_->getRoutingConfig();

    auto rabbit = rabbitSettings_;
    application::ConsumerFactory consumerFactory =
        [rabbit](const domain::ConnectionConfig& config) -> std::unique_ptr<ports::output::IMessageConsumer> {
            return std::make_unique<adapters::secondary::RabbitMQConsumer>(rabbit, config.broker);
        };
    application::PublisherFactory publisherFactory =
        [rabbit](const domain::ConnectionConfig& config) -> std::unique_ptr<ports::output::IEventPublisher> {
            return std::make_unique<adapters::secondary::RabbitMQPublisher>(rabbit, config.broker);
        };

    auto codec = std::make_shared<adapters::secondary::CloudEventJsonCodec>(
        runtimeSettings_->isRawMessageFallback());

    engine_ = std::make_unique<application::DispatchEngine>(
        makeCoreFactory(), handler_, consumerFactory, publisherFactory, codec, options);

    engine_->onStateChange([](domain::EngineState state) {
        std::cout << "[EdaApp] Engine state: " << domain::toString(state) << std::endl;
    });

    std::cout << "[EdaApp] Ready" << std::endl;
}

void EdaApp::start() {
    engine_->start(token_);
}

ports::output::CoreFactory EdaApp::makeCoreFactory() const {
    auto runtime = runtimeSettings_;
    auto connection = connectionSettings_;

    return [runtime, connection]() -> std::unique_ptr<ports::output::ICore> {
        const std::string library = runtime->getCoreLibrary();
        if (!library.empty()) {
            std::cout << "[EdaApp] Using native core library=" << library << std::endl;
            return std::make_unique<adapters::secondary::NativeLibraryCore>(library);
        }
        std::cout << "[EdaApp] Using in-process core" << std::endl;
        return std::make_unique<adapters::secondary::InProcessCore>(connection);
    };
}

} // namespace eda
