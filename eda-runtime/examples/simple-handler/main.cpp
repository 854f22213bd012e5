#include "EdaApp.hpp"
#include <csignal>
#include <iostream>
#include <stdexcept>

eda::EdaApp* g_app = nullptr;

void signalHandler(int) {
    if (g_app) {
        g_app->stop();
    }
}

/**
 * Простой handler: только логирует. Событие без subject считается ошибкой,
 * чтобы было видно решение о повторе.
 */
void logEvent(const eda::domain::Event& event) {
    if (!event.subject) {
        throw std::runtime_error("event has no subject");
    }
    std::cout << "[simple-handler] " << event.type
              << " id=" << event.id
              << " subject=" << *event.subject << std::endl;
}

int main(int argc, char* argv[]) {
    eda::EdaApp app(eda::ports::input::makeHandler(logEvent));
    g_app = &app;

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    int exitCode = app.run(argc, argv);
    g_app = nullptr;
    return exitCode;
}
