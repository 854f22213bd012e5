#include "EdaApp.hpp"
#include <csignal>
#include <iostream>
#include <optional>

// Global pointer for signal handler
eda::EdaApp* g_app = nullptr;

void signalHandler(int signal) {
    std::cout << "\n[main] Received signal " << signal << ", shutting down..." << std::endl;
    if (g_app) {
        g_app->stop();
    }
}

/**
 * order.created -> order.processed с id "processed-<id>"
 */
std::optional<eda::domain::Event> handleOrder(const eda::domain::Event& event) {
    std::cout << "[main] Handling event_id=" << event.id << " event_type=" << event.type << std::endl;

    if (event.type != "order.created") {
        return std::nullopt;
    }

    eda::domain::Event processed("processed-" + event.id, "order.processed", event.source);
    processed.subject = event.subject;
    processed.dataContentType = "application/json";
    processed.data = nlohmann::json{{"original_id", event.id}, {"status", "processed"}};
    return processed;
}

int main(int argc, char* argv[]) {
    eda::EdaApp app(eda::ports::input::makeHandler(handleOrder));
    g_app = &app;

    // Signal handlers для graceful shutdown
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::cout << "========================================" << std::endl;
    std::cout << "  EDA Runtime v1.0.0 Starting" << std::endl;
    std::cout << "  Press Ctrl+C to stop" << std::endl;
    std::cout << "========================================" << std::endl;

    int exitCode = app.run(argc, argv);

    g_app = nullptr;
    std::cout << "[main] EDA Runtime stopped exit_code=" << exitCode << std::endl;
    return exitCode;
}
