/// @file main.cpp
/// @brief Gateway service entry point.
///
/// Loads the YAML configuration, starts the GatewayServer with a logging
/// chat sink and a WebSocket dialer, and drives the maintenance tick until
/// SIGINT or SIGTERM.

#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>

#include "gcb/foundation/config_manager.hpp"
#include "gcb/foundation/gateway_logger.hpp"
#include "gcb/foundation/websocket_dialer.hpp"
#include "gcb/service/chat_platform.hpp"
#include "gcb/service/gateway_config.hpp"
#include "gcb/service/gateway_server.hpp"
#include "gcb/service/service_runner.hpp"
#include "gcb/version.hpp"

namespace {

void applyLogLevel(gcb::foundation::LogLevel level) {
    auto& logger = gcb::foundation::GatewayLogger::instance();
    for (std::size_t i = 0; i < gcb::foundation::kLogCategoryCount; ++i) {
        logger.setCategoryLevel(static_cast<gcb::foundation::LogCategory>(i), level);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    gcb::service::SignalHandler signals;

    auto configPath = gcb::service::resolveConfigPath(argc, argv);

    gcb::foundation::ConfigManager config;
    auto loadResult = gcb::service::loadConfig(config, configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config " << configPath << ": "
                  << loadResult.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    auto gwConfig = gcb::service::buildGatewayConfig(config);
    if (!gwConfig) {
        std::cerr << "Invalid gateway config: " << gwConfig.error().describe() << "\n";
        return EXIT_FAILURE;
    }
    auto settings = std::move(gwConfig).value();
    if (settings.logLevel) {
        applyLogLevel(*settings.logLevel);
    }

    gcb::service::LoggingChatPlatformSink sink;
    auto dialer = std::make_shared<gcb::foundation::WebSocketDialer>();
    gcb::service::GatewayServer gateway(settings, sink, dialer);

    auto startResult = gateway.start();
    if (!startResult) {
        std::cerr << "Failed to start gateway: " << startResult.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "Chat bridge gateway " << gcb::Version::string << " started (";
    if (settings.listenEnabled) {
        std::cout << "ws:" << settings.listenPort << settings.path;
    } else {
        std::cout << "listener disabled";
    }
    std::cout << ", " << settings.servers.size() << " server(s))\n";

    while (!signals.shutdownRequested()) {
        std::this_thread::sleep_for(settings.tickInterval);
        gateway.pump(settings.tickInterval);
    }

    std::cout << "Shutting down gateway...\n";
    gateway.stop();
    auto flushed = gcb::foundation::GatewayLogger::instance().flush();
    if (!flushed) {
        std::cerr << "Log flush failed: " << flushed.error().describe() << "\n";
    }
    std::cout << "Gateway stopped\n";
    return EXIT_SUCCESS;
}
