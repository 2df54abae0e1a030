#include <chrono>
#include <csignal>
#include <exception>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>

#include "https_client.h"
#include "relay_config.h"
#include "relay_errors.h"
#include "relay_log.h"
#include "session_registry.h"
#include "tool_registry.h"
#include "websocket_server.h"
#include "wsc_provider_transport.h"

int main() {
    RelayConfig cfg;
    try {
        cfg = loadRelayConfigFromEnvironment();
    } catch (const RelayError &e) {
        spdlog::critical("configuration error: {}", e.what());
        return 1;
    }
    initLogging(cfg);

    ToolRegistry::HttpGetter fetch;
    if (cfg.weatherTool) {
        HttpsOptions opts;
        opts.timeout = std::chrono::milliseconds(cfg.toolTimeoutMs);
        fetch = httpsGetter(opts);
    }
    ToolRegistry tools = ToolRegistry::withBuiltins(fetch);
    net::io_context ioc(cfg.threads);
    SessionRegistry registry(cfg, wscTransportFactory(), tools,
        [&ioc](std::function<void()> task) { net::post(ioc, std::move(task)); });

    WebSocketServer server(ioc, cfg, [&registry](std::shared_ptr<FrontendSocket> socket) {
        return static_cast<bool>(registry.open(socket));
    });
    try {
        server.start();
    } catch (const std::exception &e) {
        spdlog::critical("cannot listen on {}:{}: {}", cfg.bindAddress, cfg.port, e.what());
        return 1;
    }

    auto work = net::make_work_guard(ioc);
    std::thread stopper;

    net::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const beast::error_code &ec, int signo) {
        if (ec) return;
        spdlog::info("signal {} received, shutting down", signo);
        server.stop();
        /* sessions block in close() until their sockets drain on the io threads */
        stopper = std::thread([&registry, &ioc]() {
            registry.shutdown("server shutting down");
            ioc.stop();
        });
    });

    std::vector<std::thread> workers;
    workers.reserve(cfg.threads > 1 ? cfg.threads - 1 : 0);
    for (int i = 1; i < cfg.threads; ++i)
        workers.emplace_back([&ioc]() { ioc.run(); });
    ioc.run();

    for (auto &t : workers) t.join();
    if (stopper.joinable()) stopper.join();
    registry.shutdown("server stopped");
    spdlog::info("{} stopped", RELAY_SERVER_NAME);
    return 0;
}
