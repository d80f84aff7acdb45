#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif
#include "McpHttpServer.h"
#include <stdexcept>
#include <optional>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "McpServer.h"
#include "utils/Logger.h"

McpHttpServer::McpHttpServer(McpServer& server, std::string host, int port)
    : server(server), host(std::move(host)), port(port) {}

McpHttpServer::~McpHttpServer() {
    stop();
}

void McpHttpServer::configureRoutes() {
    http->Post(ENDPOINT, [this](const httplib::Request& req, httplib::Response& res) {
        std::optional<nlohmann::json> response;
        {
            std::lock_guard<std::mutex> lock(dispatchMutex);
            response = server.handleLine(req.body);
        }
        if (!response) {
            res.status = 202;
            return;
        }
        res.set_content(response->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                        "application/json");
    });

    // No server-initiated stream; every reply travels on its POST
    http->Get(ENDPOINT, [](const httplib::Request&, httplib::Response& res) {
        res.status = 405;
        res.set_header("Allow", "POST");
    });
}

int McpHttpServer::start() {
    if (http) {
        throw std::runtime_error("HTTP transport already started");
    }
    http = std::make_unique<httplib::Server>();
    configureRoutes();

    int bound = -1;
    if (port == 0) {
        bound = http->bind_to_any_port(host);
    } else if (http->bind_to_port(host, port)) {
        bound = port;
    }
    if (bound < 0) {
        http.reset();
        throw std::runtime_error("Failed to bind HTTP transport to " + host + ":" + std::to_string(port));
    }
    boundPort = bound;

    listener = std::thread([this] {
        if (!http->listen_after_bind()) {
            Logger::getInstance().error("HTTP transport stopped listening unexpectedly");
        }
    });
    http->wait_until_ready();
    if (!http->is_running()) {
        stop();
        throw std::runtime_error("HTTP transport failed to start listening");
    }

    Logger::getInstance().info("MCP server listening on http://" + host + ":" + std::to_string(boundPort) + ENDPOINT);
    return boundPort;
}

void McpHttpServer::wait() {
    if (listener.joinable()) listener.join();
}

void McpHttpServer::stop() {
    if (!http) return;
    http->stop();
    wait();
    http.reset();
    boundPort = 0;
}
