#include <iostream>
#include <string>
#include <memory>
#include <filesystem>
#include <csignal>
#include <cstdlib>
#include "core/ConfigManager.h"
#include "utils/Logger.h"
#include "process/ProcessHandle.h"
#include "process/CommandRunner.h"
#include "proxy/CapabilityProbe.h"
#include "proxy/ProxyManager.h"
#include "logs/LogAggregator.h"
#include "gcp/AccessTokenProvider.h"
#include "gcp/GoogleApiClient.h"
#include "gcp/CloudLoggingClient.h"
#include "gcp/CloudRunServices.h"
#include "gcp/ProjectService.h"
#include "gcp/Deployer.h"
#include "gcp/CodeSandboxClient.h"
#include "tools/ToolGateway.h"
#include "tools/CloudRunTools.h"
#include "mcp/McpServer.h"
#include "mcp/McpHttpServer.h"
#include "mcp/PromptCatalog.h"

namespace fs = std::filesystem;

namespace {
const char* const VERSION = "1.0.0";

void printUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--config <path>] [--log-level <level>] [--transport stdio|http] [--port <n>]\n"
              << "Serves Cloud Run tools over MCP on stdin/stdout, or on POST /mcp in http mode.\n";
}
} // namespace

int main(int argc, char* argv[]) {
    // A client that closes its end mid-write must not kill the server
    std::signal(SIGPIPE, SIG_IGN);

    std::string configPath;
    std::string levelOverride;
    std::string transportOverride;
    int portOverride = 0;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            levelOverride = argv[++i];
        } else if (arg == "--transport" && i + 1 < argc) {
            transportOverride = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            portOverride = std::atoi(argv[++i]);
            if (portOverride <= 0 || portOverride > 65535) {
                std::cerr << "Invalid port: " << argv[i] << std::endl;
                return 2;
            }
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--version") {
            std::cerr << "cirrus " << VERSION << std::endl;
            return 0;
        } else {
            printUsage(argv[0]);
            return 2;
        }
    }

    Config cfg;
    try {
        if (!configPath.empty()) {
            cfg = Config::load(configPath);
        } else if (fs::exists(fs::u8path("cirrus.json"))) {
            cfg = Config::load("cirrus.json");
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load configuration: " << e.what() << std::endl;
        return 1;
    }
    cfg.applyEnvironment();
    if (!levelOverride.empty()) cfg.logging.level = levelOverride;
    if (!transportOverride.empty()) cfg.server.transport = transportOverride;
    if (portOverride > 0) cfg.server.port = portOverride;
    if (cfg.server.transport != "stdio" && cfg.server.transport != "http") {
        std::cerr << "Unknown transport: " << cfg.server.transport << std::endl;
        return 2;
    }

    Logger& logger = Logger::getInstance();
    logger.setLogFile(cfg.logging.file);
    logger.setMinLevel(Logger::parseLevel(cfg.logging.level));

    try {
        CommandRunner runner;
        GcloudAccessTokenProvider tokens(runner, cfg.gcp.gcloudPath);

        bool credentialsAvailable = ensureGcpCredentials(tokens);

        GoogleApiClient api(tokens);
        CloudLoggingClient logSource(api, cfg.logs.pageSize);
        LogAggregator logs(logSource);
        CloudRunServices services(api);
        ProjectService projects(api, runner, cfg.gcp.gcloudPath);
        GcloudDeployer deployer(runner, cfg.gcp.gcloudPath);

        std::unique_ptr<CodeSandboxClient> sandbox;
        if (!cfg.sandbox.url.empty()) {
            sandbox = std::make_unique<CodeSandboxClient>(cfg.sandbox.url);
        }

        ProcessLauncher launcher;
        GcloudComponentProbe probe(runner, cfg.gcp.gcloudPath);
        ProxyManager::Options proxyOptions;
        proxyOptions.gcloudPath = cfg.gcp.gcloudPath;
        proxyOptions.componentId = cfg.proxy.componentId;
        proxyOptions.readyMarker = cfg.proxy.readyMarker;
        proxyOptions.stopTimeout = std::chrono::seconds(cfg.proxy.stopTimeoutSeconds);
        ProxyManager proxy(launcher, probe, proxyOptions);

        CloudRunToolContext ctx{projects, services, deployer, logs, proxy, sandbox.get(), {}};
        ctx.defaults.project = cfg.gcp.projectId;
        ctx.defaults.region = cfg.gcp.region;
        ctx.defaults.service = cfg.gcp.serviceName;
        ctx.defaults.skipIamCheck = cfg.gcp.skipIamCheck;
        ctx.defaults.proxyPort = cfg.proxy.defaultPort;

        ToolGateway gateway(credentialsAvailable);
        bool remote = cfg.server.transport == "http";
        if (remote) {
            registerCloudRunToolsRemote(gateway, ctx);
        } else {
            registerCloudRunTools(gateway, ctx);
        }
        logger.info("Registered " + std::to_string(gateway.getToolCount()) + " tools");

        McpServer server(gateway, PromptCatalog::withDefaults(), "cirrus", VERSION);
        if (remote) {
            McpHttpServer http(server, cfg.server.host, cfg.server.port);
            http.start();
            http.wait();
        } else {
            server.run(std::cin, std::cout);
        }
    } catch (const std::exception& e) {
        logger.error(std::string("Fatal: ") + e.what());
        return 1;
    }
    return 0;
}
