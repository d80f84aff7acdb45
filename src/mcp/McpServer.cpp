#include "mcp/McpServer.h"
#include "tools/ToolGateway.h"
#include "utils/Logger.h"
#include <stdexcept>

namespace {
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// Carries a JSON-RPC error code out of dispatch()
class RpcError : public std::runtime_error {
public:
    RpcError(int code, const std::string& message) : std::runtime_error(message), code(code) {}
    int getCode() const { return code; }

private:
    int code;
};
} // namespace

McpServer::McpServer(ToolGateway& gateway, PromptCatalog prompts, std::string name, std::string version)
    : gateway(gateway), prompts(std::move(prompts)), name(std::move(name)), version(std::move(version)) {}

nlohmann::json McpServer::makeResult(const nlohmann::json& id, const nlohmann::json& result) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

nlohmann::json McpServer::makeError(const nlohmann::json& id, int code, const std::string& message) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

nlohmann::json McpServer::initializeResult(const nlohmann::json& params) const {
    if (params.is_object() && params.contains("clientInfo") && params["clientInfo"].is_object()) {
        Logger::getInstance().info("Client connected: " + params["clientInfo"].value("name", std::string("unknown")));
    }
    return {
        {"protocolVersion", PROTOCOL_VERSION},
        {"capabilities", {
            {"tools", {{"listChanged", false}}},
            {"prompts", {{"listChanged", false}}}
        }},
        {"serverInfo", {{"name", name}, {"version", version}}}
    };
}

nlohmann::json McpServer::dispatch(const std::string& method, const nlohmann::json& params) {
    if (method == "initialize") {
        return initializeResult(params);
    }
    if (method == "ping") {
        return nlohmann::json::object();
    }
    if (method == "tools/list") {
        return {{"tools", gateway.listTools()}};
    }
    if (method == "tools/call") {
        if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
            throw RpcError(INVALID_PARAMS, "Missing 'name' parameter");
        }
        std::string tool = params["name"].get<std::string>();
        nlohmann::json args = params.contains("arguments") ? params["arguments"] : nlohmann::json::object();
        Logger::getInstance().debug("Calling tool " + tool);
        return toMcpContent(gateway.callTool(tool, args));
    }
    if (method == "prompts/list") {
        return {{"prompts", prompts.list()}};
    }
    if (method == "prompts/get") {
        if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
            throw RpcError(INVALID_PARAMS, "Missing 'name' parameter");
        }
        std::string prompt = params["name"].get<std::string>();
        if (!prompts.has(prompt)) {
            throw RpcError(INVALID_PARAMS, "Unknown prompt: " + prompt);
        }
        nlohmann::json args = params.contains("arguments") ? params["arguments"] : nlohmann::json::object();
        return prompts.get(prompt, args);
    }
    throw RpcError(METHOD_NOT_FOUND, "Method not found: " + method);
}

std::optional<nlohmann::json> McpServer::handleMessage(const nlohmann::json& message) {
    if (!message.is_object() || !message.contains("method") || !message["method"].is_string()) {
        // Responses to server-initiated requests are never sent; anything else is malformed
        if (message.is_object() && (message.contains("result") || message.contains("error"))) {
            return std::nullopt;
        }
        nlohmann::json id = message.is_object() && message.contains("id") ? message["id"] : nlohmann::json();
        return makeError(id, INVALID_REQUEST, "Invalid Request");
    }

    std::string method = message["method"].get<std::string>();
    nlohmann::json params = message.contains("params") ? message["params"] : nlohmann::json::object();

    // Notifications carry no id and never get a reply
    if (!message.contains("id")) {
        if (method == "notifications/initialized") {
            initialized = true;
            Logger::getInstance().debug("Client initialized");
        } else {
            Logger::getInstance().debug("Ignoring notification " + method);
        }
        return std::nullopt;
    }

    const nlohmann::json& id = message["id"];
    try {
        return makeResult(id, dispatch(method, params));
    } catch (const RpcError& e) {
        Logger::getInstance().warn(method + ": " + e.what());
        return makeError(id, e.getCode(), e.what());
    } catch (const std::exception& e) {
        Logger::getInstance().error(method + " failed: " + e.what());
        return makeError(id, INTERNAL_ERROR, e.what());
    } catch (...) {
        Logger::getInstance().error(method + " failed with a non-standard exception");
        return makeError(id, INTERNAL_ERROR, "Internal error");
    }
}

std::optional<nlohmann::json> McpServer::handleLine(const std::string& line) {
    if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
        return std::nullopt;
    }
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        Logger::getInstance().warn(std::string("Parse error: ") + e.what());
        return makeError(nullptr, PARSE_ERROR, "Parse error");
    }
    return handleMessage(message);
}

void McpServer::run(std::istream& in, std::ostream& out) {
    Logger::getInstance().info("MCP server listening on stdio");
    std::string line;
    while (std::getline(in, line)) {
        auto response = handleLine(line);
        if (response) {
            // Tool output may carry invalid UTF-8 from child processes
            out << response->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
            out.flush();
        }
    }
    Logger::getInstance().info("Input closed, shutting down");
}
