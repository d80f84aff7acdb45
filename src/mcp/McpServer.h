#pragma once
#include <string>
#include <optional>
#include <istream>
#include <ostream>
#include <nlohmann/json.hpp>
#include "mcp/PromptCatalog.h"

class ToolGateway;

/**
 * @brief MCP 服务端 (JSON-RPC 2.0)
 *
 * run() 是 stdio 传输,每行一条消息;HTTP 传输由 McpHttpServer 复用 handleLine()。
 *
 * 请求按到达顺序逐条处理;stdout 只输出协议帧,日志全部走 Logger。
 */
class McpServer {
public:
    static constexpr const char* PROTOCOL_VERSION = "2024-11-05";

    McpServer(ToolGateway& gateway, PromptCatalog prompts,
              std::string name = "cirrus", std::string version = "1.0.0");

    /**
     * @brief 处理一条已解析的消息
     * @return 响应;通知 (无 id) 返回 nullopt
     */
    std::optional<nlohmann::json> handleMessage(const nlohmann::json& message);

    /**
     * @brief 处理一行原始文本,包括 JSON 解析错误
     */
    std::optional<nlohmann::json> handleLine(const std::string& line);

    /**
     * @brief 阻塞读取直到输入结束
     */
    void run(std::istream& in, std::ostream& out);

    bool isInitialized() const { return initialized; }

private:
    nlohmann::json dispatch(const std::string& method, const nlohmann::json& params);

    nlohmann::json initializeResult(const nlohmann::json& params) const;

    static nlohmann::json makeResult(const nlohmann::json& id, const nlohmann::json& result);
    static nlohmann::json makeError(const nlohmann::json& id, int code, const std::string& message);

    ToolGateway& gateway;
    PromptCatalog prompts;
    std::string name;
    std::string version;
    bool initialized = false;
};
