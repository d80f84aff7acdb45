#pragma once
#include <string>
#include <memory>
#include <map>
#include <vector>
#include <nlohmann/json.hpp>
#include "ITool.h"

enum class ToolGate {
    None,
    Credentials // 需要 GCP 凭证
};

/**
 * @brief 工具网关
 *
 * 协议分发层与协作者之间的唯一边界:
 * 1. 凭证开关:凭证不可用时,需要凭证的工具在注册时就被替换为固定提示,
 *    真正的处理函数永远不会被调用;
 * 2. 错误归一:工具抛出的任何异常都被捕获并渲染为
 *    "Error <operation>: <message>",不会传到协议层。
 */
class ToolGateway {
public:
    static const char* const CREDENTIALS_ADVISORY;

    explicit ToolGateway(bool credentialsAvailable) : credentialsAvailable(credentialsAvailable) {}

    /**
     * @brief 注册一个工具
     * @param tool 工具实例 (unique_ptr 转移所有权)
     * @param gate 是否需要凭证
     */
    void registerTool(std::unique_ptr<ITool> tool, ToolGate gate = ToolGate::Credentials);

    /**
     * @brief 执行工具,永不抛出
     *
     * 如果工具不存在,返回失败结果 "Unknown tool: xxx"
     */
    ToolResult callTool(const std::string& name, const nlohmann::json& args);

    /**
     * @brief MCP tools/list 格式:
     * [
     *   {"name": "...", "description": "...", "inputSchema": { JSON Schema }}
     * ]
     */
    nlohmann::json listTools() const;

    size_t getToolCount() const { return tools.size(); }

    bool hasTool(const std::string& name) const;

    bool hasCredentials() const { return credentialsAvailable; }

private:
    ToolResult failureFor(const ITool& tool, const std::string& name, const nlohmann::json& args,
                          const std::string& message) const;

    bool credentialsAvailable;
    std::map<std::string, std::unique_ptr<ITool>> tools;
};
