#pragma once
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief 工具调用结果
 *
 * 成功与失败结构相同,都是一段文本;失败只是多了一个标记,
 * 渲染为 MCP 内容时不区分。
 */
struct ToolResult {
    enum class Kind {
        Ok,
        Failure
    };

    Kind kind = Kind::Ok;
    std::string text;

    static ToolResult ok(std::string text) { return {Kind::Ok, std::move(text)}; }
    static ToolResult failure(std::string text) { return {Kind::Failure, std::move(text)}; }

    bool isError() const { return kind == Kind::Failure; }
};

/**
 * @brief 渲染为 MCP 内容:
 * {
 *   "content": [
 *     {"type": "text", "text": "..."}
 *   ]
 * }
 */
inline nlohmann::json toMcpContent(const ToolResult& result) {
    return {
        {"content", nlohmann::json::array({
            {{"type", "text"}, {"text", result.text}}
        })}
    };
}

/**
 * @brief 工具接口定义
 *
 * 工具只负责校验参数、调用协作者、格式化文本。
 * 失败时直接抛出异常,由 ToolGateway 统一转换为文本结果。
 */
class ITool {
public:
    virtual ~ITool() = default;

    /**
     * @brief 获取工具名称
     * @return 工具的唯一标识名称
     */
    virtual std::string getName() const = 0;

    /**
     * @brief 获取工具描述
     * @return 工具功能的简短描述 (用于 LLM 理解)
     */
    virtual std::string getDescription() const = 0;

    /**
     * @brief 获取工具的 JSON Schema
     * @return 符合 JSON Schema 规范的参数定义 (MCP inputSchema)
     */
    virtual nlohmann::json getSchema() const = 0;

    /**
     * @brief 执行工具操作
     * @param args 工具参数 (JSON 对象)
     * @throws ValidationError 参数不合法
     * @throws std::exception 协作者失败
     */
    virtual ToolResult execute(const nlohmann::json& args) = 0;

    /**
     * @brief 描述本次调用的操作,用于错误文本 "Error <operation>: <message>"
     */
    virtual std::string describeOperation(const nlohmann::json& args) const {
        (void)args;
        return "executing tool " + getName();
    }
};
