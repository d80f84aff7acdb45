#pragma once
#include <string>
#include <vector>
#include <functional>
#include <nlohmann/json.hpp>

/**
 * @brief MCP prompt 目录
 *
 * 每个 prompt 接收可选的字符串参数,返回一条 user 消息。
 */
class PromptCatalog {
public:
    struct Argument {
        std::string name;
        std::string description;
    };

    struct Prompt {
        std::string name;
        std::string description;
        std::vector<Argument> arguments;
        std::function<std::string(const nlohmann::json& args)> render;
    };

    // 内置 deploy / logs 两个 prompt
    static PromptCatalog withDefaults();

    void add(Prompt prompt);

    bool has(const std::string& name) const;

    /**
     * @brief MCP prompts/list 格式:
     * [{"name": "...", "description": "...", "arguments": [{"name", "description", "required": false}]}]
     */
    nlohmann::json list() const;

    /**
     * @brief MCP prompts/get 结果: {"description", "messages": [{"role": "user", "content": {...}}]}
     * @throws std::out_of_range prompt 不存在
     */
    nlohmann::json get(const std::string& name, const nlohmann::json& args) const;

private:
    std::vector<Prompt> prompts;
};
