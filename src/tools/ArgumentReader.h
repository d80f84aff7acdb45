#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

/**
 * @brief 工具参数读取与校验
 *
 * 所有校验失败都抛出 ValidationError,message 即面向用户的提示。
 */
class ArgumentReader {
public:
    explicit ArgumentReader(const nlohmann::json& args);

    // 参数缺失时使用 fallback;结果必须是非空字符串
    std::string requireString(const std::string& key, const std::string& fallback,
                              const std::string& message) const;

    // 参数缺失返回 nullopt;若提供则必须是非空字符串
    std::optional<std::string> optionalString(const std::string& key, const std::string& message) const;

    // 不校验,只用于拼接错误描述
    std::string stringOr(const std::string& key, const std::string& fallback) const;

    int integer(const std::string& key, int fallback, int min, int max, const std::string& message) const;

    // 必须是非空数组
    const nlohmann::json& array(const std::string& key, const std::string& missingMessage,
                                const std::string& emptyMessage) const;

    std::vector<std::string> stringArray(const std::string& key, const std::string& missingMessage,
                                         const std::string& emptyMessage) const;

private:
    nlohmann::json args;
};
