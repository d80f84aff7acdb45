#pragma once
#include <stdexcept>
#include <string>

/**
 * @brief 核心层异常类型
 *
 * 这些异常只在核心组件内部抛出,由 ToolGateway 统一捕获并渲染为文本结果,
 * 永远不会越过协议边界。
 */

// start_proxy 时已有会话处于 Starting/Running/Stopping
class AlreadySessionActiveError : public std::runtime_error {
public:
    AlreadySessionActiveError()
        : std::runtime_error("A proxy is already running. Please stop it before starting a new one.") {}
};

// 所需组件未安装,message 中包含安装命令
class MissingDependencyError : public std::runtime_error {
public:
    MissingDependencyError(const std::string& component, const std::string& installCommand)
        : std::runtime_error("The '" + component + "' component is not installed. Please run '" +
                             installCommand + "' and try again.") {}
};

// 代理进程在就绪标记出现之前失败或退出
class ProxyStartFailedError : public std::runtime_error {
public:
    explicit ProxyStartFailedError(const std::string& cause)
        : std::runtime_error("Failed to start proxy: " + cause) {}
};

// 工具参数缺失或格式错误
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message) : std::runtime_error(message) {}
};

// 日志分页拉取失败,整个聚合作废
class PageFetchError : public std::runtime_error {
public:
    explicit PageFetchError(const std::string& cause) : std::runtime_error(cause) {}
};
