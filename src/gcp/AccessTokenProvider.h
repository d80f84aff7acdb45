#pragma once
#include <string>
#include <mutex>
#include <chrono>
#include "gcp/CloudInterfaces.h"
#include "process/CommandRunner.h"

/**
 * @brief 通过 `gcloud auth application-default print-access-token` 获取 ADC 令牌
 *
 * 令牌缓存 30 分钟 (ADC 令牌有效期为 60 分钟)。
 */
class GcloudAccessTokenProvider : public IAccessTokenProvider {
public:
    GcloudAccessTokenProvider(ICommandRunner& runner, const std::string& gcloudPath)
        : runner(runner), gcloudPath(gcloudPath) {}

    std::string getAccessToken() override;

private:
    ICommandRunner& runner;
    std::string gcloudPath;
    std::mutex mtx;
    std::string cachedToken;
    std::chrono::steady_clock::time_point fetchedAt;
};

/**
 * @brief 启动时检查 Application Default Credentials 是否可用
 *
 * 不可用时输出排查建议并返回 false;结果作为 ToolGateway 的凭证开关。
 */
bool ensureGcpCredentials(IAccessTokenProvider& tokens);
