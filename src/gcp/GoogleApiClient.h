#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "gcp/CloudInterfaces.h"

/**
 * @brief Google REST API 的 JSON 客户端 (Bearer 令牌)
 *
 * 非 2xx 响应抛出 GoogleApiError,优先使用 API 返回的 error.message。
 */
class GoogleApiClient : public IGoogleApi {
public:
    explicit GoogleApiClient(IAccessTokenProvider& tokens) : tokens(tokens) {}

    nlohmann::json getJson(const std::string& url) override;
    nlohmann::json postJson(const std::string& url, const nlohmann::json& body) override;

private:
    IAccessTokenProvider& tokens;

    nlohmann::json send(const std::string& method, const std::string& url, const std::string& body);
};
