#pragma once
#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>

/**
 * @brief 工具层依赖的云端协作者接口
 *
 * 这些都是直通调用:构造请求、调用 REST API 或 gcloud CLI、返回结构化结果。
 * 失败一律抛出 std::exception,由 ToolGateway 渲染为文本。
 */

struct ProjectInfo {
    std::string id;
    std::string name;
};

struct CreatedProject {
    std::string projectId;
    std::string billingMessage;
};

struct ServiceInfo {
    std::string name; // short name, not the full resource path
    std::string uri;
    std::string lastModifier;
};

struct DeployFile {
    std::string filename;
    std::string content;
};

struct DeployRequest {
    std::string projectId;
    std::string region;
    std::string serviceName;
    std::vector<std::string> paths;      // absolute local paths (files or a folder)
    std::vector<DeployFile> fileContents;
    bool skipIamCheck = false;
};

struct DeployResult {
    std::string uri;
};

// REST 调用失败;status 为 0 表示连接层错误
class GoogleApiError : public std::runtime_error {
public:
    GoogleApiError(int status, const std::string& message)
        : std::runtime_error(message), status(status) {}

    int getStatus() const { return status; }

private:
    int status;
};

class IAccessTokenProvider {
public:
    virtual ~IAccessTokenProvider() = default;
    virtual std::string getAccessToken() = 0;
};

class IGoogleApi {
public:
    virtual ~IGoogleApi() = default;
    virtual nlohmann::json getJson(const std::string& url) = 0;
    virtual nlohmann::json postJson(const std::string& url, const nlohmann::json& body) = 0;
};

class IProjectService {
public:
    virtual ~IProjectService() = default;
    virtual std::vector<ProjectInfo> listProjects() = 0;
    virtual CreatedProject createProjectAndAttachBilling(const std::optional<std::string>& projectId) = 0;
};

class ICloudRunServices {
public:
    virtual ~ICloudRunServices() = default;
    virtual std::vector<ServiceInfo> listServices(const std::string& project, const std::string& region) = 0;
    virtual std::optional<ServiceInfo> getService(const std::string& project, const std::string& region,
                                                  const std::string& service) = 0;
};

class IDeployer {
public:
    virtual ~IDeployer() = default;
    virtual DeployResult deploy(const DeployRequest& request) = 0;
    virtual DeployResult deployImage(const std::string& projectId, const std::string& region,
                                     const std::string& serviceName, const std::string& imageUrl,
                                     bool skipIamCheck) = 0;
};

class ICodeSandbox {
public:
    virtual ~ICodeSandbox() = default;
    virtual std::string run(const std::string& code) = 0;
};
