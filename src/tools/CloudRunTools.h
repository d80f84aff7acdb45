#pragma once
#include "ITool.h"
#include "gcp/CloudInterfaces.h"

class ToolGateway;
class ProxyManager;
class LogAggregator;

/**
 * @brief 工具参数的默认值 (来自环境变量或配置文件)
 */
struct CloudRunDefaults {
    std::string project;
    std::string region = "europe-west1";
    std::string service = "app";
    bool skipIamCheck = false;
    int proxyPort = 8080;
    // 远程模式:project 固定为上面的值,不再出现在 schema 中
    bool projectBound = false;
};

/**
 * @brief 列出当前凭证可见的 GCP 项目
 */
class ListProjectsTool : public ITool {
public:
    explicit ListProjectsTool(IProjectService& projects) : projects(projects) {}

    std::string getName() const override { return "list_projects"; }
    std::string getDescription() const override { return "Lists available GCP projects"; }
    nlohmann::json getSchema() const override;
    ToolResult execute(const nlohmann::json& args) override;
    std::string describeOperation(const nlohmann::json&) const override { return "listing GCP projects"; }

private:
    IProjectService& projects;
};

/**
 * @brief 创建项目并绑定第一个可用的计费账号
 *
 * projectId 可选,缺省时自动生成。
 */
class CreateProjectTool : public ITool {
public:
    explicit CreateProjectTool(IProjectService& projects) : projects(projects) {}

    std::string getName() const override { return "create_project"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    ToolResult execute(const nlohmann::json& args) override;
    std::string describeOperation(const nlohmann::json&) const override {
        return "creating GCP project or attaching billing";
    }

private:
    IProjectService& projects;
};

class ListServicesTool : public ITool {
public:
    ListServicesTool(ICloudRunServices& services, const CloudRunDefaults& defaults)
        : services(services), defaults(defaults) {}

    std::string getName() const override { return "list_services"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    ToolResult execute(const nlohmann::json& args) override;
    std::string describeOperation(const nlohmann::json& args) const override;

private:
    ICloudRunServices& services;
    CloudRunDefaults defaults;
};

class GetServiceTool : public ITool {
public:
    GetServiceTool(ICloudRunServices& services, const CloudRunDefaults& defaults)
        : services(services), defaults(defaults) {}

    std::string getName() const override { return "get_service"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    ToolResult execute(const nlohmann::json& args) override;
    std::string describeOperation(const nlohmann::json& args) const override;

private:
    ICloudRunServices& services;
    CloudRunDefaults defaults;
};

/**
 * @brief 获取服务的全部日志 (逐页拉取后按顺序拼接)
 */
class GetServiceLogTool : public ITool {
public:
    GetServiceLogTool(LogAggregator& aggregator, const CloudRunDefaults& defaults)
        : aggregator(aggregator), defaults(defaults) {}

    std::string getName() const override { return "get_service_log"; }
    std::string getDescription() const override {
        return "Gets Logs and Error Messages for a specific Cloud Run service.";
    }
    nlohmann::json getSchema() const override;
    ToolResult execute(const nlohmann::json& args) override;
    std::string describeOperation(const nlohmann::json& args) const override;

private:
    LogAggregator& aggregator;
    CloudRunDefaults defaults;
};

class DeployLocalFilesTool : public ITool {
public:
    DeployLocalFilesTool(IDeployer& deployer, const CloudRunDefaults& defaults)
        : deployer(deployer), defaults(defaults) {}

    std::string getName() const override { return "deploy_local_files"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    ToolResult execute(const nlohmann::json& args) override;
    std::string describeOperation(const nlohmann::json&) const override { return "deploying to Cloud Run"; }

private:
    IDeployer& deployer;
    CloudRunDefaults defaults;
};

class DeployLocalFolderTool : public ITool {
public:
    DeployLocalFolderTool(IDeployer& deployer, const CloudRunDefaults& defaults)
        : deployer(deployer), defaults(defaults) {}

    std::string getName() const override { return "deploy_local_folder"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    ToolResult execute(const nlohmann::json& args) override;
    std::string describeOperation(const nlohmann::json&) const override {
        return "deploying folder to Cloud Run";
    }

private:
    IDeployer& deployer;
    CloudRunDefaults defaults;
};

class DeployFileContentsTool : public ITool {
public:
    DeployFileContentsTool(IDeployer& deployer, const CloudRunDefaults& defaults)
        : deployer(deployer), defaults(defaults) {}

    std::string getName() const override { return "deploy_file_contents"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    ToolResult execute(const nlohmann::json& args) override;
    std::string describeOperation(const nlohmann::json&) const override { return "deploying to Cloud Run"; }

private:
    IDeployer& deployer;
    CloudRunDefaults defaults;
};

class DeployContainerImageTool : public ITool {
public:
    DeployContainerImageTool(IDeployer& deployer, const CloudRunDefaults& defaults)
        : deployer(deployer), defaults(defaults) {}

    std::string getName() const override { return "deploy_container_image"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    ToolResult execute(const nlohmann::json& args) override;
    std::string describeOperation(const nlohmann::json&) const override { return "deploying to Cloud Run"; }

private:
    IDeployer& deployer;
    CloudRunDefaults defaults;
};

/**
 * @brief 在远程沙箱中运行 Python 代码
 *
 * sandbox 为空表示未配置 CODE_SANDBOX_URL。
 */
class RunPythonCodeTool : public ITool {
public:
    explicit RunPythonCodeTool(ICodeSandbox* sandbox) : sandbox(sandbox) {}

    std::string getName() const override { return "run_python_code"; }
    std::string getDescription() const override {
        return "Runs Python code in a sandboxed environment and returns the output.";
    }
    nlohmann::json getSchema() const override;
    ToolResult execute(const nlohmann::json& args) override;
    std::string describeOperation(const nlohmann::json&) const override { return "running code in sandbox"; }

private:
    ICodeSandbox* sandbox;
};

class StartProxyTool : public ITool {
public:
    StartProxyTool(ProxyManager& proxy, const CloudRunDefaults& defaults) : proxy(proxy), defaults(defaults) {}

    std::string getName() const override { return "start_proxy"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    ToolResult execute(const nlohmann::json& args) override;
    std::string describeOperation(const nlohmann::json& args) const override;

private:
    ProxyManager& proxy;
    CloudRunDefaults defaults;
};

class StopProxyTool : public ITool {
public:
    explicit StopProxyTool(ProxyManager& proxy) : proxy(proxy) {}

    std::string getName() const override { return "stop_proxy"; }
    std::string getDescription() const override {
        return "Stops the local proxy started with start_proxy, if one is running.";
    }
    nlohmann::json getSchema() const override;
    ToolResult execute(const nlohmann::json& args) override;
    std::string describeOperation(const nlohmann::json&) const override { return "stopping proxy"; }

private:
    ProxyManager& proxy;
};

/**
 * @brief 协作者集合,由服务器上下文持有
 */
struct CloudRunToolContext {
    IProjectService& projects;
    ICloudRunServices& services;
    IDeployer& deployer;
    LogAggregator& logs;
    ProxyManager& proxy;
    ICodeSandbox* sandbox = nullptr;
    CloudRunDefaults defaults;
};

/**
 * @brief 注册全部 Cloud Run 工具
 *
 * run_python_code 与 stop_proxy 不需要凭证,其余工具受凭证开关控制。
 */
void registerCloudRunTools(ToolGateway& gateway, CloudRunToolContext& ctx);

/**
 * @brief 注册远程 (HTTP) 模式的工具集
 *
 * 只包含 list_services、get_service、get_service_log、deploy_file_contents、
 * deploy_container_image;除 get_service_log 外,项目都绑定到 ctx.defaults.project。
 * 远程调用方没有本地文件系统和本地代理,因此不注册其余工具。
 *
 * @throws std::runtime_error 无法确定默认项目
 */
void registerCloudRunToolsRemote(ToolGateway& gateway, CloudRunToolContext& ctx);
