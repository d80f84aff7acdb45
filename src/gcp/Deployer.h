#pragma once
#include <filesystem>
#include "gcp/CloudInterfaces.h"
#include "process/CommandRunner.h"

/**
 * @brief 通过 `gcloud run deploy` 部署
 *
 * 源码部署时先把文件整理到临时目录,构建与 IAM 由 gcloud 完成。
 */
class GcloudDeployer : public IDeployer {
public:
    GcloudDeployer(ICommandRunner& runner, const std::string& gcloudPath)
        : runner(runner), gcloudPath(gcloudPath) {}

    DeployResult deploy(const DeployRequest& request) override;
    DeployResult deployImage(const std::string& projectId, const std::string& region,
                             const std::string& serviceName, const std::string& imageUrl,
                             bool skipIamCheck) override;

    /**
     * @brief 把请求中的文件整理为一个源码目录
     * @param staging 需要时写入的临时目录
     * @return 实际用于部署的目录 (单个文件夹时直接返回它)
     */
    static std::filesystem::path stageSources(const DeployRequest& request, const std::filesystem::path& staging);

private:
    ICommandRunner& runner;
    std::string gcloudPath;

    DeployResult runDeploy(const std::string& projectId, const std::string& region,
                           const std::string& serviceName, const std::string& sourceFlag,
                           bool skipIamCheck);
};
