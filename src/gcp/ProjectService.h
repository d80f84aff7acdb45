#pragma once
#include "gcp/CloudInterfaces.h"
#include "process/CommandRunner.h"

/**
 * @brief 项目列表 (Resource Manager REST) 与项目创建/计费绑定 (gcloud CLI)
 */
class ProjectService : public IProjectService {
public:
    ProjectService(IGoogleApi& api, ICommandRunner& runner, const std::string& gcloudPath)
        : api(api), runner(runner), gcloudPath(gcloudPath) {}

    std::vector<ProjectInfo> listProjects() override;
    CreatedProject createProjectAndAttachBilling(const std::optional<std::string>& projectId) override;

    static std::string generateProjectId();

private:
    IGoogleApi& api;
    ICommandRunner& runner;
    std::string gcloudPath;

    CommandResult gcloud(const std::vector<std::string>& args);
};
