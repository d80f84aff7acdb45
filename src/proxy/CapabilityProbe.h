#pragma once
#include <string>
#include "process/CommandRunner.h"

/**
 * @brief 检查某个 CLI 组件是否已安装
 */
class ICapabilityProbe {
public:
    virtual ~ICapabilityProbe() = default;
    virtual bool isInstalled(const std::string& componentId) = 0;
};

// `gcloud components list --format=value(id)`: exit code 0 and the id present in the listing
class GcloudComponentProbe : public ICapabilityProbe {
public:
    GcloudComponentProbe(ICommandRunner& runner, const std::string& gcloudPath)
        : runner(runner), gcloudPath(gcloudPath) {}

    bool isInstalled(const std::string& componentId) override;

private:
    ICommandRunner& runner;
    std::string gcloudPath;
};
