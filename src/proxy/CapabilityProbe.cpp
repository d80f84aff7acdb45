#include "proxy/CapabilityProbe.h"
#include "utils/Logger.h"

bool GcloudComponentProbe::isInstalled(const std::string& componentId) {
    CommandResult res = runner.run(gcloudPath, {"components", "list", "--format=value(id)"});
    if (!res.ok()) {
        Logger::getInstance().warn("Component listing failed (exit " + std::to_string(res.exitCode) + "): " + res.err);
        return false;
    }
    return res.out.find(componentId) != std::string::npos;
}
