#pragma once
#include "gcp/CloudInterfaces.h"

// Cloud Run Admin API v2
class CloudRunServices : public ICloudRunServices {
public:
    explicit CloudRunServices(IGoogleApi& api) : api(api) {}

    std::vector<ServiceInfo> listServices(const std::string& project, const std::string& region) override;
    std::optional<ServiceInfo> getService(const std::string& project, const std::string& region,
                                          const std::string& service) override;

    static ServiceInfo fromResource(const nlohmann::json& resource);

private:
    IGoogleApi& api;
};
