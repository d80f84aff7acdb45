#include "gcp/CloudRunServices.h"

namespace {
std::string servicesUrl(const std::string& project, const std::string& region) {
    return "https://run.googleapis.com/v2/projects/" + project + "/locations/" + region + "/services";
}
} // namespace

ServiceInfo CloudRunServices::fromResource(const nlohmann::json& resource) {
    ServiceInfo info;
    std::string fullName = resource.value("name", "");
    auto slash = fullName.rfind('/');
    info.name = slash == std::string::npos ? fullName : fullName.substr(slash + 1);
    info.uri = resource.value("uri", "");
    info.lastModifier = resource.value("lastModifier", "");
    return info;
}

std::vector<ServiceInfo> CloudRunServices::listServices(const std::string& project, const std::string& region) {
    std::vector<ServiceInfo> services;
    std::string pageToken;
    do {
        std::string url = servicesUrl(project, region);
        if (!pageToken.empty()) url += "?pageToken=" + pageToken;
        nlohmann::json res = api.getJson(url);
        if (res.contains("services") && res["services"].is_array()) {
            for (const auto& s : res["services"]) {
                services.push_back(fromResource(s));
            }
        }
        pageToken = res.value("nextPageToken", "");
    } while (!pageToken.empty());
    return services;
}

std::optional<ServiceInfo> CloudRunServices::getService(const std::string& project, const std::string& region,
                                                        const std::string& service) {
    try {
        return fromResource(api.getJson(servicesUrl(project, region) + "/" + service));
    } catch (const GoogleApiError& e) {
        if (e.getStatus() == 404) return std::nullopt;
        throw;
    }
}
