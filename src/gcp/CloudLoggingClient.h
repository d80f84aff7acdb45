#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "gcp/CloudInterfaces.h"
#include "logs/LogAggregator.h"

/**
 * @brief Cloud Logging `entries:list` 的分页数据源
 *
 * 每页的日志条目按 "[时间] [级别] 内容" 格式化后以换行拼接为一块。
 */
class CloudLoggingClient : public ILogPageSource {
public:
    CloudLoggingClient(IGoogleApi& api, int pageSize = 100) : api(api), pageSize(pageSize) {}

    LogPage fetchPage(const std::string& project, const std::string& region,
                      const std::string& service,
                      const std::optional<std::string>& pageToken) override;

    static std::string buildFilter(const std::string& region, const std::string& service);
    static std::string formatEntry(const nlohmann::json& entry);

private:
    IGoogleApi& api;
    int pageSize;
};
