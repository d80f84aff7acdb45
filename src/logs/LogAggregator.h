#pragma once
#include <string>
#include <optional>

/**
 * @brief 一页日志
 *
 * logs 为空或缺失表示本页没有内容;nextPageToken 缺失表示没有更多页。
 */
struct LogPage {
    std::optional<std::string> logs;
    std::optional<std::string> nextPageToken;
};

class ILogPageSource {
public:
    virtual ~ILogPageSource() = default;
    virtual LogPage fetchPage(const std::string& project, const std::string& region,
                              const std::string& service,
                              const std::optional<std::string>& pageToken) = 0;
};

/**
 * @brief 按游标逐页拉取并拼接某个服务的全部日志
 *
 * 页按请求顺序串行拉取,每块只追加一次。
 * 任意一页失败都会丢弃已拉取的内容并抛出 PageFetchError,不返回部分结果,也不重试。
 */
class LogAggregator {
public:
    explicit LogAggregator(ILogPageSource& source) : source(source) {}

    std::string fetchAllLogs(const std::string& project, const std::string& region,
                             const std::string& service);

private:
    ILogPageSource& source;
};
