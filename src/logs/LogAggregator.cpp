#include "logs/LogAggregator.h"
#include "core/Errors.h"
#include "utils/Logger.h"
#include <vector>

std::string LogAggregator::fetchAllLogs(const std::string& project, const std::string& region,
                                        const std::string& service) {
    std::vector<std::string> blocks;
    std::optional<std::string> cursor;
    int pages = 0;

    do {
        LogPage page;
        try {
            page = source.fetchPage(project, region, service, cursor);
        } catch (const std::exception& e) {
            Logger::getInstance().error("Log page " + std::to_string(pages + 1) + " for " + service +
                                        " failed: " + e.what());
            throw PageFetchError(e.what());
        }
        ++pages;

        if (page.logs && !page.logs->empty()) {
            blocks.push_back(std::move(*page.logs));
        }
        cursor = std::move(page.nextPageToken);
    } while (cursor);

    Logger::getInstance().debug("Fetched " + std::to_string(pages) + " log page(s) for " + service);

    std::string out;
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        if (i > 0) out += "\n";
        out += blocks[i];
    }
    return out;
}
