#include "gcp/ProjectService.h"
#include "utils/Logger.h"
#include <random>
#include <sstream>
#include <stdexcept>

namespace {
const char* PROJECTS_URL = "https://cloudresourcemanager.googleapis.com/v1/projects?filter=lifecycleState:ACTIVE";

std::string firstLine(const std::string& text) {
    std::istringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        if (!line.empty()) return line;
    }
    return "";
}
} // namespace

CommandResult ProjectService::gcloud(const std::vector<std::string>& args) {
    CommandResult res = runner.run(gcloudPath, args);
    if (!res.ok()) {
        throw std::runtime_error("gcloud " + args.front() + " " + (args.size() > 1 ? args[1] : "") +
                                 " failed: " + res.err);
    }
    return res;
}

std::string ProjectService::generateProjectId() {
    static const char alphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<std::size_t> dist(0, sizeof(alphabet) - 2);
    std::string id = "mcp-cvb-";
    for (int i = 0; i < 8; ++i) {
        id += alphabet[dist(gen)];
    }
    return id;
}

std::vector<ProjectInfo> ProjectService::listProjects() {
    std::vector<ProjectInfo> projects;
    std::string pageToken;
    do {
        std::string url = PROJECTS_URL;
        if (!pageToken.empty()) url += "&pageToken=" + pageToken;
        nlohmann::json res = api.getJson(url);
        if (res.contains("projects") && res["projects"].is_array()) {
            for (const auto& p : res["projects"]) {
                projects.push_back({p.value("projectId", ""), p.value("name", "")});
            }
        }
        pageToken = res.value("nextPageToken", "");
    } while (!pageToken.empty());
    return projects;
}

CreatedProject ProjectService::createProjectAndAttachBilling(const std::optional<std::string>& projectId) {
    CreatedProject created;
    created.projectId = projectId ? *projectId : generateProjectId();

    Logger::getInstance().info("Creating project " + created.projectId);
    gcloud({"projects", "create", created.projectId, "--quiet"});

    CommandResult accounts = gcloud({"billing", "accounts", "list", "--filter=open=true", "--format=value(name)"});
    std::string account = firstLine(accounts.out);
    const std::string prefix = "billingAccounts/";
    if (account.compare(0, prefix.size(), prefix) == 0) {
        account = account.substr(prefix.size());
    }

    if (account.empty()) {
        created.billingMessage = "No open billing account found. Please attach billing to project " +
                                 created.projectId + " manually.";
        Logger::getInstance().warn(created.billingMessage);
        return created;
    }

    gcloud({"billing", "projects", "link", created.projectId, "--billing-account=" + account});
    created.billingMessage = "Project " + created.projectId + " linked to billing account " + account + ".";
    return created;
}
