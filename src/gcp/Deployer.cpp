#include "gcp/Deployer.h"
#include "utils/Logger.h"
#include <fstream>
#include <chrono>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {
class TempDir {
public:
    TempDir() {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path = fs::temp_directory_path() / ("cirrus_deploy_" + std::to_string(stamp));
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    fs::path path;
};

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// Relative, no "..": contents must land inside the staging directory
fs::path safeRelative(const std::string& filename) {
    fs::path rel = fs::u8path(filename).lexically_normal();
    if (rel.empty() || rel.is_absolute()) {
        throw std::runtime_error("Invalid file name: " + filename);
    }
    for (const auto& part : rel) {
        if (part == "..") throw std::runtime_error("Invalid file name: " + filename);
    }
    return rel;
}
} // namespace

fs::path GcloudDeployer::stageSources(const DeployRequest& request, const fs::path& staging) {
    if (!request.fileContents.empty()) {
        for (const auto& file : request.fileContents) {
            fs::path target = staging / safeRelative(file.filename);
            fs::create_directories(target.parent_path());
            std::ofstream out(target, std::ios::binary);
            if (!out.is_open()) {
                throw std::runtime_error("Could not write " + file.filename);
            }
            out << file.content;
        }
        return staging;
    }

    if (request.paths.empty()) {
        throw std::runtime_error("No files specified for deployment");
    }

    if (request.paths.size() == 1 && fs::is_directory(fs::u8path(request.paths.front()))) {
        return fs::u8path(request.paths.front());
    }

    for (const auto& p : request.paths) {
        fs::path src = fs::u8path(p);
        if (!fs::exists(src)) {
            throw std::runtime_error("File not found: " + p);
        }
        fs::path dest = staging / src.filename();
        if (fs::is_directory(src)) {
            fs::copy(src, dest, fs::copy_options::recursive | fs::copy_options::overwrite_existing);
        } else {
            fs::copy_file(src, dest, fs::copy_options::overwrite_existing);
        }
    }
    return staging;
}

DeployResult GcloudDeployer::runDeploy(const std::string& projectId, const std::string& region,
                                       const std::string& serviceName, const std::string& sourceFlag,
                                       bool skipIamCheck) {
    std::vector<std::string> args = {
        "run", "deploy", serviceName,
        sourceFlag,
        "--project=" + projectId,
        "--region=" + region,
        "--quiet"
    };
    if (!skipIamCheck) {
        args.push_back("--allow-unauthenticated");
    }

    Logger::getInstance().info("Deploying " + serviceName + " to project " + projectId + " (" + region + ")");
    CommandResult res = runner.run(gcloudPath, args);
    if (!res.ok()) {
        throw std::runtime_error(trim(res.err).empty() ? "gcloud run deploy failed" : trim(res.err));
    }

    CommandResult url = runner.run(gcloudPath, {
        "run", "services", "describe", serviceName,
        "--project=" + projectId,
        "--region=" + region,
        "--format=value(status.url)"
    });
    if (!url.ok()) {
        throw std::runtime_error("Deployed, but could not read the service URL: " + trim(url.err));
    }
    Logger::getInstance().success("Deployed " + serviceName);
    return {trim(url.out)};
}

DeployResult GcloudDeployer::deploy(const DeployRequest& request) {
    TempDir staging;
    fs::path source = stageSources(request, staging.path);
    return runDeploy(request.projectId, request.region, request.serviceName,
                     "--source=" + source.u8string(), request.skipIamCheck);
}

DeployResult GcloudDeployer::deployImage(const std::string& projectId, const std::string& region,
                                         const std::string& serviceName, const std::string& imageUrl,
                                         bool skipIamCheck) {
    return runDeploy(projectId, region, serviceName, "--image=" + imageUrl, skipIamCheck);
}
