#include "CloudRunTools.h"
#include <stdexcept>
#include "ArgumentReader.h"
#include "ToolGateway.h"
#include "core/Errors.h"
#include "logs/LogAggregator.h"
#include "proxy/ProxyManager.h"
#include "utils/Logger.h"

namespace {
const char* const PROJECT_REQUIRED =
    "Project must be specified, please prompt the user for a valid existing Google Cloud project ID.";

nlohmann::json stringProperty(const std::string& description) {
    return {{"type", "string"}, {"description", description}};
}

// project/region/service are shared by most tools; defaults come from the environment
nlohmann::json locationProperties(const std::string& projectDescription) {
    return {
        {"project", stringProperty(projectDescription)},
        {"region", stringProperty("Region to deploy the service to")},
        {"service", stringProperty("Name of the Cloud Run service to deploy to")}
    };
}

struct Location {
    std::string project;
    std::string region;
    std::string service;
};

// Used only to phrase error texts; never validates.
Location describeLocation(const nlohmann::json& args, const CloudRunDefaults& defaults) {
    if (!args.is_object()) return {defaults.project, defaults.region, defaults.service};
    ArgumentReader reader(args);
    return {defaults.projectBound ? defaults.project : reader.stringOr("project", defaults.project),
            reader.stringOr("region", defaults.region),
            reader.stringOr("service", defaults.service)};
}

// A project-bound tool ignores any "project" argument
std::string projectFrom(const ArgumentReader& reader, const CloudRunDefaults& defaults, const std::string& message) {
    if (defaults.projectBound) return defaults.project;
    return reader.requireString("project", defaults.project, message);
}

std::string deployedText(const std::string& service, const std::string& project, const std::string& region,
                         const std::string& uri, const std::string& folder = "") {
    std::string text = "Cloud Run service " + service + " deployed";
    if (!folder.empty()) text += " from folder " + folder;
    text += " in project " + project;
    text += "\nCloud Console: https://console.cloud.google.com/run/detail/" + region + "/" + service +
            "?project=" + project;
    text += "\nService URL: " + uri;
    return text;
}
} // namespace

// ---------------------------------------------------------------------------
// Projects
// ---------------------------------------------------------------------------

nlohmann::json ListProjectsTool::getSchema() const {
    return {{"type", "object"}, {"properties", nlohmann::json::object()}};
}

ToolResult ListProjectsTool::execute(const nlohmann::json& args) {
    ArgumentReader reader(args);
    (void)reader;

    std::string text = "Available GCP Projects:";
    for (const auto& project : projects.listProjects()) {
        text += "\n- " + project.id;
    }
    return ToolResult::ok(text);
}

std::string CreateProjectTool::getDescription() const {
    return "Creates a new GCP project and attempts to attach it to the first available billing account. "
           "A project ID can be optionally specified; otherwise it will be automatically generated.";
}

nlohmann::json CreateProjectTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"projectId", stringProperty("Optional. The desired ID for the new GCP project. "
                                         "If not provided, an ID will be auto-generated.")}
        }}
    };
}

ToolResult CreateProjectTool::execute(const nlohmann::json& args) {
    ArgumentReader reader(args);
    auto projectId = reader.optionalString("projectId", "If provided, Project ID must be a non-empty string.");

    CreatedProject created = projects.createProjectAndAttachBilling(projectId);
    if (!created.billingMessage.empty()) {
        Logger::getInstance().info(created.billingMessage);
    }
    return ToolResult::ok("Successfully created GCP project with ID \"" + created.projectId +
                          "\". You can now use this project ID for deployments.");
}

// ---------------------------------------------------------------------------
// Services
// ---------------------------------------------------------------------------

std::string ListServicesTool::getDescription() const {
    if (defaults.projectBound) {
        return "Lists Cloud Run services in GCP project " + defaults.project + " and a given region.";
    }
    return "Lists Cloud Run services in a given project and region.";
}

nlohmann::json ListServicesTool::getSchema() const {
    nlohmann::json properties = {{"region", stringProperty("Region where the services are located")}};
    if (!defaults.projectBound) properties["project"] = stringProperty("Google Cloud project ID");
    return {{"type", "object"}, {"properties", properties}};
}

ToolResult ListServicesTool::execute(const nlohmann::json& args) {
    ArgumentReader reader(args);
    std::string project = projectFrom(reader, defaults, "Project ID must be provided and be a non-empty string.");
    std::string region = reader.requireString("region", defaults.region, "Region must be a non-empty string.");

    std::string text = "Services in project " + project + " (location " + region + "):";
    for (const auto& service : services.listServices(project, region)) {
        text += "\n- " + service.name + " (URL: " + service.uri + ")";
    }
    return ToolResult::ok(text);
}

std::string ListServicesTool::describeOperation(const nlohmann::json& args) const {
    Location loc = describeLocation(args, defaults);
    return "listing services for project " + loc.project + " (region " + loc.region + ")";
}

std::string GetServiceTool::getDescription() const {
    if (defaults.projectBound) {
        return "Gets details for a specific Cloud Run service in GCP project " + defaults.project + ".";
    }
    return "Gets details for a specific Cloud Run service.";
}

nlohmann::json GetServiceTool::getSchema() const {
    nlohmann::json properties = {
        {"region", stringProperty("Region where the service is located")},
        {"service", stringProperty("Name of the Cloud Run service")}
    };
    if (!defaults.projectBound) {
        properties["project"] = stringProperty("Google Cloud project ID containing the service");
    }
    return {{"type", "object"}, {"properties", properties}};
}

ToolResult GetServiceTool::execute(const nlohmann::json& args) {
    ArgumentReader reader(args);
    std::string project = projectFrom(reader, defaults, "Project ID must be provided.");
    std::string region = reader.requireString("region", defaults.region, "Region must be a non-empty string.");
    std::string service = reader.requireString("service", defaults.service, "Service name must be provided.");

    auto details = services.getService(project, region, service);
    if (!details) {
        return ToolResult::ok("Service " + service + " not found in project " + project + " (region " + region + ").");
    }
    return ToolResult::ok("Name: " + service + "\nRegion: " + region + "\nProject: " + project +
                          "\nURL: " + details->uri + "\nLast deployed by: " + details->lastModifier);
}

std::string GetServiceTool::describeOperation(const nlohmann::json& args) const {
    Location loc = describeLocation(args, defaults);
    return "getting service " + loc.service + " in project " + loc.project + " (region " + loc.region + ")";
}

nlohmann::json GetServiceLogTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"project", stringProperty("Google Cloud project ID containing the service")},
            {"region", stringProperty("Region where the service is located")},
            {"service", stringProperty("Name of the Cloud Run service")}
        }}
    };
}

ToolResult GetServiceLogTool::execute(const nlohmann::json& args) {
    ArgumentReader reader(args);
    std::string project = reader.requireString("project", defaults.project, "Project ID must be provided.");
    std::string region = reader.requireString("region", defaults.region, "Region must be a non-empty string.");
    std::string service = reader.requireString("service", defaults.service, "Service name must be provided.");

    return ToolResult::ok(aggregator.fetchAllLogs(project, region, service));
}

std::string GetServiceLogTool::describeOperation(const nlohmann::json& args) const {
    Location loc = describeLocation(args, defaults);
    return "getting Logs for service " + loc.service + " in project " + loc.project + " (region " + loc.region + ")";
}

// ---------------------------------------------------------------------------
// Deployment
// ---------------------------------------------------------------------------

std::string DeployLocalFilesTool::getDescription() const {
    return "Deploy local files to Cloud Run. Takes an array of absolute file paths from the local filesystem "
           "that will be deployed. Use this tool if the files exists on the user local filesystem.";
}

nlohmann::json DeployLocalFilesTool::getSchema() const {
    nlohmann::json properties = locationProperties(
        "Google Cloud project ID. Do not select it yourself, make sure the user provides or confirms the project ID.");
    properties["files"] = {
        {"type", "array"},
        {"items", {{"type", "string"}}},
        {"description", "Array of absolute file paths to deploy (e.g. [\"/home/user/project/src/index.js\", "
                        "\"/home/user/project/package.json\"])"}
    };
    return {{"type", "object"}, {"properties", properties}, {"required", {"files"}}};
}

ToolResult DeployLocalFilesTool::execute(const nlohmann::json& args) {
    ArgumentReader reader(args);
    DeployRequest request;
    request.projectId = reader.requireString("project", defaults.project, PROJECT_REQUIRED);
    request.region = reader.requireString("region", defaults.region, "Region must be a non-empty string.");
    request.serviceName = reader.requireString("service", defaults.service, "Service name must be a non-empty string.");
    request.paths = reader.stringArray("files", "Files must be specified", "No files specified for deployment");
    request.skipIamCheck = defaults.skipIamCheck;

    DeployResult result = deployer.deploy(request);
    return ToolResult::ok(deployedText(request.serviceName, request.projectId, request.region, result.uri));
}

std::string DeployLocalFolderTool::getDescription() const {
    return "Deploy a local folder to Cloud Run. Takes an absolute folder path from the local filesystem that "
           "will be deployed. Use this tool if the entire folder content needs to be deployed.";
}

nlohmann::json DeployLocalFolderTool::getSchema() const {
    nlohmann::json properties = locationProperties(
        "Google Cloud project ID. Do not select it yourself, make sure the user provides or confirms the project ID.");
    properties["folderPath"] = stringProperty("Absolute path to the folder to deploy (e.g. \"/home/user/project/src\")");
    return {{"type", "object"}, {"properties", properties}, {"required", {"folderPath"}}};
}

ToolResult DeployLocalFolderTool::execute(const nlohmann::json& args) {
    ArgumentReader reader(args);
    DeployRequest request;
    request.projectId = reader.requireString("project", defaults.project, PROJECT_REQUIRED);
    request.region = reader.requireString("region", defaults.region, "Region must be a non-empty string.");
    request.serviceName = reader.requireString("service", defaults.service, "Service name must be a non-empty string.");
    std::string folderPath =
        reader.requireString("folderPath", "", "Folder path must be specified and be a non-empty string.");
    request.paths = {folderPath};
    request.skipIamCheck = defaults.skipIamCheck;

    DeployResult result = deployer.deploy(request);
    return ToolResult::ok(deployedText(request.serviceName, request.projectId, request.region, result.uri, folderPath));
}

std::string DeployFileContentsTool::getDescription() const {
    if (defaults.projectBound) {
        return "Deploy files to Cloud Run by providing their contents directly to the GCP project " +
               defaults.project + ".";
    }
    return "Deploy files to Cloud Run by providing their contents directly. Takes an array of file objects "
           "containing filename and content. Use this tool if the files only exist in the current chat context.";
}

nlohmann::json DeployFileContentsTool::getSchema() const {
    nlohmann::json properties = locationProperties(
        "Google Cloud project ID. Leave unset for the app to be deployed in a new project. If provided, make sure "
        "the user confirms the project ID they want to deploy to.");
    properties["files"] = {
        {"type", "array"},
        {"items", {
            {"type", "object"},
            {"properties", {
                {"filename", stringProperty("Name and path of the file (e.g. \"src/index.js\" or \"data/config.json\")")},
                {"content", stringProperty("Text content of the file")}
            }},
            {"required", {"filename"}}
        }},
        {"description", "Array of file objects containing filename and content"}
    };
    if (defaults.projectBound) properties.erase("project");
    return {{"type", "object"}, {"properties", properties}, {"required", {"files"}}};
}

ToolResult DeployFileContentsTool::execute(const nlohmann::json& args) {
    ArgumentReader reader(args);
    DeployRequest request;
    request.projectId = projectFrom(reader, defaults, PROJECT_REQUIRED);
    request.region = reader.requireString("region", defaults.region, "Region must be a non-empty string.");
    request.serviceName = reader.requireString("service", defaults.service, "Service name must be a non-empty string.");
    request.skipIamCheck = defaults.skipIamCheck;

    for (const auto& file : reader.array("files", "Files must be specified", "No files specified for deployment")) {
        if (!file.is_object() || !file.contains("filename") || !file["filename"].is_string() ||
            file["filename"].get<std::string>().empty()) {
            throw ValidationError("Each file must have a filename");
        }
        std::string filename = file["filename"].get<std::string>();
        if (!file.contains("content") || !file["content"].is_string()) {
            throw ValidationError("File " + filename + " must have content");
        }
        request.fileContents.push_back({filename, file["content"].get<std::string>()});
    }

    DeployResult result = deployer.deploy(request);
    return ToolResult::ok(deployedText(request.serviceName, request.projectId, request.region, result.uri));
}

std::string DeployContainerImageTool::getDescription() const {
    if (defaults.projectBound) {
        return "Deploys a container image to Cloud Run in the GCP project " + defaults.project +
               ". Use this tool if the user provides a container image URL.";
    }
    return "Deploys a container image to Cloud Run. Use this tool if the user provides a container image URL.";
}

nlohmann::json DeployContainerImageTool::getSchema() const {
    nlohmann::json properties = locationProperties(
        "Google Cloud project ID. Do not select it yourself, make sure the user provides or confirms the project ID.");
    properties["imageUrl"] = stringProperty("The URL of the container image to deploy (e.g. \"gcr.io/cloudrun/hello\")");
    if (defaults.projectBound) properties.erase("project");
    return {{"type", "object"}, {"properties", properties}, {"required", {"imageUrl"}}};
}

ToolResult DeployContainerImageTool::execute(const nlohmann::json& args) {
    ArgumentReader reader(args);
    std::string project = projectFrom(reader, defaults, PROJECT_REQUIRED);
    std::string region = reader.requireString("region", defaults.region, "Region must be a non-empty string.");
    std::string service = reader.requireString("service", defaults.service, "Service name must be a non-empty string.");
    std::string imageUrl =
        reader.requireString("imageUrl", "", "Container image URL must be specified and be a non-empty string.");

    DeployResult result = deployer.deployImage(project, region, service, imageUrl, defaults.skipIamCheck);
    return ToolResult::ok(deployedText(service, project, region, result.uri));
}

// ---------------------------------------------------------------------------
// Sandbox
// ---------------------------------------------------------------------------

nlohmann::json RunPythonCodeTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {{"code", stringProperty("The Python code to execute.")}}},
        {"required", {"code"}}
    };
}

ToolResult RunPythonCodeTool::execute(const nlohmann::json& args) {
    if (!sandbox) {
        return ToolResult::ok("Error: CODE_SANDBOX_URL environment variable is not set.");
    }
    ArgumentReader reader(args);
    std::string code = reader.requireString("code", "", "Code must be a non-empty string.");
    return ToolResult::ok(sandbox->run(code));
}

// ---------------------------------------------------------------------------
// Proxy
// ---------------------------------------------------------------------------

std::string StartProxyTool::getDescription() const {
    return "Starts a local proxy to a Cloud Run service so it can be called on localhost without "
           "handling authentication. Only one proxy can run at a time.";
}

nlohmann::json StartProxyTool::getSchema() const {
    nlohmann::json properties = locationProperties("Google Cloud project ID containing the service");
    properties["service"] = stringProperty("Name of the Cloud Run service to proxy");
    properties["port"] = {
        {"type", "integer"},
        {"description", "Local port to listen on"},
        {"minimum", 1},
        {"maximum", 65535}
    };
    return {{"type", "object"}, {"properties", properties}};
}

ToolResult StartProxyTool::execute(const nlohmann::json& args) {
    ArgumentReader reader(args);
    std::string project = reader.requireString("project", defaults.project,
                                               "Project ID must be provided and be a non-empty string.");
    std::string region = reader.requireString("region", defaults.region, "Region must be a non-empty string.");
    std::string service = reader.requireString("service", defaults.service, "Service name must be provided.");
    int port = reader.integer("port", defaults.proxyPort, 1, 65535, "Port must be an integer between 1 and 65535.");

    return ToolResult::ok(proxy.startProxy(project, region, service, port));
}

std::string StartProxyTool::describeOperation(const nlohmann::json& args) const {
    Location loc = describeLocation(args, defaults);
    return "starting proxy for service " + loc.service + " in project " + loc.project + " (region " + loc.region + ")";
}

nlohmann::json StopProxyTool::getSchema() const {
    return {{"type", "object"}, {"properties", nlohmann::json::object()}};
}

ToolResult StopProxyTool::execute(const nlohmann::json& args) {
    ArgumentReader reader(args);
    (void)reader;
    return ToolResult::ok(proxy.stopProxy());
}

void registerCloudRunTools(ToolGateway& gateway, CloudRunToolContext& ctx) {
    gateway.registerTool(std::make_unique<ListProjectsTool>(ctx.projects));
    gateway.registerTool(std::make_unique<CreateProjectTool>(ctx.projects));
    gateway.registerTool(std::make_unique<ListServicesTool>(ctx.services, ctx.defaults));
    gateway.registerTool(std::make_unique<GetServiceTool>(ctx.services, ctx.defaults));
    gateway.registerTool(std::make_unique<GetServiceLogTool>(ctx.logs, ctx.defaults));
    gateway.registerTool(std::make_unique<DeployLocalFilesTool>(ctx.deployer, ctx.defaults));
    gateway.registerTool(std::make_unique<DeployLocalFolderTool>(ctx.deployer, ctx.defaults));
    gateway.registerTool(std::make_unique<DeployFileContentsTool>(ctx.deployer, ctx.defaults));
    gateway.registerTool(std::make_unique<DeployContainerImageTool>(ctx.deployer, ctx.defaults));
    gateway.registerTool(std::make_unique<StartProxyTool>(ctx.proxy, ctx.defaults));

    gateway.registerTool(std::make_unique<StopProxyTool>(ctx.proxy), ToolGate::None);
    gateway.registerTool(std::make_unique<RunPythonCodeTool>(ctx.sandbox), ToolGate::None);
}

void registerCloudRunToolsRemote(ToolGateway& gateway, CloudRunToolContext& ctx) {
    if (ctx.defaults.project.empty()) {
        throw std::runtime_error(
            "Cannot register remote tools: GCP project ID could not be determined. Please ensure "
            "GOOGLE_CLOUD_PROJECT environment variable is set or the server is running on GCP.");
    }

    CloudRunDefaults bound = ctx.defaults;
    bound.projectBound = true;
    gateway.registerTool(std::make_unique<ListServicesTool>(ctx.services, bound));
    gateway.registerTool(std::make_unique<GetServiceTool>(ctx.services, bound));
    // Logs keep an overridable project that defaults to the bound one
    gateway.registerTool(std::make_unique<GetServiceLogTool>(ctx.logs, ctx.defaults));
    gateway.registerTool(std::make_unique<DeployFileContentsTool>(ctx.deployer, bound));
    gateway.registerTool(std::make_unique<DeployContainerImageTool>(ctx.deployer, bound));
}
