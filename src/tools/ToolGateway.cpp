#include "ToolGateway.h"
#include "utils/Logger.h"

const char* const ToolGateway::CREDENTIALS_ADVISORY =
    "GCP credentials are not available. Please configure your environment.";

namespace {
// Keeps the wrapped tool's name and schema; execute() never reaches it
class CredentialsAdvisoryTool : public ITool {
public:
    explicit CredentialsAdvisoryTool(std::unique_ptr<ITool> inner) : inner(std::move(inner)) {}

    std::string getName() const override { return inner->getName(); }
    std::string getDescription() const override { return inner->getDescription(); }
    nlohmann::json getSchema() const override { return inner->getSchema(); }

    ToolResult execute(const nlohmann::json&) override {
        return ToolResult::ok(ToolGateway::CREDENTIALS_ADVISORY);
    }

private:
    std::unique_ptr<ITool> inner;
};
} // namespace

void ToolGateway::registerTool(std::unique_ptr<ITool> tool, ToolGate gate) {
    if (!tool) return;

    std::string name = tool->getName();
    if (tools.count(name)) {
        Logger::getInstance().warn("Tool registered twice, replacing: " + name);
    }

    if (gate == ToolGate::Credentials && !credentialsAvailable) {
        tool = std::make_unique<CredentialsAdvisoryTool>(std::move(tool));
    }
    tools[name] = std::move(tool);
}

ToolResult ToolGateway::callTool(const std::string& name, const nlohmann::json& args) {
    auto it = tools.find(name);
    if (it == tools.end()) {
        return ToolResult::failure("Unknown tool: " + name);
    }
    ITool& tool = *it->second;

    try {
        return tool.execute(args);
    } catch (const std::exception& e) {
        return failureFor(tool, name, args, e.what());
    } catch (...) {
        return failureFor(tool, name, args, "unknown error");
    }
}

ToolResult ToolGateway::failureFor(const ITool& tool, const std::string& name, const nlohmann::json& args,
                                   const std::string& message) const {
    std::string operation = "executing tool " + name;
    try {
        operation = tool.describeOperation(args);
    } catch (const std::exception& describeError) {
        Logger::getInstance().debug(std::string("describeOperation failed: ") + describeError.what());
    }
    Logger::getInstance().error("Tool " + name + " failed: " + message);
    return ToolResult::failure("Error " + operation + ": " + message);
}

nlohmann::json ToolGateway::listTools() const {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& [name, tool] : tools) {
        list.push_back({
            {"name", tool->getName()},
            {"description", tool->getDescription()},
            {"inputSchema", tool->getSchema()}
        });
    }
    return list;
}

bool ToolGateway::hasTool(const std::string& name) const {
    return tools.count(name) > 0;
}
