#include "mcp/PromptCatalog.h"
#include <stdexcept>

namespace {
// Absent, non-string and empty arguments all fall back.
std::string argumentOr(const nlohmann::json& args, const std::string& key, const std::string& fallback) {
    if (args.is_object() && args.contains(key) && args[key].is_string()) {
        std::string value = args[key].get<std::string>();
        if (!value.empty()) return value;
    }
    return fallback;
}
} // namespace

PromptCatalog PromptCatalog::withDefaults() {
    PromptCatalog catalog;
    catalog.add({
        "deploy",
        "Deploys the current working directory to Cloud Run.",
        {{"name", "Name of the Cloud Run service to deploy to.  Defaults to the name of the current directory"}},
        [](const nlohmann::json& args) {
            return "Use the deploy_local_folder tool to deploy the current folder. The service name should be " +
                   argumentOr(args, "name", "a name for the application based on the current working directory.");
        }
    });
    catalog.add({
        "logs",
        "Gets the logs for a Cloud Run service.",
        {{"service", "Name of the Cloud Run service. Defaults to the name of the current directory."}},
        [](const nlohmann::json& args) {
            return "Use get_service_log to get logs for the service " +
                   argumentOr(args, "service", "named for the current working directory");
        }
    });
    return catalog;
}

void PromptCatalog::add(Prompt prompt) {
    prompts.push_back(std::move(prompt));
}

bool PromptCatalog::has(const std::string& name) const {
    for (const auto& p : prompts) {
        if (p.name == name) return true;
    }
    return false;
}

nlohmann::json PromptCatalog::list() const {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& p : prompts) {
        nlohmann::json arguments = nlohmann::json::array();
        for (const auto& a : p.arguments) {
            arguments.push_back({{"name", a.name}, {"description", a.description}, {"required", false}});
        }
        out.push_back({{"name", p.name}, {"description", p.description}, {"arguments", arguments}});
    }
    return out;
}

nlohmann::json PromptCatalog::get(const std::string& name, const nlohmann::json& args) const {
    for (const auto& p : prompts) {
        if (p.name != name) continue;
        return {
            {"description", p.description},
            {"messages", nlohmann::json::array({
                {{"role", "user"}, {"content", {{"type", "text"}, {"text", p.render(args)}}}}
            })}
        };
    }
    throw std::out_of_range("Unknown prompt: " + name);
}
