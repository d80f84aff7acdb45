#include "gcp/CloudLoggingClient.h"

namespace {
const char* ENTRIES_LIST_URL = "https://logging.googleapis.com/v2/entries:list";

// Logging query string literal: backslash and double quote must be escaped
std::string quoted(const std::string& value) {
    std::string out = "\"";
    for (char c : value) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    out += '"';
    return out;
}
}

std::string CloudLoggingClient::buildFilter(const std::string& region, const std::string& service) {
    return "resource.type=\"cloud_run_revision\" AND resource.labels.service_name=" + quoted(service) +
           " AND resource.labels.location=" + quoted(region);
}

std::string CloudLoggingClient::formatEntry(const nlohmann::json& entry) {
    std::string timestamp = entry.value("timestamp", "");
    std::string severity = entry.value("severity", "DEFAULT");

    std::string payload;
    if (entry.contains("textPayload") && entry["textPayload"].is_string()) {
        payload = entry["textPayload"].get<std::string>();
    } else if (entry.contains("jsonPayload") && entry["jsonPayload"].is_object()) {
        const auto& jp = entry["jsonPayload"];
        if (jp.contains("message") && jp["message"].is_string()) {
            payload = jp["message"].get<std::string>();
        } else {
            payload = jp.dump();
        }
    } else if (entry.contains("httpRequest") && entry["httpRequest"].is_object()) {
        const auto& req = entry["httpRequest"];
        std::string status = req.contains("status") ? req["status"].dump() : "-";
        payload = req.value("requestMethod", "-") + " " + status + " " + req.value("requestUrl", "-");
    } else if (entry.contains("protoPayload")) {
        payload = entry["protoPayload"].dump();
    }

    return "[" + timestamp + "] [" + severity + "] " + payload;
}

LogPage CloudLoggingClient::fetchPage(const std::string& project, const std::string& region,
                                      const std::string& service,
                                      const std::optional<std::string>& pageToken) {
    nlohmann::json body = {
        {"resourceNames", nlohmann::json::array({"projects/" + project})},
        {"filter", buildFilter(region, service)},
        {"orderBy", "timestamp desc"},
        {"pageSize", pageSize}
    };
    if (pageToken) {
        body["pageToken"] = *pageToken;
    }

    nlohmann::json res = api.postJson(ENTRIES_LIST_URL, body);

    LogPage page;
    if (res.contains("entries") && res["entries"].is_array() && !res["entries"].empty()) {
        std::string block;
        for (const auto& entry : res["entries"]) {
            if (!block.empty()) block += "\n";
            block += formatEntry(entry);
        }
        page.logs = block;
    }

    // entries:list reports the last page with an absent or empty token
    std::string next = res.value("nextPageToken", "");
    if (!next.empty()) {
        page.nextPageToken = next;
    }
    return page;
}
