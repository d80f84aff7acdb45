#include "gcp/GoogleApiClient.h"
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif
#include "httplib.h"
#include "utils/HttpUrl.h"
#include "utils/Logger.h"

namespace {
std::string describeFailure(const httplib::Result& res) {
    if (!res) {
        return "request failed: " + httplib::to_string(res.error());
    }
    std::string message;
    try {
        auto j = nlohmann::json::parse(res->body);
        if (j.contains("error") && j["error"].is_object()) {
            message = j["error"].value("message", "");
        }
    } catch (const nlohmann::json::exception&) {
        // not JSON; fall back to the raw body
    }
    if (message.empty()) message = res->body;
    return "HTTP " + std::to_string(res->status) + ": " + message;
}
} // namespace

nlohmann::json GoogleApiClient::getJson(const std::string& url) {
    return send("GET", url, "");
}

nlohmann::json GoogleApiClient::postJson(const std::string& url, const nlohmann::json& body) {
    return send("POST", url, body.dump());
}

nlohmann::json GoogleApiClient::send(const std::string& method, const std::string& url, const std::string& body) {
    HttpUrl target = HttpUrl::parse(url);
    httplib::Headers headers = {
        {"Authorization", "Bearer " + tokens.getAccessToken()},
        {"Accept", "application/json"}
    };

    Logger::getInstance().debug(method + " " + url);

    httplib::Result res;
    if (target.isSsl) {
        httplib::SSLClient cli(target.host, target.port);
        cli.set_follow_location(true);
        cli.set_connection_timeout(10);
        cli.set_read_timeout(60);
        res = method == "GET" ? cli.Get(target.path, headers)
                              : cli.Post(target.path, headers, body, "application/json");
    } else {
        httplib::Client cli(target.host, target.port);
        cli.set_follow_location(true);
        cli.set_connection_timeout(10);
        cli.set_read_timeout(60);
        res = method == "GET" ? cli.Get(target.path, headers)
                              : cli.Post(target.path, headers, body, "application/json");
    }

    if (!res || res->status < 200 || res->status >= 300) {
        throw GoogleApiError(res ? res->status : 0, describeFailure(res));
    }
    if (res->body.empty()) {
        return nlohmann::json::object();
    }
    return nlohmann::json::parse(res->body);
}
