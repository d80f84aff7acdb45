#pragma once
#include <string>
#include <vector>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <cstdlib>
#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>

struct Config {
    struct Gcp {
        std::string projectId;               // GOOGLE_CLOUD_PROJECT
        std::string region = "europe-west1"; // GOOGLE_CLOUD_REGION
        std::string serviceName = "app";     // DEFAULT_SERVICE_NAME
        bool skipIamCheck = false;           // SKIP_IAM_CHECK
        std::string gcloudPath = "gcloud";
    } gcp;

    struct Proxy {
        std::string componentId = "cloud-run-proxy";
        std::string readyMarker = "Proxying to Cloud Run service";
        int defaultPort = 8080;
        int stopTimeoutSeconds = 10;
    } proxy;

    struct Logs {
        int pageSize = 100;
    } logs;

    struct Sandbox {
        std::string url; // CODE_SANDBOX_URL
    } sandbox;

    struct Server {
        std::string transport = "stdio"; // stdio | http
        std::string host = "127.0.0.1";
        int port = 3000;                 // PORT
    } server;

    struct Logging {
        std::string level = "info";
        std::string file = "cirrus.log";
    } logging;

    static Config load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }
        return fromJson(j);
    }

    static Config fromJson(const nlohmann::json& j) {
        Config cfg;
        if (j.contains("gcp")) {
            const auto& g = j.at("gcp");
            cfg.gcp.projectId = g.value("project", cfg.gcp.projectId);
            cfg.gcp.region = g.value("region", cfg.gcp.region);
            cfg.gcp.serviceName = g.value("service", cfg.gcp.serviceName);
            cfg.gcp.skipIamCheck = g.value("skip_iam_check", cfg.gcp.skipIamCheck);
            cfg.gcp.gcloudPath = g.value("gcloud_path", cfg.gcp.gcloudPath);
        }
        if (j.contains("proxy")) {
            const auto& p = j.at("proxy");
            cfg.proxy.componentId = p.value("component_id", cfg.proxy.componentId);
            cfg.proxy.readyMarker = p.value("ready_marker", cfg.proxy.readyMarker);
            cfg.proxy.defaultPort = p.value("default_port", cfg.proxy.defaultPort);
            cfg.proxy.stopTimeoutSeconds = p.value("stop_timeout_seconds", cfg.proxy.stopTimeoutSeconds);
        }
        if (j.contains("logs")) {
            cfg.logs.pageSize = j.at("logs").value("page_size", cfg.logs.pageSize);
        }
        if (j.contains("sandbox")) {
            cfg.sandbox.url = j.at("sandbox").value("url", cfg.sandbox.url);
        }
        if (j.contains("server")) {
            const auto& s = j.at("server");
            cfg.server.transport = s.value("transport", cfg.server.transport);
            cfg.server.host = s.value("host", cfg.server.host);
            cfg.server.port = s.value("port", cfg.server.port);
        }
        if (j.contains("logging")) {
            cfg.logging.level = j.at("logging").value("level", cfg.logging.level);
            cfg.logging.file = j.at("logging").value("file", cfg.logging.file);
        }
        return cfg;
    }

    // 环境变量优先于配置文件
    void applyEnvironment() {
        if (const char* v = std::getenv("GOOGLE_CLOUD_PROJECT"); v && *v) gcp.projectId = v;
        if (const char* v = std::getenv("GOOGLE_CLOUD_REGION"); v && *v) gcp.region = v;
        if (const char* v = std::getenv("DEFAULT_SERVICE_NAME"); v && *v) gcp.serviceName = v;
        if (const char* v = std::getenv("SKIP_IAM_CHECK"); v && *v) gcp.skipIamCheck = parseFlag(v);
        if (const char* v = std::getenv("CODE_SANDBOX_URL"); v && *v) sandbox.url = v;
        if (const char* v = std::getenv("CIRRUS_LOG_LEVEL"); v && *v) logging.level = v;
        if (const char* v = std::getenv("PORT"); v && *v) {
            int p = std::atoi(v);
            if (p > 0 && p <= 65535) server.port = p;
        }
    }

    static bool parseFlag(const std::string& value) {
        std::string lower = value;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
    }
};
