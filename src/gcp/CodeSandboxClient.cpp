#include "gcp/CodeSandboxClient.h"
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif
#include "httplib.h"
#include "utils/HttpUrl.h"
#include <stdexcept>

std::string CodeSandboxClient::run(const std::string& code) {
    std::string base = baseUrl;
    while (!base.empty() && base.back() == '/') base.pop_back();
    HttpUrl target = HttpUrl::parse(base + "/execute");

    httplib::Result res;
    if (target.isSsl) {
        httplib::SSLClient cli(target.host, target.port);
        cli.set_connection_timeout(10);
        cli.set_read_timeout(120);
        res = cli.Post(target.path, code, "text/plain");
    } else {
        httplib::Client cli(target.host, target.port);
        cli.set_connection_timeout(10);
        cli.set_read_timeout(120);
        res = cli.Post(target.path, code, "text/plain");
    }

    if (!res) {
        throw std::runtime_error("request failed: " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        throw std::runtime_error("HTTP error! status: " + std::to_string(res->status) + ", message: " + res->body);
    }
    return res->body;
}
