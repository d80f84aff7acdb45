#include "utils/HttpUrl.h"
#include <regex>
#include <stdexcept>

HttpUrl HttpUrl::parse(const std::string& url) {
    static const std::regex urlRegex(R"((http|https)://([^/:?#]+)(?::(\d+))?([^#]*))");
    std::smatch match;
    if (!std::regex_match(url, match, urlRegex)) {
        throw std::invalid_argument("Invalid URL: " + url);
    }

    HttpUrl out;
    out.isSsl = (match[1] == "https");
    out.host = match[2];
    if (match[3].matched) {
        out.port = std::stoi(match[3]);
    } else {
        out.port = out.isSsl ? 443 : 80;
    }
    out.path = match[4];
    if (out.path.empty()) {
        out.path = "/";
    } else if (out.path.front() == '?') {
        out.path = "/" + out.path;
    }
    return out;
}
