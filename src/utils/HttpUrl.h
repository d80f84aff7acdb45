#pragma once
#include <string>

struct HttpUrl {
    bool isSsl = true;
    std::string host;
    int port = 443;
    std::string path; // path + query, "/" when empty

    static HttpUrl parse(const std::string& url);
};
