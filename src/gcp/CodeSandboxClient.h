#pragma once
#include <string>
#include "gcp/CloudInterfaces.h"

// POSTs Python source to `<url>/execute` and returns the sandbox output
class CodeSandboxClient : public ICodeSandbox {
public:
    explicit CodeSandboxClient(const std::string& baseUrl) : baseUrl(baseUrl) {}

    std::string run(const std::string& code) override;

private:
    std::string baseUrl;
};
