#include "gcp/AccessTokenProvider.h"
#include "utils/Logger.h"
#include <stdexcept>

namespace {
const auto TOKEN_TTL = std::chrono::minutes(30);

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}
} // namespace

std::string GcloudAccessTokenProvider::getAccessToken() {
    std::lock_guard<std::mutex> lock(mtx);
    auto now = std::chrono::steady_clock::now();
    if (!cachedToken.empty() && now - fetchedAt < TOKEN_TTL) {
        return cachedToken;
    }

    CommandResult res = runner.run(gcloudPath, {"auth", "application-default", "print-access-token"});
    std::string token = trim(res.out);
    if (!res.ok() || token.empty()) {
        std::string detail = trim(res.err);
        throw std::runtime_error("Could not obtain an access token from Application Default Credentials" +
                                 (detail.empty() ? std::string(".") : ": " + detail));
    }

    cachedToken = token;
    fetchedAt = now;
    return cachedToken;
}

bool ensureGcpCredentials(IAccessTokenProvider& tokens) {
    auto& log = Logger::getInstance();
    log.info("Checking for Google Cloud Application Default Credentials...");
    try {
        tokens.getAccessToken();
        log.success("Application Default Credentials found.");
        return true;
    } catch (const std::exception& e) {
        log.error("Google Cloud Application Default Credentials are not set up.\n"
                  "For more details or alternative setup methods, consider:\n"
                  "1. If running locally, run: gcloud auth application-default login.\n"
                  "2. Ensuring the `GOOGLE_APPLICATION_CREDENTIALS` environment variable points to a valid service account key file.\n"
                  "3. If on a Google Cloud environment (e.g., GCE, Cloud Run), verify the associated service account has necessary permissions.\n"
                  "Original error message: " + std::string(e.what()));
        return false;
    }
}
