#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace infra::http {

struct HttpOptions {
    std::chrono::seconds timeout{20};
    bool verifyPeer = true;
    std::vector<std::pair<std::string, std::string>> headers;
};

struct HttpResponse {
    unsigned status = 0U;
    std::string body;
    std::string retry_after_header;
    std::string final_host;
    std::string final_target;
};

// HTTPS GET on port 443, following up to five same-scheme redirects.
// Throws std::runtime_error on transport failures; any HTTP status is
// returned to the caller.
HttpResponse https_get(const std::string& host, const std::string& target, const HttpOptions& options = {});

}  // namespace infra::http
