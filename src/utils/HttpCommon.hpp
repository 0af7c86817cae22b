#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <vector>

namespace utils
{

struct Header
{
    std::string name;
    std::string value;
};

struct SessionConfig
{
    int connect_timeout_ms = 5000;
    int timeout_ms = 45000;
    std::atomic<bool>* cancel_flag = nullptr;
};

struct HttpResponse
{
    int status_code = 0;
    std::string text;
    std::string error; // non-empty on network/transport errors

    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }
};

// JSON POST helper
HttpResponse post_json(const std::string& url, const std::string& body, const std::vector<Header>& headers,
                       const SessionConfig& cfg);

// Signature of post_json; clients take one of these so tests can swap the transport.
using PostJsonFn = std::function<HttpResponse(const std::string& url, const std::string& body,
                                              const std::vector<Header>& headers, const SessionConfig& cfg)>;

} // namespace utils
