#include "mock_http.hpp"

#include <nlohmann/json.hpp>
#include <regex>

namespace test_utils {

void MockHttpClient::setResponse(const std::string& url, const MockResponse& response) {
    url_responses_[url] = response;
}

void MockHttpClient::setPatternResponse(const std::string& pattern, const MockResponse& response) {
    pattern_responses_[pattern] = response;
}

void MockHttpClient::simulateNetworkError(const std::string& error_msg) {
    simulate_error_ = true;
    error_message_ = error_msg;
}

void MockHttpClient::clearResponses() {
    url_responses_.clear();
    pattern_responses_.clear();
    simulate_error_ = false;
    error_message_.clear();
    requests_->clear();
}

MockResponse MockHttpClient::getResponse(const std::string& url) const {
    if (simulate_error_) {
        MockResponse error_resp;
        error_resp.has_error = true;
        error_resp.error_message = error_message_;
        return error_resp;
    }

    // Check exact URL match first
    auto url_it = url_responses_.find(url);
    if (url_it != url_responses_.end()) {
        return url_it->second;
    }

    // Check pattern matches
    for (const auto& [pattern, response] : pattern_responses_) {
        std::regex pattern_regex(pattern);
        if (std::regex_search(url, pattern_regex)) {
            return response;
        }
    }

    // Default 404 response
    MockResponse not_found;
    not_found.status_code = 404;
    not_found.body = "Not Found";
    return not_found;
}

utils::PostJsonFn MockHttpClient::transport() {
    return [this](const std::string& url, const std::string& body, const std::vector<utils::Header>& headers,
                  const utils::SessionConfig& cfg) {
        requests_->push_back({ url, body, headers, cfg.connect_timeout_ms, cfg.timeout_ms });

        MockResponse mock = getResponse(url);
        utils::HttpResponse resp;
        if (mock.has_error) {
            resp.error = mock.error_message;
            return resp;
        }
        resp.status_code = mock.status_code;
        resp.text = mock.body;
        return resp;
    };
}

MockResponse MockResponses::chat_success(const std::string& content) {
    nlohmann::json envelope = {
        { "choices", nlohmann::json::array({
            { { "message", { { "role", "assistant" }, { "content", content } } } },
        }) },
    };
    MockResponse response;
    response.status_code = 200;
    response.body = envelope.dump();
    return response;
}

MockResponse MockResponses::chat_error_401() {
    MockResponse response;
    response.status_code = 401;
    response.body = R"({
        "error": {
            "message": "Invalid API key provided",
            "type": "invalid_request_error"
        }
    })";
    return response;
}

MockResponse MockResponses::chat_error_quota() {
    MockResponse response;
    response.status_code = 429;
    response.body = R"({
        "error": {
            "message": "Rate limit reached",
            "type": "rate_limit_error"
        }
    })";
    return response;
}

MockResponse MockResponses::chat_error_503() {
    MockResponse response;
    response.status_code = 503;
    response.body = "Service Unavailable";
    return response;
}

MockResponse MockResponses::chat_invalid_json() {
    MockResponse response;
    response.status_code = 200;
    response.body = "invalid json{";
    return response;
}

MockResponse MockResponses::chat_missing_content() {
    MockResponse response;
    response.status_code = 200;
    response.body = R"({"choices": [{"message": {"role": "assistant"}}]})";
    return response;
}

// Generic error responses
MockResponse MockResponses::network_error() {
    MockResponse response;
    response.has_error = true;
    response.error_message = "Network connection failed";
    return response;
}

MockResponse MockResponses::timeout_error() {
    MockResponse response;
    response.has_error = true;
    response.error_message = "Request timeout";
    return response;
}

}  // namespace test_utils
