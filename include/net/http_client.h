#pragma once

/**
 * @file http_client.h
 * @brief Blocking libcurl request helper used from TaskRunner workers
 */

#include "errors.h"
#include <string>
#include <vector>

namespace job_diary {
namespace net {

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::string> headers;   ///< "Name: value" lines
    std::string body;
    int timeout_ms = 5000;
    int connect_timeout_ms = 2000;
};

struct HttpResponse {
    long status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

/// curl_global_init exactly once per process
void ensure_curl_initialized();

/**
 * @brief Perform a request (blocks the calling thread)
 * @return The response for any HTTP status; an IOError only when no response arrived
 */
Result<HttpResponse> perform(const HttpRequest& request);

/// Percent-encode a query or path component
std::string url_encode(const std::string& value);

/// "error" / "detail" / "message" field of a JSON error body, else the raw body (truncated)
std::string error_detail(const std::string& body);

} // namespace net
} // namespace job_diary
