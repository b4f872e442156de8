#include "net/http_client.h"
#include "logger.h"
#include <curl/curl.h>
#include <mutex>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace job_diary {
namespace net {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total_size);
    return total_size;
}

} // namespace

void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

Result<HttpResponse> perform(const HttpRequest& request) {
    ensure_curl_initialized();

    CURL* curl = curl_easy_init();
    if (!curl) {
        return make_io_error("Failed to initialize CURL");
    }

    struct curl_slist* headers = nullptr;
    for (const auto& h : request.headers) {
        headers = curl_slist_append(headers, h.c_str());
    }

    HttpResponse response;

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    if (request.method != "GET" && request.method != "DELETE") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_ms));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connect_timeout_ms));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        LOG_DEBUG(request.method + " " + request.url + " failed: " + curl_easy_strerror(res));
        if (res == CURLE_OPERATION_TIMEDOUT) {
            return make_timeout_error(std::string("request timed out: ") + request.url);
        }
        return make_io_error(curl_easy_strerror(res));
    }
    return response;
}

std::string url_encode(const std::string& value) {
    ensure_curl_initialized();
    CURL* curl = curl_easy_init();
    if (!curl) return value;
    char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
    std::string out = escaped ? std::string(escaped) : value;
    curl_free(escaped);
    curl_easy_cleanup(curl);
    return out;
}

std::string error_detail(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_object()) {
        std::string detail;
        for (const char* key : {"error", "detail", "message"}) {
            if (!j.contains(key)) continue;
            const auto& v = j[key];
            if (v.is_string()) {
                detail = v.get<std::string>();
            } else if (v.is_object() && v.contains("message") && v["message"].is_string()) {
                detail = v["message"].get<std::string>();
            }
            if (!detail.empty()) break;
        }
        if (j.contains("details") && j["details"].is_string()) {
            detail += (detail.empty() ? "" : ": ") + j["details"].get<std::string>();
        }
        if (!detail.empty()) return detail;
    }
    if (body.size() > 200) return body.substr(0, 200) + "...";
    return body;
}

} // namespace net
} // namespace job_diary
