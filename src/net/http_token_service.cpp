#include "net/http_token_service.h"
#include "event_loop.h"
#include "logger.h"
#include "net/http_client.h"
#include "task_runner.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace job_diary {
namespace net {

HttpTokenService::HttpTokenService(const CredentialConfig& config, EventLoop& loop,
                                   TaskRunner& runner)
    : config_(config), loop_(loop), runner_(runner) {}

void HttpTokenService::issue(const std::string& hint, Callback on_done) {
    HttpRequest request;
    request.method = "POST";
    request.url = config_.token_url;
    request.headers = {"Content-Type: application/json", "Accept: application/json"};
    json body = json::object();
    if (!hint.empty()) body["hint"] = hint;
    request.body = body.dump();
    request.timeout_ms = config_.timeout_ms;

    EventLoop* loop = &loop_;
    bool queued = runner_.submit([request, on_done, loop]() {
        auto response = perform(request);
        Result<std::string> outcome = Error(ErrorType::CredentialUnavailable, "no response");
        if (!response) {
            outcome = Error(ErrorType::CredentialUnavailable,
                            "token service unreachable: " + response.error().message);
        } else if (response.value().status >= 400) {
            outcome = Error(ErrorType::CredentialUnavailable,
                            "token service returned " + std::to_string(response.value().status) +
                            ": " + error_detail(response.value().body));
        } else {
            outcome = response.value().body;
        }
        loop->post([on_done, outcome]() { on_done(outcome); });
    });

    if (!queued) {
        loop_.post([on_done]() {
            on_done(Error(ErrorType::CredentialUnavailable, "token request could not be queued"));
        });
    }
}

} // namespace net
} // namespace job_diary
