#pragma once

#include "config.h"
#include "token_service.h"

namespace job_diary {

class EventLoop;
class TaskRunner;

namespace net {

/**
 * @brief TokenService over HTTP: POST {hint} to credential.token_url
 *
 * Status >= 400 and transport failures are reported as errors carrying the
 * service's error/details text.
 */
class HttpTokenService : public TokenService {
public:
    HttpTokenService(const CredentialConfig& config, EventLoop& loop, TaskRunner& runner);

    void issue(const std::string& hint, Callback on_done) override;

private:
    CredentialConfig config_;
    EventLoop& loop_;
    TaskRunner& runner_;
};

} // namespace net
} // namespace job_diary
