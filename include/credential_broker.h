#pragma once

#include "common.h"
#include "errors.h"
#include "token_service.h"
#include <chrono>
#include <functional>
#include <string>

namespace job_diary {

struct CredentialConfig;

/**
 * @brief Exchanges the token service's answer for a SessionCredential
 *
 * One token service call per acquire(). Nothing is cached or retried: a
 * credential belongs to exactly one transport session.
 */
class CredentialBroker {
public:
    using Callback = std::function<void(Result<SessionCredential>)>;
    using WallNowFn = std::function<WallClock::time_point()>;

    CredentialBroker(TokenService& service, const CredentialConfig& config,
                     WallNowFn now = nullptr);

    CredentialBroker(const CredentialBroker&) = delete;
    CredentialBroker& operator=(const CredentialBroker&) = delete;

    /**
     * @brief Request a fresh credential
     *
     * on_done receives CredentialUnavailable when the service failed and
     * MalformedResponse when no known payload shape yielded a secret.
     */
    void acquire(Callback on_done);

    /**
     * @brief Unwrap every known token service payload shape
     *
     * Tried in order: a bare JSON string; client_secret as a string; a
     * client_secret object holding client_secret, secret, token or value;
     * session.client_secret as a string or object; token; and
     * client_secrets.client_secret. Expiry comes from expires_at (epoch
     * seconds) beside the secret or at the top level, else now + default_ttl.
     */
    static Result<SessionCredential> parse_response(const std::string& body,
                                                    WallClock::time_point now,
                                                    std::chrono::seconds default_ttl);

    size_t requests_made() const { return requests_; }

private:
    TokenService& service_;
    std::string hint_;
    std::chrono::seconds default_ttl_;
    WallNowFn now_;
    size_t requests_ = 0;
};

} // namespace job_diary
