#include "credential_broker.h"
#include "config.h"
#include "logger.h"
#include "utils.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace job_diary {

namespace {

/// String at key if present and non-empty
std::string string_at(const json& obj, const char* key) {
    if (!obj.is_object() || !obj.contains(key)) return "";
    const auto& v = obj[key];
    if (!v.is_string()) return "";
    return v.get<std::string>();
}

/// First non-empty string among keys
std::string first_string(const json& obj, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        std::string s = string_at(obj, key);
        if (!s.empty()) return s;
    }
    return "";
}

/// Locates the secret and the object that carries it (for expires_at)
std::string find_secret(const json& data, const json** holder) {
    *holder = &data;

    if (data.is_string()) {
        return data.get<std::string>();
    }
    if (!data.is_object()) return "";

    if (data.contains("client_secret")) {
        const auto& cs = data["client_secret"];
        if (cs.is_string()) return cs.get<std::string>();
        if (cs.is_object()) {
            *holder = &cs;
            return first_string(cs, {"client_secret", "secret", "token", "value"});
        }
    }

    if (data.contains("session") && data["session"].is_object() &&
        data["session"].contains("client_secret")) {
        const auto& cs = data["session"]["client_secret"];
        if (cs.is_string()) {
            *holder = &data["session"];
            return cs.get<std::string>();
        }
        if (cs.is_object()) {
            *holder = &cs;
            return first_string(cs, {"client_secret", "secret", "token"});
        }
    }

    std::string token = string_at(data, "token");
    if (!token.empty()) return token;

    if (data.contains("client_secrets") && data["client_secrets"].is_object()) {
        return string_at(data["client_secrets"], "client_secret");
    }
    return "";
}

bool read_expiry(const json& obj, WallClock::time_point& out) {
    if (!obj.is_object() || !obj.contains("expires_at")) return false;
    const auto& v = obj["expires_at"];
    if (!v.is_number()) return false;
    out = WallClock::time_point(std::chrono::seconds(v.get<int64_t>()));
    return true;
}

} // namespace

CredentialBroker::CredentialBroker(TokenService& service, const CredentialConfig& config,
                                   WallNowFn now)
    : service_(service),
      hint_(config.hint),
      default_ttl_(config.default_ttl_sec),
      now_(std::move(now)) {
    if (!now_) {
        now_ = [] { return WallClock::now(); };
    }
}

void CredentialBroker::acquire(Callback on_done) {
    requests_++;
    LOG_BROKER("Requesting session credential");

    auto ttl = default_ttl_;
    auto now_fn = now_;
    service_.issue(hint_, [on_done, ttl, now_fn](Result<std::string> body) {
        if (!body) {
            Logger::error("[Broker] Token service failed: " + body.error().message);
            on_done(Error(ErrorType::CredentialUnavailable, body.error().message));
            return;
        }
        auto credential = parse_response(body.value(), now_fn(), ttl);
        if (credential) {
            LOG_BROKER("Credential issued (length " +
                       std::to_string(credential.value().secret.size()) + ")");
        } else {
            Logger::error("[Broker] " + credential.error().message);
        }
        on_done(std::move(credential));
    });
}

Result<SessionCredential> CredentialBroker::parse_response(const std::string& body,
                                                           WallClock::time_point now,
                                                           std::chrono::seconds default_ttl) {
    std::string trimmed = utils::trim_copy(body);
    if (trimmed.empty()) {
        return Error(ErrorType::MalformedResponse, "empty token service response");
    }

    json data = json::parse(trimmed, nullptr, false);
    if (data.is_discarded()) {
        // Plain-text body: accept a single opaque token
        if (trimmed.find_first_of(" \t\r\n<{[\"") == std::string::npos) {
            data = trimmed;
        } else {
            return Error(ErrorType::MalformedResponse, "token service response is not JSON");
        }
    }

    if (data.is_object() && data.contains("error") && !data.contains("client_secret")) {
        std::string message = data["error"].is_string() ? data["error"].get<std::string>()
                                                        : data["error"].dump();
        std::string details = string_at(data, "details");
        if (!details.empty()) message += ": " + details;
        return Error(ErrorType::CredentialUnavailable, message);
    }

    const json* holder = nullptr;
    std::string secret = utils::trim_copy(find_secret(data, &holder));
    if (secret.empty()) {
        return Error(ErrorType::MalformedResponse,
                     "could not extract a client secret from the token service response");
    }

    SessionCredential credential;
    credential.secret = secret;
    if (!read_expiry(*holder, credential.expires_at) && !read_expiry(data, credential.expires_at)) {
        credential.expires_at = now + default_ttl;
    }
    return credential;
}

} // namespace job_diary
