#include "net/realtime_link.h"
#include "net/http_client.h"
#include "logger.h"
#include <curl/curl.h>
#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <nlohmann/json.hpp>
#include <thread>

using json = nlohmann::json;

namespace job_diary {
namespace net {

namespace {

constexpr int POLL_INTERVAL_MS = 10;
constexpr size_t RECV_CHUNK = 16 * 1024;

} // namespace

/// Shared between the link and its worker thread
struct RealtimeLink::State {
    std::mutex mutex;
    std::deque<std::string> outbound;
    PeerLinkCallbacks callbacks;
    std::atomic<bool> released{false};
    std::atomic<bool> close_requested{false};
    std::atomic<bool> open{false};

    /// Runs cb under the mutex unless released; release() takes the same mutex
    template<typename Fn>
    void notify(Fn&& cb) {
        std::lock_guard<std::mutex> lock(mutex);
        if (released) return;
        cb(callbacks);
    }
};

namespace {

bool send_text(CURL* curl, const std::string& message) {
    size_t offset = 0;
    int attempts = 0;
    while (offset < message.size()) {
        size_t sent = 0;
        CURLcode res = curl_ws_send(curl, message.data() + offset, message.size() - offset,
                                    &sent, 0, CURLWS_TEXT);
        offset += sent;
        if (res == CURLE_AGAIN) {
            if (++attempts > 200) return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            continue;
        }
        if (res != CURLE_OK) {
            Logger::error(std::string("[Peer] send failed: ") + curl_easy_strerror(res));
            return false;
        }
    }
    return true;
}

std::string message_type(const std::string& message) {
    json j = json::parse(message, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return "";
    return j.value("type", "");
}

std::string error_message(const std::string& message) {
    json j = json::parse(message, nullptr, false);
    if (j.is_object() && j.contains("error") && j["error"].is_object()) {
        return j["error"].value("message", message);
    }
    return message;
}

void run_link(std::shared_ptr<RealtimeLink::State> state, PeerConfig config,
              SessionCredential credential, std::string offer) {
    ensure_curl_initialized();

    CURL* curl = curl_easy_init();
    if (!curl) {
        state->notify([](PeerLinkCallbacks& cb) {
            cb.on_answer(make_error(ErrorType::NegotiationFailed, "Failed to initialize CURL"));
        });
        return;
    }

    std::string url = config.url + "?model=" + url_encode(config.model);
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, ("Authorization: Bearer " + credential.secret).c_str());
    headers = curl_slist_append(headers, "OpenAI-Beta: realtime=v1");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_CONNECT_ONLY, 2L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config.negotiate_timeout_ms));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    LOG_PEER("Connecting to " + url);
    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        std::string reason = curl_easy_strerror(res);
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);
        state->notify([&reason](PeerLinkCallbacks& cb) {
            cb.on_answer(make_error(ErrorType::NegotiationFailed, "connect failed: " + reason));
        });
        return;
    }

    bool answered = false;
    bool healthy = send_text(curl, offer);
    if (!healthy) {
        state->notify([](PeerLinkCallbacks& cb) {
            cb.on_answer(make_error(ErrorType::NegotiationFailed, "could not send offer"));
        });
    }

    std::string pending;
    std::vector<char> buffer(RECV_CHUNK);

    while (healthy && !state->released) {
        bool busy = false;

        if (state->close_requested) {
            size_t sent = 0;
            curl_ws_send(curl, "", 0, &sent, 0, CURLWS_CLOSE);
            break;
        }

        std::deque<std::string> outbound;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            outbound.swap(state->outbound);
        }
        for (const auto& message : outbound) {
            busy = true;
            if (!send_text(curl, message)) {
                healthy = false;
                break;
            }
        }
        if (!healthy) {
            state->open = false;
            state->notify([](PeerLinkCallbacks& cb) {
                cb.on_failure(make_error(ErrorType::TransportFailed, "event channel write failed"));
            });
            break;
        }

        size_t received = 0;
        const struct curl_ws_frame* meta = nullptr;
        res = curl_ws_recv(curl, buffer.data(), buffer.size(), &received, &meta);
        if (res == CURLE_AGAIN) {
            if (!busy) std::this_thread::sleep_for(std::chrono::milliseconds(POLL_INTERVAL_MS));
            continue;
        }
        if (res != CURLE_OK || !meta) {
            std::string reason = res != CURLE_OK ? curl_easy_strerror(res) : "no frame metadata";
            state->open = false;
            if (answered) {
                state->notify([&reason](PeerLinkCallbacks& cb) {
                    cb.on_failure(make_error(ErrorType::TransportFailed, reason));
                });
            } else {
                state->notify([&reason](PeerLinkCallbacks& cb) {
                    cb.on_answer(make_error(ErrorType::NegotiationFailed, reason));
                });
            }
            break;
        }

        if (meta->flags & CURLWS_CLOSE) {
            LOG_PEER("Peer closed the channel");
            state->open = false;
            if (answered) {
                state->notify([](PeerLinkCallbacks& cb) { cb.on_closed(); });
            } else {
                state->notify([](PeerLinkCallbacks& cb) {
                    cb.on_answer(make_error(ErrorType::NegotiationFailed,
                                            "peer closed before answering"));
                });
            }
            break;
        }
        if (!(meta->flags & (CURLWS_TEXT | CURLWS_BINARY | CURLWS_CONT))) {
            continue;
        }

        pending.append(buffer.data(), received);
        if (meta->bytesleft > 0 || (meta->flags & CURLWS_CONT)) {
            continue;
        }

        std::string message;
        message.swap(pending);

        if (!answered) {
            std::string type = message_type(message);
            if (type == "session.updated") {
                answered = true;
                state->open = true;
                state->notify([&message](PeerLinkCallbacks& cb) {
                    cb.on_answer(Result<std::string>(message));
                });
            } else if (type == "error") {
                std::string reason = error_message(message);
                state->notify([&reason](PeerLinkCallbacks& cb) {
                    cb.on_answer(make_error(ErrorType::NegotiationFailed, reason));
                });
                break;
            } else {
                LOG_PEER("Pre-answer event: " + type);
            }
            continue;
        }

        state->notify([&message](PeerLinkCallbacks& cb) { cb.on_message(message); });
    }

    state->open = false;
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    LOG_PEER("Link worker finished");
}

} // namespace

RealtimeLink::RealtimeLink(const PeerConfig& config)
    : config_(config), state_(std::make_shared<State>()) {}

RealtimeLink::~RealtimeLink() {
    release();
}

void RealtimeLink::negotiate(const SessionCredential& credential, const std::string& offer,
                             PeerLinkCallbacks callbacks) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->callbacks = std::move(callbacks);
    }
    std::thread(run_link, state_, config_, credential, offer).detach();
}

bool RealtimeLink::send(const std::string& message) {
    if (!state_->open || state_->close_requested) return false;
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->outbound.push_back(message);
    return true;
}

void RealtimeLink::close_channel() {
    state_->close_requested = true;
    state_->open = false;
}

void RealtimeLink::release() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->released = true;
    state_->close_requested = true;
    state_->outbound.clear();
    state_->callbacks = PeerLinkCallbacks();
}

PeerLinkFactory make_realtime_link_factory(const PeerConfig& config) {
    return [config]() -> std::unique_ptr<PeerLink> {
        return std::make_unique<RealtimeLink>(config);
    };
}

} // namespace net
} // namespace job_diary
