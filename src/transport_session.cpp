#include "transport_session.h"
#include "event_loop.h"
#include "logger.h"
#include "utils.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace job_diary {

const char* transport_state_name(TransportState state) {
    switch (state) {
        case TransportState::Idle: return "Idle";
        case TransportState::Negotiating: return "Negotiating";
        case TransportState::Active: return "Active";
        case TransportState::Closing: return "Closing";
        case TransportState::Closed: return "Closed";
        case TransportState::Failed: return "Failed";
        default: return "Unknown";
    }
}

const char* transport_event_name(TransportEventType type) {
    switch (type) {
        case TransportEventType::Connected: return "Connected";
        case TransportEventType::UtteranceFinal: return "UtteranceFinal";
        case TransportEventType::UtteranceDelta: return "UtteranceDelta";
        case TransportEventType::PeerError: return "PeerError";
        case TransportEventType::IdleTimeout: return "IdleTimeout";
        case TransportEventType::Failed: return "Failed";
        case TransportEventType::Closed: return "Closed";
        default: return "Unknown";
    }
}

namespace {

bool is_assistant_delta(const std::string& type) {
    return type == "response.audio_transcript.delta" ||
           type == "response.text.delta" ||
           type == "response.output_text.delta";
}

bool is_assistant_done(const std::string& type) {
    return type == "response.audio_transcript.done" ||
           type == "response.text.done" ||
           type == "response.output_text.done";
}

std::string text_field(const json& j, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    }
    return "";
}

/// input_audio_buffer.append carrying little-endian pcm16
std::string encode_audio_frame(const AudioFrame& frame) {
    std::vector<uint8_t> bytes;
    bytes.reserve(frame.size() * 2);
    for (Sample s : frame) {
        uint16_t u = static_cast<uint16_t>(s);
        bytes.push_back(static_cast<uint8_t>(u & 0xFF));
        bytes.push_back(static_cast<uint8_t>(u >> 8));
    }
    json j;
    j["type"] = "input_audio_buffer.append";
    j["audio"] = utils::base64_encode(bytes.data(), bytes.size());
    return j.dump();
}

} // namespace

class TransportSession::Impl {
public:
    Impl(EventLoop& loop, std::unique_ptr<AudioSource> audio, PeerLinkFactory factory,
         const PeerConfig& peer, const SessionConfig& session)
        : loop_(loop),
          audio_(std::move(audio)),
          factory_(std::move(factory)),
          peer_(peer),
          session_(session),
          alive_(std::make_shared<int>(0)) {}

    ~Impl() {
        // Invalidate pending loop tasks before tearing down
        alive_.reset();
        generation_++;
        cancel_timers();
        if (link_) {
            link_->close_channel();
            link_->release();
            link_.reset();
        }
        if (audio_ && audio_->is_open()) audio_->close();
    }

    Result<SessionGeneration> negotiate(const SessionCredential& credential) {
        if (state_ != TransportState::Idle && state_ != TransportState::Closed) {
            return Error(ErrorType::InvalidState,
                         std::string("negotiate() while ") + transport_state_name(state_));
        }

        const SessionGeneration g = ++generation_;
        set_state(TransportState::Negotiating);
        idle_notified_ = false;
        LOG_TRANSPORT("Negotiating session generation " + std::to_string(g));

        if (credential.empty() || credential.is_expired()) {
            post_guarded(g, [this, credential]() {
                fail(Error(ErrorType::NegotiationFailed,
                           credential.empty() ? "empty session credential"
                                              : "session credential expired"));
            });
            return g;
        }

        if (audio_) {
            std::weak_ptr<int> alive = alive_;
            EventLoop* loop = &loop_;
            auto opened = audio_->open([this, alive, loop, g](const AudioFrame& frame) {
                // Capture thread: hand the frame to the loop
                loop->post([this, alive, g, frame]() {
                    if (alive.expired() || g != generation_) return;
                    if (state_ != TransportState::Active || !link_) return;
                    link_->send(encode_audio_frame(frame));
                });
            });
            if (!opened) {
                Error err(ErrorType::PermissionDenied, opened.error().message);
                post_guarded(g, [this, err]() { fail(err); });
                return g;
            }
        }

        link_ = factory_ ? factory_() : nullptr;
        if (!link_) {
            post_guarded(g, [this]() {
                fail(Error(ErrorType::NegotiationFailed, "no peer link available"));
            });
            return g;
        }

        negotiate_timer_ = loop_.post_delayed(peer_.negotiate_timeout_ms,
            guarded(g, [this]() {
                negotiate_timer_ = 0;
                if (state_ == TransportState::Negotiating) {
                    fail(Error(ErrorType::NegotiationFailed, "negotiation timed out"));
                }
            }));

        link_->negotiate(credential, build_offer(), make_callbacks(g));
        return g;
    }

    void close() {
        if (state_ == TransportState::Idle || state_ == TransportState::Closed ||
            state_ == TransportState::Closing) {
            return;
        }

        // Invalidate first: anything still in flight now carries a stale generation
        const SessionGeneration closed_generation = generation_;
        generation_++;
        set_state(TransportState::Closing);
        cancel_timers();

        if (link_) link_->close_channel();
        if (audio_ && audio_->is_open()) audio_->close();
        if (link_) {
            link_->release();
            link_.reset();
        }

        set_state(TransportState::Closed);
        LOG_TRANSPORT("Session generation " + std::to_string(closed_generation) + " closed");

        TransportEvent event;
        event.type = TransportEventType::Closed;
        event.generation = closed_generation;
        emit(event);
    }

    bool send_event(const std::string& message) {
        if (state_ != TransportState::Active || !link_) return false;
        return link_->send(message);
    }

    std::string build_offer() const {
        json session;
        session["model"] = peer_.model;
        session["modalities"] = json::array({"text"});
        session["instructions"] = peer_.instructions;
        session["input_audio_format"] = "pcm16";
        session["input_audio_transcription"] = {{"model", peer_.transcription_model}};
        session["turn_detection"] = {
            {"type", "server_vad"},
            {"threshold", peer_.vad_threshold},
            {"prefix_padding_ms", peer_.prefix_padding_ms},
            {"silence_duration_ms", peer_.silence_duration_ms},
            {"idle_timeout_ms", session_.idle_timeout_ms},
        };

        json offer;
        offer["type"] = "session.update";
        offer["session"] = session;
        return offer.dump();
    }

    TransportState state_ = TransportState::Idle;
    SessionGeneration generation_ = 0;
    size_t stale_dropped_ = 0;
    TransportEventHandler handler_;

private:
    /// Wraps fn so it runs only while g is still the current generation
    EventLoop::Task guarded(SessionGeneration g, std::function<void()> fn) {
        std::weak_ptr<int> alive = alive_;
        return [this, alive, g, fn]() {
            if (alive.expired()) return;
            if (g != generation_) {
                stale_dropped_++;
                LOG_DEBUG("Dropped callback from stale generation " + std::to_string(g) +
                          " (current " + std::to_string(generation_) + ")");
                return;
            }
            fn();
        };
    }

    void post_guarded(SessionGeneration g, std::function<void()> fn) {
        loop_.post(guarded(g, std::move(fn)));
    }

    PeerLinkCallbacks make_callbacks(SessionGeneration g) {
        // Built on the loop thread; invoked from link threads. They only post.
        EventLoop* loop = &loop_;
        std::weak_ptr<int> alive = alive_;
        auto marshal = [this, loop, alive, g](std::function<void()> fn) {
            loop->post([this, alive, g, fn]() {
                if (alive.expired()) return;
                if (g != generation_) {
                    stale_dropped_++;
                    LOG_DEBUG("Dropped peer callback from stale generation " + std::to_string(g));
                    return;
                }
                fn();
            });
        };

        PeerLinkCallbacks cb;
        cb.on_answer = [this, marshal](Result<std::string> answer) {
            marshal([this, answer]() { on_answer(answer); });
        };
        cb.on_message = [this, marshal](const std::string& message) {
            marshal([this, message]() { on_message(message); });
        };
        cb.on_failure = [this, marshal](const Error& error) {
            marshal([this, error]() {
                fail(Error(ErrorType::TransportFailed, error.message));
            });
        };
        cb.on_closed = [this, marshal]() {
            marshal([this]() {
                if (state_ == TransportState::Active || state_ == TransportState::Negotiating) {
                    fail(Error(ErrorType::TransportFailed, "peer closed the event channel"));
                }
            });
        };
        return cb;
    }

    void on_answer(const Result<std::string>& answer) {
        if (state_ != TransportState::Negotiating) return;
        if (!answer) {
            fail(Error(ErrorType::NegotiationFailed, answer.error().message));
            return;
        }
        if (negotiate_timer_) {
            loop_.cancel(negotiate_timer_);
            negotiate_timer_ = 0;
        }
        set_state(TransportState::Active);
        LOG_TRANSPORT("Session generation " + std::to_string(generation_) + " active");

        TransportEvent event;
        event.type = TransportEventType::Connected;
        event.generation = generation_;
        emit(event);
    }

    void on_message(const std::string& message) {
        if (state_ != TransportState::Active) return;

        json j = json::parse(message, nullptr, false);
        if (j.is_discarded() || !j.is_object() || !j.contains("type") || !j["type"].is_string()) {
            LOG_PEER("Ignoring malformed event: " + message.substr(0, 120));
            return;
        }
        const SessionGeneration g = generation_;
        const std::string type = j["type"].get<std::string>();

        if (type == "conversation.item.input_audio_transcription.completed") {
            disarm_idle_timer();
            std::string transcript = text_field(j, {"transcript"});
            if (utils::is_empty_or_whitespace(transcript)) return;
            emit_utterance(TransportEventType::UtteranceFinal, Role::User, transcript);
        } else if (is_assistant_delta(type)) {
            std::string delta = text_field(j, {"delta"});
            if (delta.empty()) return;
            emit_utterance(TransportEventType::UtteranceDelta, Role::Assistant, delta);
        } else if (is_assistant_done(type)) {
            std::string text = text_field(j, {"transcript", "text"});
            emit_utterance(TransportEventType::UtteranceFinal, Role::Assistant, text);
            if (g == generation_ && state_ == TransportState::Active) arm_idle_timer();
        } else if (type == "input_audio_buffer.speech_started") {
            disarm_idle_timer();
        } else if (type == "response.done") {
            arm_idle_timer();
        } else if (type == "input_audio_buffer.timeout_triggered") {
            disarm_idle_timer();
            notify_idle();
        } else if (type == "error") {
            std::string msg = "peer error";
            if (j.contains("error") && j["error"].is_object()) {
                msg = text_field(j["error"], {"message", "code"});
            } else if (j.contains("message") && j["message"].is_string()) {
                msg = j["message"].get<std::string>();
            }
            if (msg.empty()) msg = "peer error";
            Logger::error("[Transport] Peer error: " + msg);
            TransportEvent event;
            event.type = TransportEventType::PeerError;
            event.text = msg;
            event.generation = g;
            event.error = Error(ErrorType::PeerError, msg);
            emit(event);
            // Mid-session peer errors end the session
            if (g == generation_ && state_ == TransportState::Active) {
                set_state(TransportState::Failed);
                close();
            }
        } else if (type == "session.created" || type == "session.updated") {
            LOG_PEER("Session configured (" + type + ")");
        } else {
            LOG_PEER("Unhandled event: " + type);
        }
    }

    void emit_utterance(TransportEventType type, Role role, const std::string& text) {
        TransportEvent event;
        event.type = type;
        event.role = role;
        event.text = text;
        event.generation = generation_;
        emit(event);
    }

    void fail(const Error& error) {
        if (state_ != TransportState::Negotiating && state_ != TransportState::Active) return;
        Logger::error(std::string("[Transport] Session failed: ") + error.message);
        set_state(TransportState::Failed);

        TransportEvent event;
        event.type = TransportEventType::Failed;
        event.text = error.message;
        event.generation = generation_;
        event.error = error;
        emit(event);
        close();
    }

    void arm_idle_timer() {
        disarm_idle_timer();
        idle_notified_ = false;
        if (session_.idle_timeout_ms <= 0) return;
        idle_timer_ = loop_.post_delayed(session_.idle_timeout_ms,
            guarded(generation_, [this]() {
                idle_timer_ = 0;
                notify_idle();
            }));
    }

    void disarm_idle_timer() {
        if (idle_timer_) {
            loop_.cancel(idle_timer_);
            idle_timer_ = 0;
        }
    }

    /// At most one IdleTimeout per quiet period
    void notify_idle() {
        if (state_ != TransportState::Active || idle_notified_) return;
        idle_notified_ = true;
        LOG_TRANSPORT("Idle timeout");
        TransportEvent event;
        event.type = TransportEventType::IdleTimeout;
        event.generation = generation_;
        emit(event);
    }

    void cancel_timers() {
        disarm_idle_timer();
        if (negotiate_timer_) {
            loop_.cancel(negotiate_timer_);
            negotiate_timer_ = 0;
        }
    }

    void set_state(TransportState s) {
        if (s == state_) return;
        LOG_DEBUG(std::string("Transport ") + transport_state_name(state_) + " -> " +
                  transport_state_name(s));
        state_ = s;
    }

    void emit(const TransportEvent& event) {
        if (handler_) handler_(event);
    }

    EventLoop& loop_;
    std::unique_ptr<AudioSource> audio_;
    PeerLinkFactory factory_;
    PeerConfig peer_;
    SessionConfig session_;
    std::unique_ptr<PeerLink> link_;
    std::shared_ptr<int> alive_;
    EventLoop::TimerId idle_timer_ = 0;
    EventLoop::TimerId negotiate_timer_ = 0;
    bool idle_notified_ = false;
};

TransportSession::TransportSession(EventLoop& loop,
                                   std::unique_ptr<AudioSource> audio,
                                   PeerLinkFactory link_factory,
                                   const PeerConfig& peer,
                                   const SessionConfig& session)
    : pimpl_(std::make_unique<Impl>(loop, std::move(audio), std::move(link_factory),
                                    peer, session)) {}

TransportSession::~TransportSession() = default;

void TransportSession::set_event_handler(TransportEventHandler handler) {
    pimpl_->handler_ = std::move(handler);
}

Result<SessionGeneration> TransportSession::negotiate(const SessionCredential& credential) {
    return pimpl_->negotiate(credential);
}

void TransportSession::close() {
    pimpl_->close();
}

bool TransportSession::send_event(const std::string& message) {
    return pimpl_->send_event(message);
}

TransportState TransportSession::state() const {
    return pimpl_->state_;
}

SessionGeneration TransportSession::generation() const {
    return pimpl_->generation_;
}

size_t TransportSession::stale_events_dropped() const {
    return pimpl_->stale_dropped_;
}

std::string TransportSession::build_offer() const {
    return pimpl_->build_offer();
}

} // namespace job_diary
