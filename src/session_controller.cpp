#include "session_controller.h"
#include "credential_broker.h"
#include "diary_store.h"
#include "draft_accumulator.h"
#include "entry_extractor.h"
#include "event_loop.h"
#include "logger.h"
#include "transport_session.h"
#include "utils.h"

namespace job_diary {

const char* session_phase_name(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::Idle: return "idle";
        case SessionPhase::Acquiring: return "acquiring";
        case SessionPhase::Negotiating: return "negotiating";
        case SessionPhase::Active: return "active";
        case SessionPhase::Failed: return "failed";
        default: return "unknown";
    }
}

IdleTimeoutPolicy parse_idle_timeout_policy(const std::string& name) {
    std::string n = utils::normalize_copy(utils::trim_copy(name));
    if (n == "stop") return IdleTimeoutPolicy::Stop;
    if (n == "submit") return IdleTimeoutPolicy::Submit;
    return IdleTimeoutPolicy::Notify;
}

class SessionController::Impl {
public:
    Impl(EventLoop& loop, CredentialBroker& broker, TransportSession& transport,
         DraftAccumulator& draft, CommandExecutor& executor, DiaryStore& store,
         SessionObserver& observer, IdleTimeoutPolicy idle_policy)
        : loop_(loop),
          broker_(broker),
          transport_(transport),
          draft_(draft),
          executor_(executor),
          store_(store),
          observer_(observer),
          idle_policy_(idle_policy),
          alive_(std::make_shared<int>(0)) {
        auto alive = std::weak_ptr<int>(alive_);
        transport_.set_event_handler([this, alive](const TransportEvent& event) {
            if (alive.expired()) return;
            on_transport_event(event);
        });
        executor_.set_toast_handler([this](const std::string& message, ToastKind kind) {
            observer_.on_toast(message, kind);
        });
        executor_.set_error_handler([this](const Error& error) { report(error); });
        executor_.set_entries_handler([this](const std::vector<Entry>& entries, EntriesView view) {
            observer_.on_entries(entries, view);
        });
    }

    ~Impl() {
        transport_.set_event_handler(nullptr);
        executor_.set_toast_handler(nullptr);
        executor_.set_error_handler(nullptr);
        executor_.set_entries_handler(nullptr);
    }

    void start() {
        if (phase_ == SessionPhase::Acquiring || phase_ == SessionPhase::Negotiating ||
            phase_ == SessionPhase::Active) {
            LOG_SESSION(std::string("start() ignored while ") + session_phase_name(phase_));
            return;
        }
        set_phase(SessionPhase::Acquiring);
        uint64_t attempt = ++start_attempt_;
        LOG_SESSION("Starting session (attempt " + std::to_string(attempt) + ")");

        auto alive = std::weak_ptr<int>(alive_);
        broker_.acquire([this, alive, attempt](Result<SessionCredential> result) {
            if (alive.expired()) return;
            if (attempt != start_attempt_) {
                LOG_SESSION("Discarding credential for abandoned start attempt " +
                            std::to_string(attempt));
                return;
            }
            on_credential(result);
        });
    }

    void stop() {
        ++start_attempt_;
        SessionPhase previous = phase_;
        // Set before close() so the synchronous Closed event reads as user-initiated
        phase_ = SessionPhase::Idle;
        session_generation_ = 0;
        transport_.close();

        auto saved = draft_.checkpoint();
        if (!saved) {
            Logger::warn("[Session] Draft checkpoint on stop failed: " + saved.error().message);
        }
        conversation_.clear();

        if (previous != SessionPhase::Idle) {
            LOG_SESSION(std::string("Stopped (was ") + session_phase_name(previous) + ")");
            observer_.on_state_changed(phase_);
        }
    }

    void submit(const nlohmann::json& extra_fields) {
        if (submit_in_flight_) {
            observer_.on_toast("Save already in progress", ToastKind::Info);
            return;
        }
        std::string text = draft_.current_text();
        if (utils::is_empty_or_whitespace(text)) {
            observer_.on_toast("Nothing to save yet", ToastKind::Info);
            return;
        }

        submit_in_flight_ = true;
        size_t frozen = draft_.fragment_count();
        uint64_t epoch = draft_.epoch();

        NewEntry entry;
        entry.transcript = text;
        entry.extracted = EntryExtractor::extract(text);
        if (extra_fields.is_object()) {
            entry.extracted.update(extra_fields);
        }
        entry.summary = EntryExtractor::summarize(text);

        LOG_SESSION("Submitting draft (" + std::to_string(frozen) + " fragments)");

        const std::string& job_id = executor_.selected_job_id();
        if (!job_id.empty()) {
            entry.job_id = job_id;
            save_entry(entry, frozen, epoch);
            return;
        }

        std::string name = EntryExtractor::extract_job_name(text).value_or("New Job");
        LOG_SESSION("No job selected; creating \"" + name + "\"");
        auto alive = std::weak_ptr<int>(alive_);
        store_.create_job(name, [this, alive, entry, frozen, epoch](Result<Job> result) mutable {
            if (alive.expired()) return;
            if (!result) {
                finish_submit(result.error());
                return;
            }
            executor_.adopt_job(result.value());
            entry.job_id = result.value().id;
            save_entry(entry, frozen, epoch);
        });
    }

    bool restore_draft() {
        auto restored = draft_.restore();
        if (!restored) return false;
        observer_.on_transcript_update(*restored);
        observer_.on_toast("Draft restored from previous session", ToastKind::Info);
        return true;
    }

    void discard_draft() {
        draft_.clear();
        observer_.on_transcript_update("");
        observer_.on_toast("Draft discarded", ToastKind::Info);
    }

    void handle_utterance(const std::string& raw) {
        std::string text = utils::trim_copy(raw);
        if (text.empty()) return;

        const auto& entry = conversation_.append(Role::User, text);
        observer_.on_conversation_append(entry);

        auto command = interpreter_.classify(text);
        if (!command) {
            draft_.append(text);
            LOG_DRAFT("Draft now " + std::to_string(draft_.fragment_count()) + " fragment(s)");
            observer_.on_transcript_update(draft_.current_text());
            return;
        }

        if (std::holds_alternative<command::SaveDraft>(*command)) {
            submit(nlohmann::json::object());
            return;
        }
        executor_.execute(*command, draft_.current_text());
    }

    SessionPhase phase_ = SessionPhase::Idle;
    bool submit_in_flight_ = false;
    memory::ConversationLog conversation_;

private:
    void on_credential(const Result<SessionCredential>& result) {
        if (!result) {
            fail_start(result.error());
            return;
        }
        auto generation = transport_.negotiate(result.value());
        if (!generation) {
            fail_start(generation.error());
            return;
        }
        session_generation_ = generation.value();
        set_phase(SessionPhase::Negotiating);
    }

    void fail_start(const Error& error) {
        set_phase(SessionPhase::Failed);
        report(error);
    }

    void on_transport_event(const TransportEvent& event) {
        if (event.type == TransportEventType::Closed) {
            on_transport_closed(event);
            return;
        }
        if (event.generation != session_generation_) {
            LOG_SESSION(std::string("Ignoring ") + transport_event_name(event.type) +
                        " from generation " + std::to_string(event.generation));
            return;
        }

        switch (event.type) {
            case TransportEventType::Connected:
                set_phase(SessionPhase::Active);
                break;
            case TransportEventType::UtteranceFinal:
                if (event.role == Role::User) {
                    handle_utterance(event.text);
                } else if (const auto* entry = conversation_.finish_partial(event.text)) {
                    observer_.on_conversation_append(*entry);
                }
                break;
            case TransportEventType::UtteranceDelta:
                observer_.on_assistant_partial(conversation_.append_partial(event.text));
                break;
            case TransportEventType::IdleTimeout:
                on_idle_timeout();
                break;
            case TransportEventType::PeerError:
            case TransportEventType::Failed:
                set_phase(SessionPhase::Failed);
                report(event.error);
                break;
            default:
                break;
        }
    }

    void on_transport_closed(const TransportEvent& event) {
        if (event.generation != session_generation_ && session_generation_ != 0) return;
        conversation_.clear();
        if (phase_ == SessionPhase::Negotiating || phase_ == SessionPhase::Active) {
            set_phase(SessionPhase::Idle);
        }
        session_generation_ = 0;
        auto saved = draft_.checkpoint();
        if (!saved) {
            Logger::warn("[Session] Draft checkpoint on close failed: " + saved.error().message);
        }
    }

    void on_idle_timeout() {
        switch (idle_policy_) {
            case IdleTimeoutPolicy::Notify:
                observer_.on_toast("Still listening. Say \"save it\" when you're done.",
                                   ToastKind::Info);
                break;
            case IdleTimeoutPolicy::Stop:
            case IdleTimeoutPolicy::Submit: {
                observer_.on_toast("No speech for a while, stopping", ToastKind::Info);
                bool submit_first = idle_policy_ == IdleTimeoutPolicy::Submit;
                auto alive = std::weak_ptr<int>(alive_);
                // Closing inside the transport's own event dispatch is deferred to the loop
                loop_.post([this, alive, submit_first]() {
                    if (alive.expired()) return;
                    if (submit_first && !draft_.empty()) submit(nlohmann::json::object());
                    stop();
                });
                break;
            }
        }
    }

    /// frozen fragments of draft epoch `epoch` were sent; drop them only if still there
    void save_entry(const NewEntry& entry, size_t frozen, uint64_t epoch) {
        auto alive = std::weak_ptr<int>(alive_);
        store_.create_entry(entry, [this, alive, frozen, epoch](Result<Entry> result) {
            if (alive.expired()) return;
            if (!result) {
                finish_submit(result.error());
                return;
            }
            if (draft_.epoch() == epoch) {
                draft_.consume(frozen);
            } else {
                LOG_SESSION("Draft replaced during submit; keeping current fragments");
            }
            finish_submit(Error());
            observer_.on_transcript_update(draft_.current_text());
            observer_.on_toast("Entry saved successfully!", ToastKind::Success);
            executor_.refresh_entries();
        });
    }

    void finish_submit(const Error& error) {
        submit_in_flight_ = false;
        if (error) {
            LOG_SESSION("Submit failed; draft kept (" + std::to_string(draft_.fragment_count()) +
                        " fragments)");
            report(error);
        }
    }

    void set_phase(SessionPhase phase) {
        if (phase == phase_) return;
        LOG_SESSION(std::string(session_phase_name(phase_)) + " -> " + session_phase_name(phase));
        phase_ = phase;
        observer_.on_state_changed(phase);
    }

    void report(const Error& error) {
        std::string message = describe(error);
        Logger::error("[Session] " + message);
        observer_.on_error(error, message);
    }

    EventLoop& loop_;
    CredentialBroker& broker_;
    TransportSession& transport_;
    DraftAccumulator& draft_;
    CommandExecutor& executor_;
    DiaryStore& store_;
    SessionObserver& observer_;
    IdleTimeoutPolicy idle_policy_;
    CommandInterpreter interpreter_;
    uint64_t start_attempt_ = 0;
    SessionGeneration session_generation_ = 0;
    std::shared_ptr<int> alive_;
};

SessionController::SessionController(EventLoop& loop,
                                     CredentialBroker& broker,
                                     TransportSession& transport,
                                     DraftAccumulator& draft,
                                     CommandExecutor& executor,
                                     DiaryStore& store,
                                     SessionObserver& observer,
                                     IdleTimeoutPolicy idle_policy)
    : pimpl_(std::make_unique<Impl>(loop, broker, transport, draft, executor, store,
                                    observer, idle_policy)) {}

SessionController::~SessionController() = default;

void SessionController::start() {
    pimpl_->start();
}

void SessionController::stop() {
    pimpl_->stop();
}

void SessionController::submit(const nlohmann::json& extra_fields) {
    pimpl_->submit(extra_fields);
}

bool SessionController::restore_draft() {
    return pimpl_->restore_draft();
}

void SessionController::discard_draft() {
    pimpl_->discard_draft();
}

void SessionController::handle_utterance(const std::string& text) {
    pimpl_->handle_utterance(text);
}

SessionPhase SessionController::phase() const {
    return pimpl_->phase_;
}

bool SessionController::submit_in_flight() const {
    return pimpl_->submit_in_flight_;
}

const memory::ConversationLog& SessionController::conversation() const {
    return pimpl_->conversation_;
}

} // namespace job_diary
