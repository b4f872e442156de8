#pragma once

/**
 * @file session_controller.h
 * @brief Orchestrates broker, transport, interpreter and draft for the UI
 */

#include "command_executor.h"
#include "command_interpreter.h"
#include "errors.h"
#include "memory/conversation_log.h"
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace job_diary {

class EventLoop;
class CredentialBroker;
class TransportSession;
class DraftAccumulator;
class DiaryStore;

/**
 * Idle -> Acquiring (credential) -> Negotiating -> Active.
 * Failed holds after a failed start or a mid-session failure until the next start().
 */
enum class SessionPhase {
    Idle,
    Acquiring,
    Negotiating,
    Active,
    Failed
};

const char* session_phase_name(SessionPhase phase);

/// What to do when the peer reports no user speech after its last response
enum class IdleTimeoutPolicy {
    Notify,   ///< Toast only; the session stays open
    Stop,     ///< Stop the session (draft checkpointed)
    Submit    ///< Submit the draft, then stop
};

IdleTimeoutPolicy parse_idle_timeout_policy(const std::string& name);

/**
 * @brief UI collaborator
 */
class SessionObserver {
public:
    virtual ~SessionObserver() = default;

    /// Draft text changed (append, submit, restore, discard)
    virtual void on_transcript_update(const std::string& draft_text) = 0;
    virtual void on_conversation_append(const memory::ConversationEntry& entry) = 0;
    virtual void on_toast(const std::string& message, ToastKind kind) = 0;
    /// Called exactly once per error; message is ready for display
    virtual void on_error(const Error& error, const std::string& message) = 0;

    virtual void on_state_changed(SessionPhase) {}
    virtual void on_assistant_partial(const std::string&) {}
    virtual void on_entries(const std::vector<Entry>&, EntriesView) {}
};

/**
 * @brief The single entry point the UI drives
 *
 * Runs entirely on the event loop thread. Collaborators are owned by the
 * caller and must outlive the controller.
 */
class SessionController {
public:
    SessionController(EventLoop& loop,
                      CredentialBroker& broker,
                      TransportSession& transport,
                      DraftAccumulator& draft,
                      CommandExecutor& executor,
                      DiaryStore& store,
                      SessionObserver& observer,
                      IdleTimeoutPolicy idle_policy = IdleTimeoutPolicy::Notify);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    /// Acquire a credential and negotiate. No-op while a start is in progress or active.
    void start();

    /// Close the transport and checkpoint the draft. Idempotent, any state.
    void stop();

    /**
     * @brief Save the draft as a diary entry
     * @param extra_fields Merged over the extracted fields
     *
     * One submit at a time. On failure the draft is kept for retry.
     */
    void submit(const nlohmann::json& extra_fields = nlohmann::json::object());

    /// Load a fresh checkpoint into the draft; true when one was restored
    bool restore_draft();

    /// Drop the draft and its checkpoint
    void discard_draft();

    /// Route a finalized user utterance (peer transcript or typed text)
    void handle_utterance(const std::string& text);

    SessionPhase phase() const;
    bool submit_in_flight() const;
    const memory::ConversationLog& conversation() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace job_diary
