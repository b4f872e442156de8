/**
 * Session controller end to end over fakes: start/stop races, stale events
 * after restart, utterance routing, submit success and failure, idle
 * policies, and draft survival across sessions.
 *
 * Run from build dir: ./test_session_controller
 * No PortAudio or network required.
 */

#include "command_executor.h"
#include "config.h"
#include "credential_broker.h"
#include "draft_accumulator.h"
#include "event_loop.h"
#include "fakes.h"
#include "session_controller.h"
#include "transport_session.h"
#include <filesystem>
#include <iostream>
#include <string>
#include <unistd.h>

using namespace job_diary;
using namespace job_diary::testing;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static const char* TOKEN_BODY = "{\"client_secret\":{\"value\":\"ek_live\"}}";

struct Harness {
    ManualClock clock;
    EventLoop loop{clock.fn()};
    std::shared_ptr<FakeAudioState> audio = std::make_shared<FakeAudioState>();
    FakePeerRegistry peers;
    FakeTokenService tokens;
    FakeDiaryStore store;
    RecordingObserver observer;
    CredentialConfig credential_config;
    PeerConfig peer_config;
    SessionConfig session_config;
    StoreConfig store_config;
    CredentialBroker broker{tokens, credential_config};
    TransportSession transport{loop, std::make_unique<FakeAudioSource>(audio), peers.factory(),
                               peer_config, session_config};
    DraftAccumulator draft;
    CommandExecutor executor{store, store_config};
    SessionController controller;

    explicit Harness(IdleTimeoutPolicy policy = IdleTimeoutPolicy::Notify,
                     const std::string& draft_path = "")
        : draft(draft_path),
          controller(loop, broker, transport, draft, executor, store, observer, policy) {}

    void go_active() {
        controller.start();
        tokens.respond(TOKEN_BODY);
        loop.run_until_idle();
        peers.last().answer();
        loop.run_until_idle();
    }

    void say(const std::string& text) {
        peers.last().user_said(text);
        loop.run_until_idle();
    }
};

int main() {
    // --- Dictate, then "save it" with no job selected ---
    {
        Harness h;
        h.controller.start();
        ASSERT(h.controller.phase() == SessionPhase::Acquiring);
        h.tokens.respond(TOKEN_BODY);
        ASSERT(h.controller.phase() == SessionPhase::Negotiating);
        ASSERT(h.peers.last().credential.secret == "ek_live");
        h.peers.last().answer();
        h.loop.run_until_idle();
        ASSERT(h.controller.phase() == SessionPhase::Active);

        h.say("Finished cabinets today.");
        ASSERT(h.draft.current_text() == "Finished cabinets today.");
        ASSERT(h.observer.transcripts.back() == "Finished cabinets today.");
        ASSERT(h.controller.conversation().size() == 1);

        h.say("save it");
        ASSERT(h.store.created_job_names.size() == 1 && h.store.created_job_names[0] == "New Job");
        ASSERT(h.store.entry_requests.size() == 1);
        ASSERT(h.store.entry_requests[0].transcript == "Finished cabinets today.");
        ASSERT(h.store.entry_requests[0].job_id == "job-1");
        ASSERT(h.store.entry_requests[0].extracted.contains("areas_painted"));
        ASSERT(h.store.entry_requests[0].summary == "Finished cabinets today.");
        ASSERT(h.draft.empty());
        ASSERT(h.observer.transcripts.back().empty());
        ASSERT(h.observer.saw_toast("Entry saved successfully!"));
        ASSERT(h.executor.selected_job_id() == "job-1");
        ASSERT(!h.controller.submit_in_flight());
        ASSERT(h.observer.errors.empty());
    }

    // --- Commands never reach the draft ---
    {
        Harness h;
        h.go_active();
        h.say("new job Kitchen Renovation");
        ASSERT(h.draft.empty());
        ASSERT(h.observer.saw_toast("Created job: Kitchen Renovation"));
        ASSERT(h.executor.selected_job() && h.executor.selected_job()->name == "Kitchen Renovation");

        h.say("Sanded the trim.");
        h.say("mark job as in progress");
        ASSERT(h.store.jobs[0].status == "in_progress");
        ASSERT(h.observer.saw_toast("Job marked in progress"));

        h.say("set stage to prep");
        ASSERT(h.store.jobs[0].stage == "prep");

        h.say("search for trim");
        ASSERT(h.store.searches.size() == 1 && h.store.searches[0] == "trim");
        ASSERT(!h.observer.views.empty() && h.observer.views.back() == EntriesView::Search);

        h.say("save it");
        ASSERT(h.store.created_job_names.size() == 1);
        ASSERT(h.store.entry_requests.size() == 1);
        ASSERT(h.store.entry_requests[0].job_id == h.store.jobs[0].id);
        ASSERT(h.store.entry_requests[0].transcript == "Sanded the trim.");

        h.say("show all entries");
        ASSERT(h.observer.views.back() == EntriesView::All);
        ASSERT(h.executor.view() == EntriesView::All);
    }

    // --- Job commands need a selected job; select by partial name ---
    {
        Harness h;
        h.go_active();
        h.say("mark job as done");
        ASSERT(h.observer.saw_toast("Select a job first"));

        Job a; a.id = "j-a"; a.name = "Smith House";
        Job b; b.id = "j-b"; b.name = "Kitchen Renovation";
        h.store.jobs = {a, b};
        h.executor.load_jobs();
        ASSERT(h.executor.selected_job_id() == "j-a");  // most recent selected by default

        h.say("switch to the Kitchen job");
        ASSERT(h.executor.selected_job_id() == "j-b");
        ASSERT(h.observer.saw_toast("Switched to job: Kitchen Renovation"));

        h.say("select the Garage project");
        ASSERT(h.observer.saw_toast("Couldn't find a job matching \"Garage\""));
        ASSERT(h.executor.selected_job_id() == "j-b");
    }

    // --- Debrief uses the draft without clearing it ---
    {
        Harness h;
        Job job; job.id = "j-1"; job.name = "Deck";
        h.store.jobs = {job};
        h.executor.load_jobs();
        h.go_active();
        h.say("Stained the deck boards.");
        h.say("save as debrief");
        ASSERT(h.store.debriefs.size() == 1);
        ASSERT(h.store.debriefs[0].first == "j-1");
        ASSERT(h.store.debriefs[0].second == "Stained the deck boards.");
        ASSERT(h.draft.current_text() == "Stained the deck boards.");
        ASSERT(h.observer.saw_toast("Debrief saved"));
    }

    // --- Two rapid starts make one credential request ---
    {
        Harness h;
        h.controller.start();
        h.controller.start();
        ASSERT(h.broker.requests_made() == 1);
        ASSERT(h.tokens.pending.size() == 1);
        h.tokens.respond(TOKEN_BODY);
        h.controller.start();
        ASSERT(h.broker.requests_made() == 1);
        ASSERT(h.peers.links.size() == 1);
    }

    // --- Stop while acquiring: the credential arrives and is discarded ---
    {
        Harness h;
        h.controller.start();
        h.controller.stop();
        ASSERT(h.controller.phase() == SessionPhase::Idle);
        h.tokens.respond(TOKEN_BODY);
        h.loop.run_until_idle();
        ASSERT(h.peers.links.empty());
        ASSERT(h.controller.phase() == SessionPhase::Idle);
        ASSERT(h.observer.errors.empty());
    }

    // --- Stop while negotiating: the late answer changes nothing ---
    {
        Harness h;
        h.controller.start();
        h.tokens.respond(TOKEN_BODY);
        ASSERT(h.controller.phase() == SessionPhase::Negotiating);
        h.controller.stop();
        h.peers.last().answer();
        h.loop.run_until_idle();
        ASSERT(h.transport.state() == TransportState::Closed);
        ASSERT(h.controller.phase() == SessionPhase::Idle);
        ASSERT(h.peers.last().released);
        ASSERT(h.observer.errors.empty());
    }

    // --- A transcript from the previous session is ignored after restart ---
    {
        Harness h;
        h.go_active();
        h.say("Kept words.");
        auto& old_link = h.peers.last();

        h.controller.stop();
        ASSERT(h.controller.conversation().empty());
        ASSERT(h.draft.current_text() == "Kept words.");

        h.controller.start();
        h.tokens.respond(TOKEN_BODY);
        h.loop.run_until_idle();
        old_link.user_said("ghost words");
        h.loop.run_until_idle();
        ASSERT(h.draft.current_text() == "Kept words.");
        ASSERT(h.controller.conversation().empty());

        h.peers.last().answer();
        h.loop.run_until_idle();
        ASSERT(h.controller.phase() == SessionPhase::Active);
        h.say("New words.");
        ASSERT(h.draft.current_text() == "Kept words. New words.");
    }

    // --- Credential failure: one error, then a fresh start is allowed ---
    {
        Harness h;
        h.controller.start();
        h.tokens.fail("connection refused");
        ASSERT(h.controller.phase() == SessionPhase::Failed);
        ASSERT(h.observer.errors.size() == 1);
        ASSERT(h.observer.errors[0].type == ErrorType::CredentialUnavailable);
        ASSERT(h.peers.links.empty());

        h.controller.start();
        ASSERT(h.controller.phase() == SessionPhase::Acquiring);
        ASSERT(h.broker.requests_made() == 2);
    }

    // --- Negotiation rejected ---
    {
        Harness h;
        h.controller.start();
        h.tokens.respond(TOKEN_BODY);
        h.peers.last().reject("bad offer");
        h.loop.run_until_idle();
        ASSERT(h.controller.phase() == SessionPhase::Failed);
        ASSERT(h.observer.errors.size() == 1);
        ASSERT(h.observer.errors[0].type == ErrorType::NegotiationFailed);
        ASSERT(h.transport.state() == TransportState::Closed);
    }

    // --- Peer error mid-session keeps the draft ---
    {
        Harness h;
        h.go_active();
        h.say("Half a thought.");
        h.peers.last().message("{\"type\":\"error\",\"error\":{\"message\":\"server overloaded\"}}");
        h.loop.run_until_idle();
        ASSERT(h.controller.phase() == SessionPhase::Failed);
        ASSERT(h.observer.errors.size() == 1);
        ASSERT(error_category(h.observer.errors[0].type) == ErrorCategory::Transport);
        ASSERT(h.draft.current_text() == "Half a thought.");
        ASSERT(h.controller.conversation().empty());
    }

    // --- Submit failure keeps the draft; retry succeeds ---
    {
        Harness h;
        h.controller.handle_utterance("Patched drywall in the hallway.");
        h.store.fail_entries = true;
        h.controller.submit();
        ASSERT(h.observer.errors.size() == 1);
        ASSERT(h.observer.errors[0].type == ErrorType::PersistenceFailed);
        ASSERT(h.observer.error_messages[0].find("draft is kept") != std::string::npos);
        ASSERT(h.draft.current_text() == "Patched drywall in the hallway.");
        ASSERT(!h.controller.submit_in_flight());

        h.store.fail_entries = false;
        h.controller.submit();
        ASSERT(h.draft.empty());
        ASSERT(h.store.entries.size() == 1);
    }

    // --- One submit at a time; fragments added meanwhile survive ---
    {
        Harness h;
        h.store.defer_entries = true;
        h.controller.handle_utterance("one");
        h.controller.submit();
        ASSERT(h.controller.submit_in_flight());
        h.controller.handle_utterance("two");
        h.controller.submit();
        ASSERT(h.observer.saw_toast("Save already in progress"));
        ASSERT(h.store.entry_requests.size() == 1);

        h.store.release_entry();
        ASSERT(!h.controller.submit_in_flight());
        ASSERT(h.draft.current_text() == "two");
        ASSERT(h.store.entries[0].transcript == "one");
    }

    // --- Discard while a submit is in flight: later dictation is not consumed ---
    {
        Harness h;
        h.store.defer_entries = true;
        h.controller.handle_utterance("Finished cabinets today.");
        h.controller.submit();
        h.controller.discard_draft();
        h.controller.handle_utterance("Primed the hallway walls.");

        h.store.release_entry();
        ASSERT(!h.controller.submit_in_flight());
        ASSERT(h.store.entries.size() == 1);
        ASSERT(h.store.entries[0].transcript == "Finished cabinets today.");
        ASSERT(h.draft.current_text() == "Primed the hallway walls.");
        ASSERT(h.observer.transcripts.back() == "Primed the hallway walls.");
    }

    // --- Diary sentences that start like commands stay in the draft ---
    {
        Harness h;
        h.controller.handle_utterance("Find the leak under the sink tomorrow.");
        h.controller.handle_utterance("Switch to the blue primer for the trim.");
        h.controller.handle_utterance("Select the tile for the bathroom.");
        ASSERT(h.draft.fragment_count() == 3);
        ASSERT(!h.observer.saw_toast("Select a job first"));
        ASSERT(h.store.searches.empty());
    }

    // --- Empty draft ---
    {
        Harness h;
        h.controller.submit();
        ASSERT(h.observer.saw_toast("Nothing to save yet"));
        ASSERT(h.store.entry_requests.empty());
    }

    // --- Extra fields are merged over the extracted ones ---
    {
        Harness h;
        h.controller.handle_utterance("Rolled the ceilings.");
        h.controller.submit({{"weather", "sunny"}});
        ASSERT(h.store.entry_requests.size() == 1);
        ASSERT(h.store.entry_requests[0].extracted["weather"] == "sunny");
        ASSERT(h.store.entry_requests[0].extracted.contains("techniques"));
    }

    // --- Assistant turns go to the conversation log, not the draft ---
    {
        Harness h;
        h.go_active();
        h.peers.last().message("{\"type\":\"response.text.delta\",\"delta\":\"Noted\"}");
        h.peers.last().message("{\"type\":\"response.text.delta\",\"delta\":\", thanks\"}");
        h.loop.run_until_idle();
        ASSERT(h.observer.partials.size() == 2 && h.observer.partials[1] == "Noted, thanks");
        h.peers.last().message("{\"type\":\"response.text.done\",\"text\":\"\"}");
        h.loop.run_until_idle();
        ASSERT(h.controller.conversation().size() == 1);
        ASSERT(h.controller.conversation().entries()[0].role == Role::Assistant);
        ASSERT(h.controller.conversation().entries()[0].text == "Noted, thanks");
        ASSERT(h.draft.empty());
    }

    // --- Idle policies ---
    {
        Harness h(IdleTimeoutPolicy::Notify);
        h.go_active();
        h.peers.last().message("{\"type\":\"response.done\"}");
        h.loop.run_until_idle();
        h.clock.advance(h.session_config.idle_timeout_ms + 1);
        h.loop.run_until_idle();
        ASSERT(h.controller.phase() == SessionPhase::Active);
        ASSERT(h.observer.toasts.size() == 1);
    }
    {
        Harness h(IdleTimeoutPolicy::Stop);
        h.go_active();
        h.say("Left the brushes soaking.");
        h.peers.last().message("{\"type\":\"input_audio_buffer.timeout_triggered\"}");
        h.loop.run_until_idle();
        ASSERT(h.controller.phase() == SessionPhase::Idle);
        ASSERT(h.transport.state() == TransportState::Closed);
        ASSERT(h.draft.current_text() == "Left the brushes soaking.");
    }
    {
        Harness h(IdleTimeoutPolicy::Submit);
        h.go_active();
        h.say("Left the brushes soaking.");
        h.peers.last().message("{\"type\":\"input_audio_buffer.timeout_triggered\"}");
        h.loop.run_until_idle();
        ASSERT(h.controller.phase() == SessionPhase::Idle);
        ASSERT(h.store.entries.size() == 1);
        ASSERT(h.draft.empty());
    }
    ASSERT(parse_idle_timeout_policy("STOP") == IdleTimeoutPolicy::Stop);
    ASSERT(parse_idle_timeout_policy("bogus") == IdleTimeoutPolicy::Notify);

    // --- Draft survives into the next app run; discard removes it ---
    {
        namespace fs = std::filesystem;
        fs::path dir = fs::temp_directory_path() /
                       ("jobdiary_controller_test_" + std::to_string(getpid()));
        std::string path = (dir / "draft.json").string();
        {
            Harness h(IdleTimeoutPolicy::Notify, path);
            h.go_active();
            h.say("Taped the windows.");
            h.controller.stop();
        }
        {
            Harness h(IdleTimeoutPolicy::Notify, path);
            ASSERT(h.controller.restore_draft());
            ASSERT(h.draft.current_text() == "Taped the windows.");
            ASSERT(h.observer.saw_toast("Draft restored from previous session"));
            h.controller.discard_draft();
            ASSERT(h.draft.empty());
        }
        {
            Harness h(IdleTimeoutPolicy::Notify, path);
            ASSERT(!h.controller.restore_draft());
        }
        fs::remove_all(dir);
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All session controller tests passed.\n";
    return 0;
}
