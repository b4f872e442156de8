#include "audio/portaudio_source.h"
#include "command_executor.h"
#include "config.h"
#include "credential_broker.h"
#include "draft_accumulator.h"
#include "event_loop.h"
#include "logger.h"
#include "net/http_diary_store.h"
#include "net/http_token_service.h"
#include "net/realtime_link.h"
#include "session_controller.h"
#include "task_runner.h"
#include "transport_session.h"
#include "utils.h"
#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <thread>
#include <unistd.h>

namespace job_diary {

static std::atomic<bool> g_interrupted{false};

void signal_handler(int /*signal*/) {
    g_interrupted = true;
}

/// Prints controller output for the console
class ConsoleObserver : public SessionObserver {
public:
    void on_transcript_update(const std::string& draft_text) override {
        std::cout << "[draft] " << (draft_text.empty() ? "(empty)" : draft_text) << std::endl;
    }

    void on_conversation_append(const memory::ConversationEntry& entry) override {
        std::cout << role_name(entry.role) << ": " << entry.text << std::endl;
    }

    void on_toast(const std::string& message, ToastKind kind) override {
        std::cout << "(" << toast_kind_name(kind) << ") " << message << std::endl;
    }

    void on_error(const Error&, const std::string& message) override {
        std::cout << "(error) " << message << std::endl;
    }

    void on_state_changed(SessionPhase phase) override {
        std::cout << "[session] " << session_phase_name(phase) << std::endl;
    }

    void on_entries(const std::vector<Entry>& entries, EntriesView view) override {
        std::cout << "[entries" << (view == EntriesView::Search ? ", search" : "") << "] "
                  << entries.size() << std::endl;
        for (const auto& entry : entries) {
            std::cout << "  " << entry.entry_ts << "  "
                      << (entry.summary.empty() ? entry.transcript : entry.summary) << std::endl;
        }
    }
};

static void print_help() {
    std::cout << "Commands:\n"
              << "  start            begin a voice session\n"
              << "  stop             end the session (draft is kept)\n"
              << "  submit           save the draft as an entry\n"
              << "  discard          throw the draft away\n"
              << "  say <text>       route text as if it were spoken\n"
              << "  draft            show the current draft\n"
              << "  quit\n";
}

/// Handle one console line on the loop thread; false on quit
static bool handle_line(const std::string& raw, SessionController& controller,
                        DraftAccumulator& draft, EventLoop& loop) {
    std::string line = utils::trim_copy(raw);
    if (line.empty()) return true;

    if (line == "quit" || line == "exit") {
        controller.stop();
        loop.stop();
        return false;
    }
    if (line == "start") {
        controller.start();
    } else if (line == "stop") {
        controller.stop();
    } else if (line == "submit") {
        controller.submit();
    } else if (line == "discard") {
        controller.discard_draft();
    } else if (line == "draft") {
        std::cout << "[draft] " << draft.current_text() << std::endl;
    } else if (line.rfind("say ", 0) == 0) {
        controller.handle_utterance(line.substr(4));
    } else {
        print_help();
    }
    return true;
}

/// config/config.json beside the executable's parent directory, if present
static std::string default_config_path() {
    std::string config_path = "config/config.json";
    char buf[1024];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len != -1) {
        buf[len] = '\0';
        std::string exe_dir(buf);
        size_t pos = exe_dir.find_last_of('/');
        if (pos != std::string::npos) {
            std::string candidate = exe_dir.substr(0, pos) + "/../config/config.json";
            std::ifstream test(candidate);
            if (test.good()) {
                config_path = candidate;
            }
        }
    }
    return config_path;
}

} // namespace job_diary

int main(int argc, char* argv[]) {
    using namespace job_diary;

    Logger::initialize(LogLevel::INFO);

    if (argc > 1 && std::string(argv[1]) == "--list-devices") {
        audio::PortAudioSource::list_devices();
        Logger::shutdown();
        return 0;
    }

    std::string config_path = argc > 1 ? argv[1] : default_config_path();
    Config config = Config::load_from_file(config_path);
    Logger::initialize(Logger::parse_level(config.log_level), config.log_file);

    EventLoop loop;
    TaskRunner runner(2);

    net::HttpTokenService token_service(config.credential, loop, runner);
    CredentialBroker broker(token_service, config.credential);

    TransportSession transport(loop,
                               std::make_unique<audio::PortAudioSource>(config.audio),
                               net::make_realtime_link_factory(config.peer),
                               config.peer,
                               config.session);

    net::HttpDiaryStore store(config.store, loop, runner);
    CommandExecutor executor(store, config.store);
    DraftAccumulator draft(config.draft);
    ConsoleObserver observer;

    SessionController controller(loop, broker, transport, draft, executor, store, observer,
                                 parse_idle_timeout_policy(config.session.idle_timeout_policy));

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    loop.post([&]() {
        controller.restore_draft();
        executor.load_jobs([&](Result<void> result) {
            if (!result) return;
            auto job = executor.selected_job();
            if (job) {
                std::cout << "[job] " << job->name << " (" << job->status << ")" << std::endl;
            }
        });
        print_help();
    });

    // Interrupt flag is polled on the loop; the handler itself only sets it
    std::function<void()> watch_signals;
    watch_signals = [&]() {
        if (g_interrupted) {
            Logger::info("Shutting down...");
            controller.stop();
            loop.stop();
            return;
        }
        loop.post_delayed(200, watch_signals);
    };
    loop.post_delayed(200, watch_signals);

    std::atomic<bool> quit_requested{false};
    std::atomic<bool> stdin_closed{false};
    std::thread reader([&]() {
        std::string line;
        while (!quit_requested && std::getline(std::cin, line)) {
            loop.post([&, line]() {
                if (!handle_line(line, controller, draft, loop)) quit_requested = true;
            });
            if (line == "quit" || line == "exit") return;
        }
        stdin_closed = true;
        if (!quit_requested) {
            loop.post([&]() {
                controller.stop();
                loop.stop();
            });
        }
    });

    loop.run();

    // A reader still blocked on stdin (signal shutdown) is left behind
    // std::cin belongs to the reader thread until it exits
    if (quit_requested || stdin_closed) {
        reader.join();
    } else {
        reader.detach();
    }

    runner.wait_for_completion(2000);
    runner.shutdown();
    Logger::shutdown();
    return 0;
}
