#pragma once

/**
 * @file command_executor.h
 * @brief Carries out classified voice commands against the diary store
 */

#include "command_interpreter.h"
#include "diary_store.h"
#include "errors.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace job_diary {

struct StoreConfig;

enum class ToastKind {
    Info,
    Success,
    Error
};

const char* toast_kind_name(ToastKind kind);

/// Which entry list the UI is showing
enum class EntriesView {
    All,
    Search
};

/**
 * @brief Executes commands, holding the selected job and the cached job list
 *
 * All methods and callbacks run on the event loop thread. Store failures are
 * reported through the error handler as PersistenceFailed; user guidance
 * ("Select a job first") goes out as toasts.
 */
class CommandExecutor {
public:
    using ToastHandler = std::function<void(const std::string& message, ToastKind kind)>;
    using ErrorHandler = std::function<void(const Error& error)>;
    using EntriesHandler = std::function<void(const std::vector<Entry>& entries, EntriesView view)>;

    CommandExecutor(DiaryStore& store, const StoreConfig& config);
    ~CommandExecutor();

    CommandExecutor(const CommandExecutor&) = delete;
    CommandExecutor& operator=(const CommandExecutor&) = delete;

    void set_toast_handler(ToastHandler handler);
    void set_error_handler(ErrorHandler handler);
    void set_entries_handler(EntriesHandler handler);

    /**
     * @brief Run a command
     * @param draft_text Current draft, used by a debrief without its own text
     *
     * SaveDraft is not handled here; the session controller owns submit.
     */
    void execute(const Command& command, const std::string& draft_text);

    /// Refresh the job cache; selects the most recent job when none is selected
    void load_jobs(std::function<void(Result<void>)> on_done = nullptr);

    /// Cache and select a job created elsewhere (implicit job on submit)
    void adopt_job(const Job& job);

    void select_job(const std::string& job_id);
    std::optional<Job> selected_job() const;
    /// Empty when no job is selected
    const std::string& selected_job_id() const;
    const std::vector<Job>& jobs() const;
    EntriesView view() const;

    /// Reload the selected job's entries (view back to All)
    void refresh_entries();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace job_diary
