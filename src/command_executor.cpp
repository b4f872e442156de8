#include "command_executor.h"
#include "config.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>

namespace job_diary {

const char* toast_kind_name(ToastKind kind) {
    switch (kind) {
        case ToastKind::Info: return "info";
        case ToastKind::Success: return "success";
        case ToastKind::Error: return "error";
        default: return "info";
    }
}

class CommandExecutor::Impl {
public:
    Impl(DiaryStore& store, const StoreConfig& config)
        : store_(store),
          search_limit_(config.search_limit),
          alive_(std::make_shared<int>(0)) {}

    void execute(const Command& command, const std::string& draft_text) {
        LOG_CMD(std::string("Executing ") + command_name(command));
        std::visit([this, &draft_text](const auto& cmd) { run(cmd, draft_text); }, command);
    }

    void load_jobs(std::function<void(Result<void>)> on_done) {
        auto alive = std::weak_ptr<int>(alive_);
        store_.list_jobs([this, alive, on_done](Result<std::vector<Job>> result) {
            if (alive.expired()) return;
            if (!result) {
                report(result.error());
                if (on_done) on_done(result.error());
                return;
            }
            jobs_ = result.value();
            if (selected_id_.empty() && !jobs_.empty()) {
                selected_id_ = jobs_.front().id;
                LOG_CMD("Selected most recent job: " + jobs_.front().name);
            }
            if (on_done) on_done(Result<void>());
        });
    }

    void adopt_job(const Job& job) {
        jobs_.erase(std::remove_if(jobs_.begin(), jobs_.end(),
                                   [&job](const Job& j) { return j.id == job.id; }),
                    jobs_.end());
        jobs_.insert(jobs_.begin(), job);
        selected_id_ = job.id;
    }

    std::optional<Job> selected_job() const {
        for (const auto& job : jobs_) {
            if (job.id == selected_id_) return job;
        }
        return std::nullopt;
    }

    void refresh_entries() {
        if (selected_id_.empty()) return;
        auto alive = std::weak_ptr<int>(alive_);
        store_.list_entries(selected_id_, [this, alive](Result<std::vector<Entry>> result) {
            if (alive.expired()) return;
            if (!result) {
                report(result.error());
                return;
            }
            view_ = EntriesView::All;
            if (entries_handler_) entries_handler_(result.value(), view_);
        });
    }

    std::vector<Job> jobs_;
    std::string selected_id_;
    EntriesView view_ = EntriesView::All;
    ToastHandler toast_handler_;
    ErrorHandler error_handler_;
    EntriesHandler entries_handler_;

private:
    void run(const command::ListJobs&, const std::string&) {
        auto alive = std::weak_ptr<int>(alive_);
        load_jobs([this, alive](Result<void> result) {
            if (alive.expired() || !result) return;
            std::vector<std::string> names;
            for (size_t i = 0; i < jobs_.size() && i < 6; ++i) names.push_back(jobs_[i].name);
            if (names.empty()) {
                toast("No jobs yet", ToastKind::Info);
            } else {
                toast("Jobs: " + utils::join(names, ", ") + (jobs_.size() > 6 ? "…" : ""),
                      ToastKind::Info);
            }
        });
    }

    void run(const command::CreateJob& cmd, const std::string&) {
        auto alive = std::weak_ptr<int>(alive_);
        store_.create_job(cmd.name, [this, alive](Result<Job> result) {
            if (alive.expired()) return;
            if (!result) {
                report(result.error());
                return;
            }
            adopt_job(result.value());
            toast("Created job: " + result.value().name, ToastKind::Success);
        });
    }

    void run(const command::SelectJob& cmd, const std::string&) {
        const Job* match = find_job(cmd.query);
        if (!match) {
            toast("Couldn't find a job matching \"" + cmd.query + "\"", ToastKind::Error);
            return;
        }
        selected_id_ = match->id;
        toast("Switched to job: " + match->name, ToastKind::Info);
        refresh_entries();
    }

    void run(const command::SetStatus& cmd, const std::string&) {
        if (!require_job()) return;
        auto alive = std::weak_ptr<int>(alive_);
        JobStatus status = cmd.status;
        store_.update_job_status(selected_id_, status, [this, alive, status](Result<Job> result) {
            if (alive.expired()) return;
            if (!result) {
                report(result.error());
                return;
            }
            replace_job(result.value());
            toast(std::string("Job marked ") + utils::underscores_to_spaces(job_status_name(status)),
                  ToastKind::Success);
        });
    }

    void run(const command::SetStage& cmd, const std::string&) {
        if (!require_job()) return;
        auto alive = std::weak_ptr<int>(alive_);
        std::string job_id = selected_id_;
        std::string stage = cmd.stage;
        store_.update_job_stage(job_id, stage, [this, alive, job_id, stage](Result<void> result) {
            if (alive.expired()) return;
            if (!result) {
                report(result.error());
                return;
            }
            for (auto& job : jobs_) {
                if (job.id == job_id) job.stage = stage;
            }
            toast("Stage set to: " + stage, ToastKind::Success);
        });
    }

    void run(const command::SearchEntries& cmd, const std::string&) {
        if (!require_job()) return;
        auto alive = std::weak_ptr<int>(alive_);
        std::string query = cmd.query;
        store_.search_entries(selected_id_, query, search_limit_,
                              [this, alive, query](Result<std::vector<Entry>> result) {
            if (alive.expired()) return;
            if (!result) {
                report(result.error());
                return;
            }
            view_ = EntriesView::Search;
            if (entries_handler_) entries_handler_(result.value(), view_);
            toast("Search: " + std::to_string(result.value().size()) + " result(s) for \"" +
                  query + "\"", ToastKind::Info);
        });
    }

    void run(const command::ShowAllEntries&, const std::string&) {
        if (selected_id_.empty()) return;
        view_ = EntriesView::All;
        refresh_entries();
        toast("Showing all entries", ToastKind::Info);
    }

    void run(const command::SaveDraft&, const std::string&) {
        Logger::warn("[Command] SaveDraft reached the executor; submit is handled by the session");
    }

    void run(const command::SaveAsDebrief& cmd, const std::string& draft_text) {
        if (!require_job()) return;
        std::string text = utils::trim_copy(cmd.text.empty() ? draft_text : cmd.text);
        if (text.empty()) {
            toast("Nothing to debrief yet", ToastKind::Error);
            return;
        }
        auto alive = std::weak_ptr<int>(alive_);
        store_.create_debrief(selected_id_, text, [this, alive](Result<void> result) {
            if (alive.expired()) return;
            if (!result) {
                report(result.error());
                return;
            }
            toast("Debrief saved", ToastKind::Success);
            refresh_entries();
        });
    }

    /// id, then exact name, then substring (case-insensitive)
    const Job* find_job(const std::string& query) const {
        std::string q = utils::normalize_copy(utils::trim_copy(query));
        for (const auto& job : jobs_) {
            if (job.id == query) return &job;
        }
        for (const auto& job : jobs_) {
            if (utils::normalize_copy(job.name) == q) return &job;
        }
        for (const auto& job : jobs_) {
            if (utils::normalize_copy(job.name).find(q) != std::string::npos) return &job;
        }
        return nullptr;
    }

    bool require_job() {
        if (!selected_id_.empty()) return true;
        toast("Select a job first", ToastKind::Error);
        return false;
    }

    void replace_job(const Job& updated) {
        for (auto& job : jobs_) {
            if (job.id == updated.id) job = updated;
        }
    }

    void toast(const std::string& message, ToastKind kind) {
        LOG_CMD(std::string("Toast (") + toast_kind_name(kind) + "): " + message);
        if (toast_handler_) toast_handler_(message, kind);
    }

    void report(const Error& error) {
        if (error_handler_) error_handler_(error);
    }

    DiaryStore& store_;
    int search_limit_;
    std::shared_ptr<int> alive_;
};

CommandExecutor::CommandExecutor(DiaryStore& store, const StoreConfig& config)
    : pimpl_(std::make_unique<Impl>(store, config)) {}

CommandExecutor::~CommandExecutor() = default;

void CommandExecutor::set_toast_handler(ToastHandler handler) {
    pimpl_->toast_handler_ = std::move(handler);
}

void CommandExecutor::set_error_handler(ErrorHandler handler) {
    pimpl_->error_handler_ = std::move(handler);
}

void CommandExecutor::set_entries_handler(EntriesHandler handler) {
    pimpl_->entries_handler_ = std::move(handler);
}

void CommandExecutor::execute(const Command& command, const std::string& draft_text) {
    pimpl_->execute(command, draft_text);
}

void CommandExecutor::load_jobs(std::function<void(Result<void>)> on_done) {
    pimpl_->load_jobs(std::move(on_done));
}

void CommandExecutor::adopt_job(const Job& job) {
    pimpl_->adopt_job(job);
}

void CommandExecutor::select_job(const std::string& job_id) {
    pimpl_->selected_id_ = job_id;
}

std::optional<Job> CommandExecutor::selected_job() const {
    return pimpl_->selected_job();
}

const std::string& CommandExecutor::selected_job_id() const {
    return pimpl_->selected_id_;
}

const std::vector<Job>& CommandExecutor::jobs() const {
    return pimpl_->jobs_;
}

EntriesView CommandExecutor::view() const {
    return pimpl_->view_;
}

void CommandExecutor::refresh_entries() {
    pimpl_->refresh_entries();
}

} // namespace job_diary
