#pragma once

/**
 * @file diary_store.h
 * @brief Persistence collaborator for jobs, entries and debriefs
 */

#include "command_interpreter.h"
#include "errors.h"
#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace job_diary {

struct Job {
    std::string id;
    std::string name;
    std::string status = "quoted";
    std::string stage;           ///< job_state.stage when set
    std::string address;
    std::string client_name;
    std::string updated_at;
};

struct Entry {
    std::string id;
    std::string job_id;
    std::string transcript;
    nlohmann::json extracted = nlohmann::json::object();
    std::string summary;
    std::string entry_ts;
};

struct NewEntry {
    std::string job_id;
    std::string transcript;
    nlohmann::json extracted = nlohmann::json::object();
    std::string summary;
};

/**
 * @brief Async store interface, scoped to one user by the implementation
 *
 * Callbacks run on the event loop thread. Every failure is reported as
 * PersistenceFailed.
 */
class DiaryStore {
public:
    template<typename T>
    using Callback = std::function<void(Result<T>)>;

    virtual ~DiaryStore() = default;

    /// Most recently updated first
    virtual void list_jobs(Callback<std::vector<Job>> on_done) = 0;
    virtual void create_job(const std::string& name, Callback<Job> on_done) = 0;
    virtual void update_job_status(const std::string& job_id, JobStatus status,
                                   Callback<Job> on_done) = 0;
    /// Shallow-merges {stage} into the job's state
    virtual void update_job_stage(const std::string& job_id, const std::string& stage,
                                  Callback<void> on_done) = 0;
    virtual void list_entries(const std::string& job_id, Callback<std::vector<Entry>> on_done) = 0;
    virtual void create_entry(const NewEntry& entry, Callback<Entry> on_done) = 0;
    virtual void search_entries(const std::string& job_id, const std::string& query, int limit,
                                Callback<std::vector<Entry>> on_done) = 0;
    /// One-shot debrief record; the store resolves the job by name or id
    virtual void create_debrief(const std::string& job_name_or_id, const std::string& text,
                                Callback<void> on_done) = 0;
};

} // namespace job_diary
