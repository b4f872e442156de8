#pragma once

#include "config.h"
#include "diary_store.h"
#include "net/http_client.h"
#include <functional>

namespace job_diary {

class EventLoop;
class TaskRunner;

namespace net {

/**
 * @brief DiaryStore over the JobDiary REST API
 *
 * Requests carry X-API-Key and the configured user_id. Requests run on the
 * TaskRunner; results are posted back to the event loop.
 */
class HttpDiaryStore : public DiaryStore {
public:
    HttpDiaryStore(const StoreConfig& config, EventLoop& loop, TaskRunner& runner);

    void list_jobs(Callback<std::vector<Job>> on_done) override;
    void create_job(const std::string& name, Callback<Job> on_done) override;
    void update_job_status(const std::string& job_id, JobStatus status,
                           Callback<Job> on_done) override;
    void update_job_stage(const std::string& job_id, const std::string& stage,
                          Callback<void> on_done) override;
    void list_entries(const std::string& job_id, Callback<std::vector<Entry>> on_done) override;
    void create_entry(const NewEntry& entry, Callback<Entry> on_done) override;
    void search_entries(const std::string& job_id, const std::string& query, int limit,
                        Callback<std::vector<Entry>> on_done) override;
    void create_debrief(const std::string& job_name_or_id, const std::string& text,
                        Callback<void> on_done) override;

    static Job parse_job(const nlohmann::json& j);
    static Entry parse_entry(const nlohmann::json& j);

private:
    template<typename T>
    void run(HttpRequest request, std::function<T(const nlohmann::json&)> decode,
             Callback<T> on_done);
    void run_void(HttpRequest request, Callback<void> on_done);

    HttpRequest make_request(const std::string& method, const std::string& path) const;
    std::string user_query() const;

    StoreConfig config_;
    EventLoop& loop_;
    TaskRunner& runner_;
};

} // namespace net
} // namespace job_diary
