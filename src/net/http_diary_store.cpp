#include "net/http_diary_store.h"
#include "event_loop.h"
#include "logger.h"
#include "task_runner.h"
#include <stdexcept>

using json = nlohmann::json;

namespace job_diary {
namespace net {

namespace {

std::string str(const json& j, const char* key) {
    if (!j.is_object() || !j.contains(key)) return "";
    const auto& v = j[key];
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number()) return v.dump();
    return "";
}

std::vector<Entry> parse_entries(const json& j) {
    std::vector<Entry> entries;
    if (!j.is_array()) {
        throw std::runtime_error("expected an array of entries");
    }
    for (const auto& item : j) {
        entries.push_back(HttpDiaryStore::parse_entry(item));
    }
    return entries;
}

} // namespace

HttpDiaryStore::HttpDiaryStore(const StoreConfig& config, EventLoop& loop, TaskRunner& runner)
    : config_(config), loop_(loop), runner_(runner) {
    if (config_.api_key.empty()) {
        Logger::warn("[Store] No API key configured; requests may be rejected");
    }
}

Job HttpDiaryStore::parse_job(const json& j) {
    Job job;
    job.id = str(j, "id");
    job.name = str(j, "name");
    job.status = str(j, "status");
    job.address = str(j, "address");
    job.client_name = str(j, "client_name");
    job.updated_at = str(j, "updated_at");
    if (j.contains("job_state") && j["job_state"].is_object()) {
        job.stage = str(j["job_state"], "stage");
    }
    if (job.id.empty()) {
        throw std::runtime_error("job without id");
    }
    return job;
}

Entry HttpDiaryStore::parse_entry(const json& j) {
    Entry entry;
    entry.id = str(j, "id");
    entry.job_id = str(j, "job_id");
    entry.transcript = str(j, "transcript");
    entry.summary = str(j, "summary");
    entry.entry_ts = str(j, "entry_ts");
    if (j.contains("extracted") && j["extracted"].is_object()) {
        entry.extracted = j["extracted"];
    }
    return entry;
}

HttpRequest HttpDiaryStore::make_request(const std::string& method, const std::string& path) const {
    HttpRequest request;
    request.method = method;
    std::string base = config_.base_url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    request.url = base + path;
    request.headers = {"Content-Type: application/json", "Accept: application/json"};
    if (!config_.api_key.empty()) {
        request.headers.push_back("X-API-Key: " + config_.api_key);
    }
    request.timeout_ms = config_.timeout_ms;
    return request;
}

std::string HttpDiaryStore::user_query() const {
    return "user_id=" + url_encode(config_.user_id);
}

template<typename T>
void HttpDiaryStore::run(HttpRequest request, std::function<T(const json&)> decode,
                         Callback<T> on_done) {
    EventLoop* loop = &loop_;
    LOG_STORE(request.method + " " + request.url);
    bool queued = runner_.submit([request, decode, on_done, loop]() {
        Result<T> outcome = make_persistence_error("no response");
        auto response = perform(request);
        if (!response) {
            outcome = make_persistence_error(response.error().message);
        } else if (!response.value().ok()) {
            outcome = make_persistence_error("HTTP " + std::to_string(response.value().status) +
                                             ": " + error_detail(response.value().body));
        } else {
            json body = json::parse(response.value().body, nullptr, false);
            if (body.is_discarded()) {
                outcome = make_persistence_error("invalid JSON from " + request.url);
            } else {
                try {
                    outcome = decode(body);
                } catch (const std::exception& e) {
                    outcome = make_persistence_error(std::string("unexpected response: ") + e.what());
                }
            }
        }
        if (outcome.is_error()) {
            Logger::error("[Store] " + request.method + " " + request.url + " failed: " +
                          outcome.error().message);
        }
        loop->post([on_done, outcome]() { on_done(outcome); });
    });
    if (!queued) {
        loop_.post([on_done]() { on_done(make_persistence_error("store request could not be queued")); });
    }
}

void HttpDiaryStore::run_void(HttpRequest request, Callback<void> on_done) {
    EventLoop* loop = &loop_;
    LOG_STORE(request.method + " " + request.url);
    bool queued = runner_.submit([request, on_done, loop]() {
        Result<void> outcome;
        auto response = perform(request);
        if (!response) {
            outcome = make_persistence_error(response.error().message);
        } else if (!response.value().ok()) {
            outcome = make_persistence_error("HTTP " + std::to_string(response.value().status) +
                                             ": " + error_detail(response.value().body));
        }
        if (outcome.is_error()) {
            Logger::error("[Store] " + request.method + " " + request.url + " failed: " +
                          outcome.error().message);
        }
        loop->post([on_done, outcome]() { on_done(outcome); });
    });
    if (!queued) {
        loop_.post([on_done]() { on_done(make_persistence_error("store request could not be queued")); });
    }
}

void HttpDiaryStore::list_jobs(Callback<std::vector<Job>> on_done) {
    auto request = make_request("GET", "/jobs?" + user_query() +
                                       "&limit=" + std::to_string(config_.list_limit));
    run<std::vector<Job>>(std::move(request), [](const json& j) {
        std::vector<Job> jobs;
        if (!j.is_array()) {
            throw std::runtime_error("expected an array of jobs");
        }
        for (const auto& item : j) jobs.push_back(parse_job(item));
        return jobs;
    }, std::move(on_done));
}

void HttpDiaryStore::create_job(const std::string& name, Callback<Job> on_done) {
    auto request = make_request("POST", "/jobs");
    request.body = json{{"user_id", config_.user_id}, {"name", name}}.dump();
    run<Job>(std::move(request), [](const json& j) { return parse_job(j); }, std::move(on_done));
}

void HttpDiaryStore::update_job_status(const std::string& job_id, JobStatus status,
                                       Callback<Job> on_done) {
    auto request = make_request("PATCH", "/jobs/" + url_encode(job_id) + "?" + user_query());
    request.body = json{{"status", job_status_name(status)}}.dump();
    run<Job>(std::move(request), [](const json& j) { return parse_job(j); }, std::move(on_done));
}

void HttpDiaryStore::update_job_stage(const std::string& job_id, const std::string& stage,
                                      Callback<void> on_done) {
    auto request = make_request("POST", "/jobs/" + url_encode(job_id) + "/state?" + user_query());
    request.body = json{{"patch", {{"stage", stage}}}, {"reason", "voice command"}}.dump();
    run_void(std::move(request), std::move(on_done));
}

void HttpDiaryStore::list_entries(const std::string& job_id, Callback<std::vector<Entry>> on_done) {
    auto request = make_request("GET", "/entries?" + user_query() +
                                       "&job_id=" + url_encode(job_id) +
                                       "&limit=" + std::to_string(config_.list_limit));
    run<std::vector<Entry>>(std::move(request), parse_entries, std::move(on_done));
}

void HttpDiaryStore::create_entry(const NewEntry& entry, Callback<Entry> on_done) {
    auto request = make_request("POST", "/entries");
    json body;
    body["user_id"] = config_.user_id;
    body["job_id"] = entry.job_id;
    body["transcript"] = entry.transcript;
    body["extracted"] = entry.extracted;
    if (!entry.summary.empty()) body["summary"] = entry.summary;
    request.body = body.dump();
    run<Entry>(std::move(request), [](const json& j) { return parse_entry(j); }, std::move(on_done));
}

void HttpDiaryStore::search_entries(const std::string& job_id, const std::string& query, int limit,
                                    Callback<std::vector<Entry>> on_done) {
    auto request = make_request("POST", "/entries/search");
    request.body = json{{"user_id", config_.user_id}, {"job_id", job_id},
                        {"query", query}, {"limit", limit}}.dump();
    run<std::vector<Entry>>(std::move(request), parse_entries, std::move(on_done));
}

void HttpDiaryStore::create_debrief(const std::string& job_name_or_id, const std::string& text,
                                    Callback<void> on_done) {
    auto request = make_request("POST", "/debrief");
    request.body = json{{"user_id", config_.user_id}, {"job_name_or_id", job_name_or_id},
                        {"transcript", text}}.dump();
    run_void(std::move(request), std::move(on_done));
}

} // namespace net
} // namespace job_diary
