/**
 * REST payload decoding and the libcurl helpers. The only request goes to a
 * closed loopback port, so no network access is needed.
 *
 * Run from build dir: ./test_http_parsing
 */

#include "config.h"
#include "event_loop.h"
#include "logger.h"
#include "net/http_client.h"
#include "net/http_diary_store.h"
#include "net/http_token_service.h"
#include "task_runner.h"
#include <iostream>
#include <optional>
#include <string>

using namespace job_diary;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    Logger::initialize(LogLevel::ERROR);

    // --- Jobs ---
    {
        Job job = net::HttpDiaryStore::parse_job(json::parse(
            "{\"id\":\"a1\",\"name\":\"Smith House\",\"status\":\"in_progress\","
            "\"job_state\":{\"stage\":\"prep\"},\"client_name\":\"Pat\",\"updated_at\":\"2024-05-01\"}"));
        ASSERT(job.id == "a1");
        ASSERT(job.name == "Smith House");
        ASSERT(job.status == "in_progress");
        ASSERT(job.stage == "prep");
        ASSERT(job.client_name == "Pat");

        Job numeric = net::HttpDiaryStore::parse_job(json::parse("{\"id\":42,\"name\":\"Deck\"}"));
        ASSERT(numeric.id == "42");

        bool threw = false;
        try {
            net::HttpDiaryStore::parse_job(json::parse("{\"name\":\"no id\"}"));
        } catch (const std::exception&) {
            threw = true;
        }
        ASSERT(threw);
    }

    // --- Entries ---
    {
        Entry entry = net::HttpDiaryStore::parse_entry(json::parse(
            "{\"id\":\"e1\",\"job_id\":\"a1\",\"transcript\":\"Primed walls.\","
            "\"extracted\":{\"techniques\":[\"primed\"]},\"summary\":\"Primed walls.\","
            "\"entry_ts\":\"2024-05-01T10:00:00Z\"}"));
        ASSERT(entry.id == "e1");
        ASSERT(entry.extracted["techniques"][0] == "primed");
        ASSERT(entry.entry_ts == "2024-05-01T10:00:00Z");

        Entry bare = net::HttpDiaryStore::parse_entry(json::parse("{\"id\":\"e2\",\"extracted\":null}"));
        ASSERT(bare.extracted.is_object() && bare.extracted.empty());
    }

    // --- Error bodies ---
    ASSERT(net::error_detail("{\"detail\":\"Job not found\"}") == "Job not found");
    ASSERT(net::error_detail("{\"error\":\"Failed\",\"details\":\"quota\"}") == "Failed: quota");
    ASSERT(net::error_detail("{\"error\":{\"message\":\"bad key\"}}") == "bad key");
    ASSERT(net::error_detail("plain text") == "plain text");
    ASSERT(net::error_detail(std::string(300, 'x')).size() == 203);

    // --- URL encoding ---
    ASSERT(net::url_encode("Smith House") == "Smith%20House");
    ASSERT(net::url_encode("a&b=c") == "a%26b%3Dc");

    // --- Transport failure maps to an error, not a response ---
    {
        net::HttpRequest request;
        request.url = "http://127.0.0.1:1/unreachable";
        request.timeout_ms = 2000;
        request.connect_timeout_ms = 1000;
        auto response = net::perform(request);
        ASSERT(response.is_error());
    }

    // --- Token service failure arrives on the loop as CredentialUnavailable ---
    {
        EventLoop loop;
        TaskRunner runner(1);
        CredentialConfig config;
        config.token_url = "http://127.0.0.1:1/api/realtime-token";
        config.timeout_ms = 2000;
        net::HttpTokenService service(config, loop, runner);

        std::optional<Error> error;
        service.issue("", [&](Result<std::string> body) {
            if (body.is_error()) error = body.error();
        });
        ASSERT(runner.wait_for_completion(10000));
        ASSERT(!error.has_value());  // not delivered until the loop runs
        loop.run_until_idle();
        ASSERT(error.has_value() && error->type == ErrorType::CredentialUnavailable);
        runner.shutdown();
    }

    Logger::shutdown();

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All HTTP parsing tests passed.\n";
    return 0;
}
