/**
 * Config loading: defaults, partial files, environment overrides, malformed
 * input, and the api key never being written back. Also log level parsing.
 *
 * Run from build dir: ./test_config
 */

#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>

using namespace job_diary;
namespace fs = std::filesystem;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    Logger::initialize(LogLevel::ERROR);
    for (const char* name : {"JOBDIARY_TOKEN_URL", "JOBDIARY_API_URL", "JOBDIARY_API_KEY",
                             "JOBDIARY_USER_ID", "JOBDIARY_LOG_LEVEL", "JOBDIARY_HOME"}) {
        unsetenv(name);
    }

    fs::path dir = fs::temp_directory_path() / ("jobdiary_config_test_" + std::to_string(getpid()));
    fs::create_directories(dir);

    // --- Missing file: defaults ---
    {
        Config cfg = Config::load_from_file((dir / "missing.json").string());
        ASSERT(cfg.audio.sample_rate == 24000);
        ASSERT(cfg.session.idle_timeout_policy == "notify");
        ASSERT(cfg.store.user_id == "demo-user");
        ASSERT(cfg.draft.checkpoint_path.find('~') == std::string::npos || !std::getenv("HOME"));
    }

    // --- Partial document keeps other defaults ---
    {
        Config cfg = Config::from_json_string(
            "{\"store\":{\"base_url\":\"http://api.local\",\"user_id\":\"u-7\"},"
            "\"peer\":{\"model\":\"gpt-realtime\"},\"session\":{\"idle_timeout_ms\":5000}}");
        ASSERT(cfg.store.base_url == "http://api.local");
        ASSERT(cfg.store.user_id == "u-7");
        ASSERT(cfg.store.timeout_ms == 5000);
        ASSERT(cfg.peer.model == "gpt-realtime");
        ASSERT(cfg.peer.transcription_model == "whisper-1");
        ASSERT(cfg.session.idle_timeout_ms == 5000);
    }

    // --- Malformed string throws; malformed file falls back to defaults ---
    {
        bool threw = false;
        try {
            Config::from_json_string("{broken");
        } catch (const std::exception&) {
            threw = true;
        }
        ASSERT(threw);

        std::string path = (dir / "broken.json").string();
        std::ofstream(path) << "{broken";
        Config cfg = Config::load_from_file(path);
        ASSERT(cfg.store.base_url == "http://localhost:8000");
    }

    // --- Environment overrides and policy validation ---
    {
        std::string path = (dir / "env.json").string();
        std::ofstream(path) << "{\"store\":{\"api_key\":\"from-file\"},"
                               "\"session\":{\"idle_timeout_policy\":\"explode\"}}";
        setenv("JOBDIARY_API_KEY", "from-env", 1);
        setenv("JOBDIARY_USER_ID", "env-user", 1);
        setenv("JOBDIARY_HOME", dir.string().c_str(), 1);
        Config cfg = Config::load_from_file(path);
        ASSERT(cfg.store.api_key == "from-env");
        ASSERT(cfg.store.user_id == "env-user");
        ASSERT(cfg.draft.checkpoint_path == dir.string() + "/draft.json");
        ASSERT(cfg.session.idle_timeout_policy == "notify");
        unsetenv("JOBDIARY_API_KEY");
        unsetenv("JOBDIARY_USER_ID");
        unsetenv("JOBDIARY_HOME");
    }

    // --- Saved config omits the api key and reloads ---
    {
        Config cfg;
        cfg.store.api_key = "secret";
        cfg.store.user_id = "saved-user";
        std::string path = (dir / "saved.json").string();
        cfg.save_to_file(path);

        std::ifstream in(path);
        std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        ASSERT(text.find("secret") == std::string::npos);

        Config reloaded = Config::load_from_file(path);
        ASSERT(reloaded.store.user_id == "saved-user");
        ASSERT(reloaded.store.api_key.empty());
    }

    // --- Log levels and paths ---
    ASSERT(Logger::parse_level("DEBUG") == LogLevel::DEBUG);
    ASSERT(Logger::parse_level("warn") == LogLevel::WARN);
    ASSERT(Logger::parse_level("loud", LogLevel::ERROR) == LogLevel::ERROR);
    ASSERT(expand_path("") == "");
    ASSERT(expand_path("/abs/path") == "/abs/path");
    if (std::getenv("HOME")) {
        ASSERT(expand_path("~/x") == std::string(std::getenv("HOME")) + "/x");
    }

    fs::remove_all(dir);
    Logger::shutdown();

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All config tests passed.\n";
    return 0;
}
