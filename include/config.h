#pragma once

#include <string>
#include <cstdint>

namespace job_diary {

struct AudioConfig {
    std::string input_device = "default";
    int sample_rate = 24000;   ///< Peer expects pcm16 @ 24 kHz
    int frame_ms = 20;
};

/// Trusted token service that mints single-use session credentials
struct CredentialConfig {
    std::string token_url = "http://localhost:3000/api/realtime-token";
    std::string hint;                 ///< Optional scope hint forwarded to the service
    int timeout_ms = 10000;
    int default_ttl_sec = 60;         ///< Used when the response carries no expires_at
};

struct PeerConfig {
    std::string url = "wss://api.openai.com/v1/realtime";
    std::string model = "gpt-realtime-mini";
    std::string transcription_model = "whisper-1";
    std::string instructions =
        "You are a helpful voice assistant for a job diary app. Listen to the user "
        "describe their work and help them capture details. Keep responses brief.";
    float vad_threshold = 0.5f;
    int prefix_padding_ms = 300;
    int silence_duration_ms = 500;
    int negotiate_timeout_ms = 10000;
};

struct SessionConfig {
    int idle_timeout_ms = 30000;
    std::string idle_timeout_policy = "notify";   ///< "notify" | "stop" | "submit"
};

struct DraftConfig {
    std::string checkpoint_path = "~/.jobdiary/draft.json";
    int max_age_hours = 24;
};

/// JobDiary REST API
struct StoreConfig {
    std::string base_url = "http://localhost:8000";
    std::string api_key;
    std::string user_id = "demo-user";
    int timeout_ms = 5000;
    int search_limit = 20;
    int list_limit = 20;
};

/**
 * @brief Application configuration
 *
 * Loaded from a JSON file, then overridden from JOBDIARY_* environment
 * variables. Unknown keys are ignored; missing keys keep their defaults.
 */
struct Config {
    AudioConfig audio;
    CredentialConfig credential;
    PeerConfig peer;
    SessionConfig session;
    DraftConfig draft;
    StoreConfig store;
    std::string log_level = "info";
    std::string log_file;

    /**
     * @brief Load from file. Missing or malformed files yield defaults (logged).
     */
    static Config load_from_file(const std::string& path);

    /**
     * @brief Parse from a JSON document string (no environment overrides)
     * @throws nlohmann::json::exception on malformed input
     */
    static Config from_json_string(const std::string& text);

    /**
     * @brief Apply JOBDIARY_TOKEN_URL, JOBDIARY_API_URL, JOBDIARY_API_KEY,
     *        JOBDIARY_USER_ID and JOBDIARY_LOG_LEVEL when set.
     *        JOBDIARY_HOME moves the draft checkpoint into that directory.
     */
    void apply_env_overrides();

    void save_to_file(const std::string& path) const;
};

} // namespace job_diary
