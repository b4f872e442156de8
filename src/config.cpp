#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

void apply_json_to_config(job_diary::Config& cfg, const json& j) {
    if (j.contains("audio")) {
        auto& a = j["audio"];
        if (a.contains("input_device")) cfg.audio.input_device = a["input_device"];
        if (a.contains("sample_rate")) cfg.audio.sample_rate = a["sample_rate"];
        if (a.contains("frame_ms")) cfg.audio.frame_ms = a["frame_ms"];
    }

    if (j.contains("credential")) {
        auto& c = j["credential"];
        if (c.contains("token_url")) cfg.credential.token_url = c["token_url"];
        if (c.contains("hint")) cfg.credential.hint = c["hint"];
        if (c.contains("timeout_ms")) cfg.credential.timeout_ms = c["timeout_ms"];
        if (c.contains("default_ttl_sec")) cfg.credential.default_ttl_sec = c["default_ttl_sec"];
    }

    if (j.contains("peer")) {
        auto& p = j["peer"];
        if (p.contains("url")) cfg.peer.url = p["url"];
        if (p.contains("model")) cfg.peer.model = p["model"];
        if (p.contains("transcription_model")) cfg.peer.transcription_model = p["transcription_model"];
        if (p.contains("instructions")) cfg.peer.instructions = p["instructions"];
        if (p.contains("vad_threshold")) cfg.peer.vad_threshold = p["vad_threshold"];
        if (p.contains("prefix_padding_ms")) cfg.peer.prefix_padding_ms = p["prefix_padding_ms"];
        if (p.contains("silence_duration_ms")) cfg.peer.silence_duration_ms = p["silence_duration_ms"];
        if (p.contains("negotiate_timeout_ms")) cfg.peer.negotiate_timeout_ms = p["negotiate_timeout_ms"];
    }

    if (j.contains("session")) {
        auto& s = j["session"];
        if (s.contains("idle_timeout_ms")) cfg.session.idle_timeout_ms = s["idle_timeout_ms"];
        if (s.contains("idle_timeout_policy")) cfg.session.idle_timeout_policy = s["idle_timeout_policy"];
    }

    if (j.contains("draft")) {
        auto& d = j["draft"];
        if (d.contains("checkpoint_path")) cfg.draft.checkpoint_path = d["checkpoint_path"];
        if (d.contains("max_age_hours")) cfg.draft.max_age_hours = d["max_age_hours"];
    }

    if (j.contains("store")) {
        auto& s = j["store"];
        if (s.contains("base_url")) cfg.store.base_url = s["base_url"];
        if (s.contains("api_key")) cfg.store.api_key = s["api_key"];
        if (s.contains("user_id")) cfg.store.user_id = s["user_id"];
        if (s.contains("timeout_ms")) cfg.store.timeout_ms = s["timeout_ms"];
        if (s.contains("search_limit")) cfg.store.search_limit = s["search_limit"];
        if (s.contains("list_limit")) cfg.store.list_limit = s["list_limit"];
    }

    if (j.contains("log_level")) cfg.log_level = j["log_level"];
    if (j.contains("log_file")) cfg.log_file = j["log_file"];
}

void override_from_env(std::string& field, const char* name) {
    const char* v = std::getenv(name);
    if (v && *v) field = v;
}

} // namespace

namespace job_diary {

Config Config::from_json_string(const std::string& text) {
    Config cfg;
    apply_json_to_config(cfg, json::parse(text));
    cfg.draft.checkpoint_path = expand_path(cfg.draft.checkpoint_path);
    cfg.log_file = expand_path(cfg.log_file);
    return cfg;
}

Config Config::load_from_file(const std::string& path) {
    Config cfg;

    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::warn("Could not open config file: " + path + ". Using defaults.");
    } else {
        try {
            json j;
            file >> j;
            apply_json_to_config(cfg, j);
        } catch (const json::exception& e) {
            Logger::error("Error parsing config: " + std::string(e.what()) + ". Using defaults.");
            cfg = Config();
        }
    }

    cfg.apply_env_overrides();
    cfg.draft.checkpoint_path = expand_path(cfg.draft.checkpoint_path);
    cfg.log_file = expand_path(cfg.log_file);

    if (cfg.session.idle_timeout_policy != "notify" &&
        cfg.session.idle_timeout_policy != "stop" &&
        cfg.session.idle_timeout_policy != "submit") {
        Logger::warn("Unknown session.idle_timeout_policy \"" + cfg.session.idle_timeout_policy +
                     "\"; using notify");
        cfg.session.idle_timeout_policy = "notify";
    }
    return cfg;
}

void Config::apply_env_overrides() {
    override_from_env(credential.token_url, "JOBDIARY_TOKEN_URL");
    override_from_env(store.base_url, "JOBDIARY_API_URL");
    override_from_env(store.api_key, "JOBDIARY_API_KEY");
    override_from_env(store.user_id, "JOBDIARY_USER_ID");
    override_from_env(log_level, "JOBDIARY_LOG_LEVEL");

    const char* home = std::getenv("JOBDIARY_HOME");
    if (home && *home) draft.checkpoint_path = default_data_dir() + "/draft.json";
}

void Config::save_to_file(const std::string& path) const {
    json j;

    j["audio"]["input_device"] = audio.input_device;
    j["audio"]["sample_rate"] = audio.sample_rate;
    j["audio"]["frame_ms"] = audio.frame_ms;

    j["credential"]["token_url"] = credential.token_url;
    j["credential"]["hint"] = credential.hint;
    j["credential"]["timeout_ms"] = credential.timeout_ms;
    j["credential"]["default_ttl_sec"] = credential.default_ttl_sec;

    j["peer"]["url"] = peer.url;
    j["peer"]["model"] = peer.model;
    j["peer"]["transcription_model"] = peer.transcription_model;
    j["peer"]["instructions"] = peer.instructions;
    j["peer"]["vad_threshold"] = peer.vad_threshold;
    j["peer"]["prefix_padding_ms"] = peer.prefix_padding_ms;
    j["peer"]["silence_duration_ms"] = peer.silence_duration_ms;
    j["peer"]["negotiate_timeout_ms"] = peer.negotiate_timeout_ms;

    j["session"]["idle_timeout_ms"] = session.idle_timeout_ms;
    j["session"]["idle_timeout_policy"] = session.idle_timeout_policy;

    j["draft"]["checkpoint_path"] = draft.checkpoint_path;
    j["draft"]["max_age_hours"] = draft.max_age_hours;

    // api_key is never written back
    j["store"]["base_url"] = store.base_url;
    j["store"]["user_id"] = store.user_id;
    j["store"]["timeout_ms"] = store.timeout_ms;
    j["store"]["search_limit"] = store.search_limit;
    j["store"]["list_limit"] = store.list_limit;

    j["log_level"] = log_level;
    if (!log_file.empty()) j["log_file"] = log_file;

    std::ofstream file(path);
    if (!file.is_open()) {
        Logger::error("Could not write config file: " + path);
        return;
    }
    file << j.dump(2) << std::endl;
}

} // namespace job_diary
