#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include <functional>

namespace job_diary {

// Audio types
using Sample = int16_t;
using AudioFrame = std::vector<Sample>;

// Timing
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;
using WallClock = std::chrono::system_clock;

/// Milliseconds since the Unix epoch (persisted timestamps)
inline int64_t wall_now_ms() {
    return std::chrono::duration_cast<Duration>(
        WallClock::now().time_since_epoch()).count();
}

constexpr int DEFAULT_DRAFT_MAX_AGE_HOURS = 24;

/// Generation stamp of one negotiate -> close lifecycle
using SessionGeneration = uint64_t;

/**
 * @brief Speaker role of an utterance
 */
enum class Role {
    User,
    Assistant
};

inline const char* role_name(Role role) {
    return role == Role::User ? "user" : "assistant";
}

/**
 * @brief Short-lived, single-use secret for one transport session
 */
struct SessionCredential {
    std::string secret;
    WallClock::time_point expires_at;

    bool empty() const { return secret.empty(); }
    bool is_expired(WallClock::time_point now = WallClock::now()) const {
        return now >= expires_at;
    }
};

// Callback types
using AudioFrameCallback = std::function<void(const AudioFrame&)>;

} // namespace job_diary
