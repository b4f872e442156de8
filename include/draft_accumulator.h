#pragma once

/**
 * @file draft_accumulator.h
 * @brief The diary entry in progress, checkpointed to local storage
 */

#include "common.h"
#include "errors.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace job_diary {

struct DraftConfig;

/**
 * @brief Ordered, append-only log of diary-bound fragments
 *
 * Every append writes a checkpoint ({fragments, text, timestamp_ms}) to a
 * JSON file, replaced atomically through a temp file. A checkpoint is only
 * restorable while younger than the staleness window. The buffer outlives
 * transport sessions; it is cleared only by a successful submit or an
 * explicit discard.
 */
class DraftAccumulator {
public:
    using WallNowFn = std::function<WallClock::time_point()>;

    /**
     * @param checkpoint_path File the draft is persisted to (empty = memory only)
     * @param max_age Staleness window for restore()
     * @param now Wall clock source (tests inject one)
     */
    DraftAccumulator(const std::string& checkpoint_path,
                     std::chrono::hours max_age = std::chrono::hours(DEFAULT_DRAFT_MAX_AGE_HOURS),
                     WallNowFn now = nullptr);
    explicit DraftAccumulator(const DraftConfig& config, WallNowFn now = nullptr);
    ~DraftAccumulator();

    DraftAccumulator(const DraftAccumulator&) = delete;
    DraftAccumulator& operator=(const DraftAccumulator&) = delete;

    /// Append a fragment (whitespace-only fragments are ignored) and checkpoint
    void append(const std::string& text);

    /// Fragments joined with single spaces, in arrival order
    std::string current_text() const;

    const std::vector<std::string>& fragments() const;
    size_t fragment_count() const;
    bool empty() const;

    /// Wipe the in-memory buffer and the checkpoint file. Starts a new epoch.
    void clear();

    /**
     * @brief Drop the first n fragments (the part a submit froze)
     *
     * Fragments appended after the freeze stay, and are checkpointed.
     */
    void consume(size_t n);

    /// Persist the current buffer now
    Result<void> checkpoint() const;

    /**
     * @brief Load the checkpoint into the buffer if it is within the window
     * @return The restored text, or nullopt when absent, stale, from the future or unreadable
     */
    std::optional<std::string> restore();

    /**
     * @brief Bumped whenever the buffer is replaced (clear, successful restore)
     *
     * A fragment count frozen under one epoch only describes that epoch's buffer.
     */
    uint64_t epoch() const;

    const std::string& checkpoint_path() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace job_diary
