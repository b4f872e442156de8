#pragma once

/**
 * @file conversation_log.h
 * @brief Session-scoped display log of what was said, by whom
 *
 * Never persisted. Cleared when the session stops.
 */

#include "common.h"
#include <string>
#include <vector>

namespace job_diary {
namespace memory {

struct ConversationEntry {
    Role role = Role::User;
    std::string text;
    int64_t timestamp_ms = 0;
};

class ConversationLog {
public:
    ConversationLog() = default;

    // Non-copyable
    ConversationLog(const ConversationLog&) = delete;
    ConversationLog& operator=(const ConversationLog&) = delete;

    /// Append a finalized utterance; returns the stored entry
    const ConversationEntry& append(Role role, const std::string& text);

    /// Accumulate a streamed assistant delta; returns the partial text so far
    const std::string& append_partial(const std::string& delta);

    /**
     * @brief Close the streamed assistant turn
     * @param final_text Authoritative text from the peer (empty = use the partial)
     * @return The entry appended, or nullptr when there was nothing to append
     */
    const ConversationEntry* finish_partial(const std::string& final_text);

    const std::string& partial() const { return partial_; }
    const std::vector<ConversationEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    /// Drop all entries and any partial turn
    void clear();

    /// Last n entries rendered as "role: text" lines
    std::string render(size_t n = 0) const;

private:
    std::vector<ConversationEntry> entries_;
    std::string partial_;
};

} // namespace memory
} // namespace job_diary
