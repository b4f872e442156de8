/**
 * @file conversation_log.cpp
 * @brief Conversation log implementation
 */

#include "memory/conversation_log.h"
#include "utils.h"
#include <sstream>

namespace job_diary {
namespace memory {

const ConversationEntry& ConversationLog::append(Role role, const std::string& text) {
    ConversationEntry entry;
    entry.role = role;
    entry.text = text;
    entry.timestamp_ms = wall_now_ms();
    entries_.push_back(std::move(entry));
    return entries_.back();
}

const std::string& ConversationLog::append_partial(const std::string& delta) {
    partial_ += delta;
    return partial_;
}

const ConversationEntry* ConversationLog::finish_partial(const std::string& final_text) {
    std::string text = utils::is_empty_or_whitespace(final_text) ? partial_ : final_text;
    partial_.clear();
    text = utils::trim_copy(text);
    if (text.empty()) return nullptr;
    return &append(Role::Assistant, text);
}

void ConversationLog::clear() {
    entries_.clear();
    partial_.clear();
}

std::string ConversationLog::render(size_t n) const {
    size_t start = (n > 0 && entries_.size() > n) ? entries_.size() - n : 0;
    std::ostringstream oss;
    for (size_t i = start; i < entries_.size(); ++i) {
        oss << role_name(entries_[i].role) << ": " << entries_[i].text << "\n";
    }
    return oss.str();
}

} // namespace memory
} // namespace job_diary
