#pragma once

/**
 * @file entry_extractor.h
 * @brief Pattern-based enrichment of a diary transcript before it is saved
 */

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace job_diary {

/**
 * @brief Deterministic field extraction for painter job entries
 *
 * Produces an object with any of: areas_painted, colors, techniques,
 * materials (item -> quantity), tasks_completed, next_actions, issues.
 * Keys appear only when something was found.
 */
class EntryExtractor {
public:
    static nlohmann::json extract(const std::string& transcript);

    /// Job name mentioned in the text ("job at 12 Oak Street", "working on the Smith house")
    static std::optional<std::string> extract_job_name(const std::string& transcript);

    /// First sentence, cut at max_chars on a word boundary
    static std::string summarize(const std::string& transcript, size_t max_chars = 120);
};

} // namespace job_diary
