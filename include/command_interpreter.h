#pragma once

#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace job_diary {

/**
 * @brief Job lifecycle status as stored by the diary backend
 */
enum class JobStatus {
    Quoted,
    InProgress,
    Complete,
    OnHold
};

/// Wire name: "quoted", "in_progress", "complete", "on_hold"
const char* job_status_name(JobStatus status);

/// Accepts wire names and spoken synonyms ("done", "paused", "in progress", ...)
std::optional<JobStatus> parse_job_status(const std::string& text);

namespace command {

struct ListJobs {};
struct CreateJob { std::string name; };
struct SelectJob { std::string query; };
struct SetStatus { JobStatus status; };
struct SetStage { std::string stage; };
struct SearchEntries { std::string query; };
struct ShowAllEntries {};
struct SaveDraft {};
/// Empty text means "use the current draft"
struct SaveAsDebrief { std::string text; };

inline bool operator==(const ListJobs&, const ListJobs&) { return true; }
inline bool operator==(const CreateJob& a, const CreateJob& b) { return a.name == b.name; }
inline bool operator==(const SelectJob& a, const SelectJob& b) { return a.query == b.query; }
inline bool operator==(const SetStatus& a, const SetStatus& b) { return a.status == b.status; }
inline bool operator==(const SetStage& a, const SetStage& b) { return a.stage == b.stage; }
inline bool operator==(const SearchEntries& a, const SearchEntries& b) { return a.query == b.query; }
inline bool operator==(const ShowAllEntries&, const ShowAllEntries&) { return true; }
inline bool operator==(const SaveDraft&, const SaveDraft&) { return true; }
inline bool operator==(const SaveAsDebrief& a, const SaveAsDebrief& b) { return a.text == b.text; }

} // namespace command

using Command = std::variant<
    command::ListJobs,
    command::CreateJob,
    command::SelectJob,
    command::SetStatus,
    command::SetStage,
    command::SearchEntries,
    command::ShowAllEntries,
    command::SaveDraft,
    command::SaveAsDebrief>;

/// Short name for logs ("CreateJob", "SaveDraft", ...)
const char* command_name(const Command& cmd);

/**
 * @brief Classifies a finalized utterance into a control command
 *
 * An ordered list of rules, each a pure matcher over the utterance. The first
 * rule that matches wins; no match means the utterance is free diary text.
 * Matching is case-insensitive; captured names and queries keep the
 * speaker's casing.
 */
class CommandInterpreter {
public:
    /// Receives the trimmed utterance; returns a command when the rule applies
    using Matcher = std::function<std::optional<Command>(const std::string& text)>;

    struct Rule {
        std::string name;
        Matcher match;
    };

    /// Installs the built-in rules in priority order
    CommandInterpreter();

    std::optional<Command> classify(const std::string& text) const;

    /**
     * @brief Name of the rule that would classify text (empty when none)
     */
    std::string matching_rule(const std::string& text) const;

    const std::vector<Rule>& rules() const { return rules_; }

private:
    std::vector<Rule> rules_;
};

/// Classify with the built-in rule set
std::optional<Command> classify(const std::string& text);

} // namespace job_diary
