#include "command_interpreter.h"
#include "utils.h"
#include <algorithm>
#include <regex>
#include <unordered_map>

namespace job_diary {

namespace {

std::regex icase(const char* pattern) {
    return std::regex(pattern, std::regex::ECMAScript | std::regex::icase);
}

/// Strip surrounding quotes and whitespace from a captured name or query
std::string clean_capture(const std::string& raw) {
    std::string s = utils::trim_copy(raw);
    while (s.size() >= 2 &&
           ((s.front() == '"' && s.back() == '"') || (s.front() == '\'' && s.back() == '\''))) {
        s = utils::trim_copy(s.substr(1, s.size() - 2));
    }
    return s;
}

struct Capture {
    std::string text;
    size_t position = 0;
};

/// First pattern matching the whole (punctuation-stripped) utterance; group 1 if present
std::optional<Capture> match_any(const std::vector<std::regex>& patterns, const std::string& text) {
    std::string stripped = utils::strip_utterance(text);
    std::smatch m;
    for (const auto& re : patterns) {
        if (std::regex_match(stripped, m, re)) {
            Capture c;
            if (m.size() > 1 && m[1].matched) {
                c.text = m[1].str();
                c.position = static_cast<size_t>(m.position(1));
            } else {
                c.position = stripped.size();
            }
            return c;
        }
    }
    return std::nullopt;
}

} // namespace

const char* job_status_name(JobStatus status) {
    switch (status) {
        case JobStatus::Quoted: return "quoted";
        case JobStatus::InProgress: return "in_progress";
        case JobStatus::Complete: return "complete";
        case JobStatus::OnHold: return "on_hold";
    }
    return "quoted";
}

std::optional<JobStatus> parse_job_status(const std::string& text) {
    static const std::unordered_map<std::string, JobStatus> synonyms = {
        {"complete", JobStatus::Complete},
        {"completed", JobStatus::Complete},
        {"done", JobStatus::Complete},
        {"finished", JobStatus::Complete},
        {"all done", JobStatus::Complete},
        {"in progress", JobStatus::InProgress},
        {"started", JobStatus::InProgress},
        {"underway", JobStatus::InProgress},
        {"under way", JobStatus::InProgress},
        {"ongoing", JobStatus::InProgress},
        {"on hold", JobStatus::OnHold},
        {"paused", JobStatus::OnHold},
        {"quoted", JobStatus::Quoted},
    };

    std::string s = utils::normalize_copy(utils::strip_utterance(text));
    std::replace(s.begin(), s.end(), '_', ' ');
    std::replace(s.begin(), s.end(), '-', ' ');
    for (const char* prefix : {"as ", "to ", "is "}) {
        if (s.rfind(prefix, 0) == 0) {
            s = utils::trim_copy(s.substr(3));
        }
    }
    auto it = synonyms.find(s);
    if (it == synonyms.end()) return std::nullopt;
    return it->second;
}

const char* command_name(const Command& cmd) {
    static const char* names[] = {
        "ListJobs", "CreateJob", "SelectJob", "SetStatus", "SetStage",
        "SearchEntries", "ShowAllEntries", "SaveDraft", "SaveAsDebrief"
    };
    return names[cmd.index()];
}

CommandInterpreter::CommandInterpreter() {
    // 1. list / show jobs
    std::vector<std::regex> list_jobs = {
        icase("^(?:list|show|display)(?: me)?(?: all)?(?: of)?(?: my| the)? jobs$"),
        icase("^(?:what|which) jobs(?: do i have| are there)?$"),
        icase("^what are my jobs$"),
        icase("^(?:my )?jobs(?: list)?$"),
    };
    rules_.push_back({"list_jobs", [list_jobs](const std::string& text) -> std::optional<Command> {
        if (match_any(list_jobs, text)) return Command(command::ListJobs{});
        return std::nullopt;
    }});

    // 2. create / start job named X
    std::vector<std::regex> create_job = {
        icase("^(?:create|start|new|add|make)(?: a)?(?: new)? (?:job|project)(?: called| named| for)?[\\s:]+(.+)$"),
    };
    rules_.push_back({"create_job", [create_job](const std::string& text) -> std::optional<Command> {
        auto c = match_any(create_job, text);
        if (!c) return std::nullopt;
        std::string name = clean_capture(c->text);
        if (name.empty()) return std::nullopt;
        return Command(command::CreateJob{name});
    }});

    // 3. switch / select job matching query
    std::vector<std::regex> select_job = {
        icase("^(?:switch|change|select|open|go|use)(?: over)?(?: to)?(?: the)? (?:job|project)(?: to)?[\\s:]+(.+)$"),
        icase("^(?:switch|change|go)(?: over)? to(?: the)? (.+?) (?:job|project)$"),
        icase("^(?:select|open)(?: the)? (.+?) (?:job|project)$"),
    };
    rules_.push_back({"select_job", [select_job](const std::string& text) -> std::optional<Command> {
        auto c = match_any(select_job, text);
        if (!c) return std::nullopt;
        std::string query = clean_capture(c->text);
        if (query.empty()) return std::nullopt;
        return Command(command::SelectJob{query});
    }});

    // 4. mark job status (synonym tolerant)
    std::vector<std::regex> set_status = {
        icase("^(?:mark|set|flag|put)(?: the)?(?: this)?(?: job| project)?(?: status)?(?: as| to)? (.+)$"),
        icase("^(?:the |this )?(?:job|project)(?: status)?(?: is)?(?: now)? (.+)$"),
    };
    rules_.push_back({"set_status", [set_status](const std::string& text) -> std::optional<Command> {
        auto c = match_any(set_status, text);
        if (!c) return std::nullopt;
        auto status = parse_job_status(c->text);
        if (!status) return std::nullopt;
        return Command(command::SetStatus{*status});
    }});

    // 5. search entries for query
    std::vector<std::regex> search = {
        icase("^(?:search|find|look up|lookup|look through)(?: my| the)? (?:entries|notes|diary)(?: for| about| with| mentioning)? (.+)$"),
        icase("^search(?: for| about) (.+)$"),
    };
    rules_.push_back({"search_entries", [search](const std::string& text) -> std::optional<Command> {
        auto c = match_any(search, text);
        if (!c) return std::nullopt;
        std::string query = clean_capture(c->text);
        if (query.empty()) return std::nullopt;
        return Command(command::SearchEntries{query});
    }});

    // 6. show / list all entries (leaves a search view)
    std::vector<std::regex> show_all = {
        icase("^(?:show|list|display)(?: me)?(?: all)?(?: of)?(?: the| my)? entries$"),
        icase("^(?:show all|all entries|clear search|exit search|back to all entries)$"),
    };
    rules_.push_back({"show_all_entries", [show_all](const std::string& text) -> std::optional<Command> {
        if (match_any(show_all, text)) return Command(command::ShowAllEntries{});
        return std::nullopt;
    }});

    // 7. set job stage
    std::vector<std::regex> set_stage = {
        icase("^(?:set|change|update|move)(?: the)?(?: job| project)? stage(?: to| as)?[\\s:]+(.+)$"),
        icase("^(?:the )?stage(?: is)?(?: now)?[\\s:]+(.+)$"),
        icase("^move(?: the)?(?: job| project)? to(?: the)? (.+?) stage$"),
    };
    rules_.push_back({"set_stage", [set_stage](const std::string& text) -> std::optional<Command> {
        auto c = match_any(set_stage, text);
        if (!c) return std::nullopt;
        std::string stage = clean_capture(c->text);
        if (stage.empty()) return std::nullopt;
        return Command(command::SetStage{stage});
    }});

    // 8. save as debrief; trailing content becomes the debrief text
    std::vector<std::regex> debrief = {
        icase("^(?:save(?: this| it)?(?: as)?|record|log|add)(?: a)? debrief(?:[\\s:,-]+(.*))?$"),
    };
    rules_.push_back({"save_as_debrief", [debrief](const std::string& text) -> std::optional<Command> {
        auto c = match_any(debrief, text);
        if (!c) return std::nullopt;
        // The stripped utterance is a prefix of the trimmed one: keep the
        // speaker's closing punctuation in the debrief body.
        std::string trimmed = utils::trim_copy(text);
        std::string body = c->text.empty() ? "" : utils::trim_copy(trimmed.substr(c->position));
        return Command(command::SaveAsDebrief{body});
    }});

    // 9. save / save it / save now / save entry / save this
    std::vector<std::regex> save = {
        icase("^save(?: it| now| entry| this| the entry| this entry| the draft| draft)?(?: now)?$"),
        icase("^(?:submit|save and submit)(?: it| entry| this| the entry)?$"),
    };
    rules_.push_back({"save_draft", [save](const std::string& text) -> std::optional<Command> {
        if (match_any(save, text)) return Command(command::SaveDraft{});
        return std::nullopt;
    }});
}

std::optional<Command> CommandInterpreter::classify(const std::string& text) const {
    if (utils::is_empty_or_whitespace(text)) return std::nullopt;
    std::string trimmed = utils::trim_copy(text);
    for (const auto& rule : rules_) {
        auto cmd = rule.match(trimmed);
        if (cmd) return cmd;
    }
    return std::nullopt;
}

std::string CommandInterpreter::matching_rule(const std::string& text) const {
    if (utils::is_empty_or_whitespace(text)) return "";
    std::string trimmed = utils::trim_copy(text);
    for (const auto& rule : rules_) {
        if (rule.match(trimmed)) return rule.name;
    }
    return "";
}

std::optional<Command> classify(const std::string& text) {
    static const CommandInterpreter interpreter;
    return interpreter.classify(text);
}

} // namespace job_diary
