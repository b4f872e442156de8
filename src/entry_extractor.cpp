#include "entry_extractor.h"
#include "utils.h"
#include <regex>
#include <vector>

using json = nlohmann::json;

namespace job_diary {

namespace {

const std::regex::flag_type kFlags = std::regex::ECMAScript | std::regex::icase;

/// Appends unless an equal (case-insensitive) value is already present
void add_unique(std::vector<std::string>& out, const std::string& value) {
    std::string v = utils::trim_copy(value);
    if (v.empty()) return;
    std::string key = utils::normalize_copy(v);
    for (const auto& existing : out) {
        if (utils::normalize_copy(existing) == key) return;
    }
    out.push_back(v);
}

/// Every match of re in text; group (0 = whole match) collected into out
void collect(const std::regex& re, const std::string& text, int group,
             std::vector<std::string>& out, bool lowercase = false) {
    for (auto it = std::sregex_iterator(text.begin(), text.end(), re);
         it != std::sregex_iterator(); ++it) {
        const auto& m = *it;
        if (!m[group].matched) continue;
        std::string value = m[group].str();
        add_unique(out, lowercase ? utils::normalize_copy(value) : value);
    }
}

void put_if_any(json& j, const char* key, const std::vector<std::string>& values) {
    if (!values.empty()) j[key] = values;
}

} // namespace

json EntryExtractor::extract(const std::string& transcript) {
    json extracted = json::object();
    if (utils::is_empty_or_whitespace(transcript)) return extracted;

    static const std::regex areas_re(
        "\\b(living room|dining room|kitchen|bedroom|bathroom|hallway|exterior|interior|"
        "trim|ceilings?|walls?|doors?|cabinets?|deck|fence)\\b", kFlags);
    static const std::regex brand_re(
        "\\b(?:Sherwin[- ]Williams|Behr|Benjamin Moore|PPG|Valspar)\\s+([A-Za-z0-9][A-Za-z0-9 -]*[A-Za-z0-9])",
        kFlags);
    static const std::regex color_re(
        "\\b(?:color|colour)\\s+(?:is|was)\\s+([A-Za-z0-9][A-Za-z0-9 -]*[A-Za-z0-9])", kFlags);
    static const std::regex techniques_re(
        "\\b(cut(?:ting)? in|roll(?:ed|ing)|spray(?:ed|ing)|brush(?:ed|ing)|prim(?:ed|ing)|"
        "sand(?:ed|ing)|tap(?:ed|ing)|patch(?:ed|ing)|caulk(?:ed|ing))\\b", kFlags);
    static const std::regex volume_re(
        "\\b(\\d+(?:\\.\\d+)?)\\s+(gallons?|quarts?|liters?|litres?)\\s+(?:of\\s+)?([^.!?,;]+)", kFlags);
    static const std::regex supplies_re(
        "\\b(\\d+)\\s+(brushes|brush|rollers?|trays?|drop cloths?|rolls? of tape)\\b", kFlags);
    static const std::regex tasks_re(
        "\\b(?:completed|finished|done with)\\s+([^.!?]+)", kFlags);
    static const std::regex next_re(
        "\\b(?:need to|needs to|will|should|tomorrow|next week)\\s+([^.!?]+)", kFlags);
    static const std::regex issue_words_re(
        "\\b(bleed[- ]through|peeling|cracking|blistering|water damage|mildew)\\b", kFlags);
    static const std::regex issue_fix_re(
        "\\b(?:must|should|need to|needs to)\\s+(?:fix|repair|touch up|re-?prime|re-?sand)\\s+([^.!?]+)", kFlags);

    std::vector<std::string> areas;
    collect(areas_re, transcript, 1, areas, true);
    put_if_any(extracted, "areas_painted", areas);

    std::vector<std::string> colors;
    collect(brand_re, transcript, 1, colors);
    collect(color_re, transcript, 1, colors);
    put_if_any(extracted, "colors", colors);

    std::vector<std::string> techniques;
    collect(techniques_re, transcript, 1, techniques, true);
    put_if_any(extracted, "techniques", techniques);

    json materials = json::object();
    for (auto it = std::sregex_iterator(transcript.begin(), transcript.end(), volume_re);
         it != std::sregex_iterator(); ++it) {
        std::string item = utils::trim_copy((*it)[3].str());
        if (!item.empty()) {
            materials[item] = (*it)[1].str() + " " + utils::normalize_copy((*it)[2].str());
        }
    }
    for (auto it = std::sregex_iterator(transcript.begin(), transcript.end(), supplies_re);
         it != std::sregex_iterator(); ++it) {
        materials[utils::normalize_copy((*it)[2].str())] = (*it)[1].str();
    }
    if (!materials.empty()) extracted["materials"] = materials;

    std::vector<std::string> tasks;
    collect(tasks_re, transcript, 1, tasks);
    put_if_any(extracted, "tasks_completed", tasks);

    std::vector<std::string> next_actions;
    collect(next_re, transcript, 1, next_actions);
    put_if_any(extracted, "next_actions", next_actions);

    std::vector<std::string> issues;
    collect(issue_words_re, transcript, 1, issues, true);
    collect(issue_fix_re, transcript, 1, issues);
    put_if_any(extracted, "issues", issues);

    return extracted;
}

std::optional<std::string> EntryExtractor::extract_job_name(const std::string& transcript) {
    static const std::regex named_re(
        "\\b(?:job|project|site)\\s+(?:at|for|called)\\s+([^.!?,]+)", kFlags);
    static const std::regex working_re(
        "\\b(?:working on|doing)\\s+([^.!?,]+)", kFlags);

    std::smatch m;
    for (const std::regex* re : {&named_re, &working_re}) {
        if (std::regex_search(transcript, m, *re)) {
            std::string name = utils::trim_copy(m[1].str());
            if (!name.empty()) return name;
        }
    }
    return std::nullopt;
}

std::string EntryExtractor::summarize(const std::string& transcript, size_t max_chars) {
    std::string text = utils::trim_copy(transcript);
    size_t end = text.find_first_of(".!?");
    if (end != std::string::npos) text = text.substr(0, end + 1);
    if (text.size() <= max_chars) return text;

    size_t cut = text.rfind(' ', max_chars);
    if (cut == std::string::npos || cut == 0) cut = max_chars;
    return utils::trim_copy(text.substr(0, cut)) + "...";
}

} // namespace job_diary
