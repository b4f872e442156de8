/**
 * Entry extraction: painter fields pulled from a transcript, job name
 * detection for implicit jobs, and summary truncation.
 *
 * Run from build dir: ./test_entry_extractor
 */

#include "entry_extractor.h"
#include <iostream>
#include <string>

using namespace job_diary;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    // --- Short entry ---
    {
        json j = EntryExtractor::extract("Finished cabinets today.");
        ASSERT(j.is_object());
        ASSERT(j.contains("areas_painted") && j["areas_painted"][0] == "cabinets");
        ASSERT(j.contains("tasks_completed") && j["tasks_completed"][0] == "cabinets today");
        ASSERT(!j.contains("colors"));
        ASSERT(!j.contains("materials"));
    }

    // --- Fuller entry ---
    {
        json j = EntryExtractor::extract(
            "Primed the kitchen walls with 2 gallons of Sherwin-Williams Agreeable Gray. "
            "Need to fix peeling on the deck.");
        ASSERT(j["areas_painted"].size() == 3);
        ASSERT(j["areas_painted"][0] == "kitchen");
        ASSERT(j["colors"][0] == "Agreeable Gray");
        ASSERT(j["techniques"][0] == "primed");
        ASSERT(j["materials"].contains("Sherwin-Williams Agreeable Gray"));
        ASSERT(j["materials"]["Sherwin-Williams Agreeable Gray"] == "2 gallons");
        ASSERT(j["next_actions"][0] == "fix peeling on the deck");
        ASSERT(j["issues"][0] == "peeling");
    }

    // --- Duplicates collapse ---
    {
        json j = EntryExtractor::extract("Walls done. Then more walls. WALLS again.");
        ASSERT(j["areas_painted"].size() == 1);
    }

    // --- Nothing to find ---
    ASSERT(EntryExtractor::extract("").empty());
    ASSERT(EntryExtractor::extract("Quiet morning.").empty());

    // --- Job names ---
    ASSERT(EntryExtractor::extract_job_name("Started the job at 12 Oak Street, prepping walls.") ==
           std::string("12 Oak Street"));
    ASSERT(EntryExtractor::extract_job_name("Working on the Smith house today.") ==
           std::string("the Smith house today"));
    ASSERT(!EntryExtractor::extract_job_name("Finished cabinets today."));

    // --- Summary ---
    ASSERT(EntryExtractor::summarize("Finished cabinets today. Need more primer.") ==
           "Finished cabinets today.");
    ASSERT(EntryExtractor::summarize("  short  ") == "short");
    ASSERT(EntryExtractor::summarize("alpha beta gamma delta epsilon", 12) == "alpha beta...");

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All entry extractor tests passed.\n";
    return 0;
}
