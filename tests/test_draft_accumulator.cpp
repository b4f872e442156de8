/**
 * Draft accumulator: ordering and joining, checkpoint on append, restore
 * within the staleness window, clear, and partial consume after a freeze.
 *
 * Run from build dir: ./test_draft_accumulator
 * Writes under the system temp directory.
 */

#include "draft_accumulator.h"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>

using namespace job_diary;
namespace fs = std::filesystem;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    fs::path dir = fs::temp_directory_path() / ("jobdiary_draft_test_" + std::to_string(getpid()));
    fs::remove_all(dir);
    std::string path = (dir / "nested" / "draft.json").string();

    WallClock::time_point now = WallClock::now();
    auto clock = [&now] { return now; };

    // --- Append order, blank fragments ignored, single-space join ---
    {
        DraftAccumulator draft(path, std::chrono::hours(24), clock);
        ASSERT(draft.empty());
        draft.append("Finished cabinets today.");
        draft.append("   ");
        draft.append("  Need more primer  ");
        ASSERT(draft.fragment_count() == 2);
        ASSERT(draft.current_text() == "Finished cabinets today. Need more primer");
        ASSERT(fs::exists(path));  // parent directories created on first checkpoint
        ASSERT(!fs::exists(path + ".tmp"));
    }

    // --- Restore in a new instance (new session) ---
    {
        DraftAccumulator draft(path, std::chrono::hours(24), clock);
        auto restored = draft.restore();
        ASSERT(restored.has_value());
        ASSERT(restored && *restored == "Finished cabinets today. Need more primer");
        ASSERT(draft.fragment_count() == 2);
    }

    // --- Stale checkpoint is not restored ---
    {
        now += std::chrono::hours(25);
        DraftAccumulator draft(path, std::chrono::hours(24), clock);
        ASSERT(!draft.restore().has_value());
        ASSERT(draft.empty());
        now -= std::chrono::hours(25);
    }

    // --- A checkpoint stamped after "now" (clock went backwards) is not restored ---
    {
        now -= std::chrono::hours(2);
        DraftAccumulator draft(path, std::chrono::hours(24), clock);
        ASSERT(!draft.restore().has_value());
        ASSERT(draft.empty());
        now += std::chrono::hours(2);
    }

    // --- Epoch moves on restore and clear, not on append or consume ---
    {
        DraftAccumulator draft(path, std::chrono::hours(24), clock);
        uint64_t start = draft.epoch();
        ASSERT(draft.restore().has_value());
        ASSERT(draft.epoch() == start + 1);
        draft.append("more");
        draft.consume(1);
        ASSERT(draft.epoch() == start + 1);
        ASSERT(draft.current_text() == "Need more primer more");
    }

    // --- clear() removes the checkpoint; restore() then finds nothing ---
    {
        DraftAccumulator draft(path, std::chrono::hours(24), clock);
        ASSERT(draft.restore().has_value());
        draft.clear();
        ASSERT(draft.empty());
        ASSERT(!fs::exists(path));
        ASSERT(!draft.restore().has_value());
    }

    // --- consume(n) keeps fragments appended after the freeze ---
    {
        DraftAccumulator draft(path, std::chrono::hours(24), clock);
        draft.append("one");
        draft.append("two");
        size_t frozen = draft.fragment_count();
        draft.append("three");
        draft.consume(frozen);
        ASSERT(draft.current_text() == "three");

        DraftAccumulator reloaded(path, std::chrono::hours(24), clock);
        auto restored = reloaded.restore();
        ASSERT(restored && *restored == "three");

        draft.consume(5);
        ASSERT(draft.empty());
        ASSERT(!fs::exists(path));
    }

    // --- A checkpoint holding only "text" still restores ---
    {
        fs::create_directories(fs::path(path).parent_path());
        auto ts = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count();
        std::ofstream(path) << "{\"text\":\"legacy draft\",\"timestamp_ms\":" << ts << "}";
        DraftAccumulator draft(path, std::chrono::hours(24), clock);
        auto restored = draft.restore();
        ASSERT(restored && *restored == "legacy draft");
    }

    // --- Malformed checkpoint is ignored ---
    {
        std::ofstream(path) << "{not json";
        DraftAccumulator draft(path, std::chrono::hours(24), clock);
        ASSERT(!draft.restore().has_value());
    }

    // --- Empty path keeps the draft in memory only ---
    {
        DraftAccumulator draft("", std::chrono::hours(24), clock);
        draft.append("memory only");
        ASSERT(draft.checkpoint().is_ok());
        ASSERT(!draft.restore().has_value());
        ASSERT(draft.current_text() == "memory only");
    }

    fs::remove_all(dir);

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All draft accumulator tests passed.\n";
    return 0;
}
