/**
 * Event loop and task runner: ordering, timers on a manual clock,
 * cancellation, and worker results marshalled back through post().
 *
 * Run from build dir: ./test_event_loop
 */

#include "event_loop.h"
#include "fakes.h"
#include "task_runner.h"
#include <atomic>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace job_diary;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    // --- Posted tasks run in order ---
    {
        EventLoop loop;
        std::vector<int> order;
        loop.post([&] { order.push_back(1); });
        loop.post([&] { order.push_back(2); loop.post([&] { order.push_back(4); }); });
        loop.post([&] { order.push_back(3); });
        size_t ran = loop.run_until_idle();
        ASSERT(ran == 4);
        ASSERT((order == std::vector<int>{1, 2, 3, 4}));
    }

    // --- Timers fire only once their deadline passes on the loop clock ---
    {
        testing::ManualClock clock;
        EventLoop loop(clock.fn());
        std::vector<std::string> fired;
        loop.post_delayed(100, [&] { fired.push_back("b"); });
        loop.post_delayed(50, [&] { fired.push_back("a"); });
        auto cancelled = loop.post_delayed(75, [&] { fired.push_back("x"); });
        ASSERT(loop.pending_timers() == 3);

        loop.run_until_idle();
        ASSERT(fired.empty());

        clock.advance(60);
        loop.run_until_idle();
        ASSERT((fired == std::vector<std::string>{"a"}));

        loop.cancel(cancelled);
        loop.cancel(cancelled);  // second cancel is ignored
        loop.cancel(9999);
        clock.advance(60);
        loop.run_until_idle();
        ASSERT((fired == std::vector<std::string>{"a", "b"}));
        ASSERT(loop.pending_timers() == 0);
    }

    // --- A throwing task does not stop the loop ---
    {
        EventLoop loop;
        bool after = false;
        loop.post([] { throw std::runtime_error("boom"); });
        loop.post([&] { after = true; });
        loop.run_until_idle();
        ASSERT(after);
    }

    // --- run() returns after stop() from inside a task ---
    {
        EventLoop loop;
        int count = 0;
        loop.post([&] { count++; });
        loop.post([&] { count++; loop.stop(); });
        loop.run();
        ASSERT(count == 2);
    }

    // --- Worker results come back through the loop ---
    {
        EventLoop loop;
        TaskRunner runner(2);
        std::atomic<int> worker_side{0};
        std::vector<int> loop_side;
        for (int i = 0; i < 5; ++i) {
            bool queued = runner.submit([&, i] {
                worker_side++;
                loop.post([&, i] { loop_side.push_back(i); });
            });
            ASSERT(queued);
        }
        ASSERT(runner.wait_for_completion(5000));
        ASSERT(worker_side == 5);
        ASSERT(loop_side.empty());  // nothing ran until the loop was driven
        loop.run_until_idle();
        ASSERT(loop_side.size() == 5);

        runner.shutdown();
        ASSERT(!runner.submit([] {}));
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All event loop tests passed.\n";
    return 0;
}
