#include "frame_scheduler.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace micviz;

static int g_failures = 0;

static void check(bool ok, const char* what) {
    std::cout << (ok ? "  ok    " : "  FAIL  ") << what << std::endl;
    if (!ok) ++g_failures;
}

int main() {
    std::cout << "FrameScheduler tests" << std::endl;

    {
        std::cout << "ordering" << std::endl;
        FrameScheduler s;
        std::vector<int> order;
        s.request([&] { order.push_back(1); });
        s.request([&] { order.push_back(2); });
        s.request([&] { order.push_back(3); });
        check(s.pending_count() == 3, "three pending");
        check(s.run_pending() == 3, "all three run on the next frame");
        check(order == std::vector<int>({1, 2, 3}), "in request order");
        check(!s.has_pending(), "nothing left");
        check(s.run_pending() == 0, "empty frame runs nothing");
        check(s.frames_dispatched() == 2, "frames counted");
    }

    {
        std::cout << "requests made during a frame wait for the next one" << std::endl;
        FrameScheduler s;
        int runs = 0;
        std::function<void()> again = [&] { ++runs; s.request(again); };
        s.request(again);
        s.run_pending();
        check(runs == 1, "one run per frame");
        s.run_pending();
        s.run_pending();
        check(runs == 3, "self-rescheduling callback runs once per frame");
        check(s.pending_count() == 1, "exactly one follow-up queued");
    }

    {
        std::cout << "cancellation" << std::endl;
        FrameScheduler s;
        bool ran = false;
        auto h = s.request([&] { ran = true; });
        check(h != 0, "handles are non-zero");
        s.cancel(h);
        s.run_pending();
        check(!ran, "cancelled callback never runs");
        s.cancel(h);
        s.cancel(0);
        s.cancel(9999);
        check(true, "double, zero and unknown cancel are no-ops");
    }

    {
        std::cout << "cancel from inside a frame" << std::endl;
        FrameScheduler s;
        bool second_ran = false;
        FrameScheduler::Handle second = 0;
        s.request([&] { s.cancel(second); });
        second = s.request([&] { second_ran = true; });
        s.run_pending();
        check(!second_ran, "a callback already queued for this frame can still be cancelled");
    }

    {
        std::cout << "handle after firing" << std::endl;
        FrameScheduler s;
        int runs = 0;
        auto h = s.request([&] { ++runs; });
        s.run_pending();
        auto h2 = s.request([&] { ++runs; });
        s.cancel(h);
        s.run_pending();
        check(runs == 2, "cancelling a fired handle leaves newer requests alone");
        check(h2 != h, "handles are never reused");
    }

    if (g_failures) {
        std::cout << g_failures << " check(s) FAILED" << std::endl;
        return 1;
    }
    std::cout << "All checks passed" << std::endl;
    return 0;
}
