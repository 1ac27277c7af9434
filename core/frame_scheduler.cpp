#include "frame_scheduler.hpp"

#include <utility>

namespace micviz {

FrameScheduler::Handle FrameScheduler::request(Callback cb) {
    const Handle h = next_handle_++;
    pending_.emplace(h, std::move(cb));
    return h;
}

void FrameScheduler::cancel(Handle handle) {
    if (handle == 0) return;
    pending_.erase(handle);
}

int FrameScheduler::run_pending() {
    ++frames_dispatched_;
    const Handle limit = next_handle_;
    int ran = 0;
    // Re-look up the front entry each time: a callback may cancel others.
    while (!pending_.empty() && pending_.begin()->first < limit) {
        auto it = pending_.begin();
        Callback cb = std::move(it->second);
        pending_.erase(it);
        if (cb) cb();
        ++ran;
    }
    return ran;
}

} // namespace micviz
