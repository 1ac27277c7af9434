#pragma once

#include <cstdint>
#include <functional>
#include <map>

namespace micviz {

// Redraw-synchronized callback queue. The render loop calls run_pending()
// once per displayed frame; everything requested before that call runs in
// request order, everything requested while it runs waits for the next frame.
class FrameScheduler {
public:
    using Callback = std::function<void()>;
    using Handle = std::uint64_t;  // 0 is never issued

    Handle request(Callback cb);
    // No-op for 0, unknown or already-fired handles.
    void cancel(Handle handle);

    // Returns the number of callbacks run.
    int run_pending();

    bool has_pending() const { return !pending_.empty(); }
    std::size_t pending_count() const { return pending_.size(); }
    std::uint64_t frames_dispatched() const { return frames_dispatched_; }

private:
    std::map<Handle, Callback> pending_;
    Handle next_handle_ = 1;
    std::uint64_t frames_dispatched_ = 0;
};

} // namespace micviz
