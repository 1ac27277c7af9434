#pragma once

#include "metrics.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace micviz {

// Latest metrics, recording flag and last error for the UI. Written by the
// session and analysis loop, read by views. Single-threaded: all access
// happens on the thread that services the FrameScheduler.
class PresentationState {
public:
    void publish(const Metrics& metrics);
    // Also forces is_recording() to false.
    void publish_error(const std::string& message);
    // Default metrics and not recording. The last error is kept so a failure
    // stays visible after the session that produced it is torn down.
    void reset(const Metrics& defaults = Metrics{});

    void set_recording(bool recording);
    void clear_error();

    const Metrics& metrics() const { return metrics_; }
    bool is_recording() const { return recording_; }
    const std::optional<std::string>& last_error() const { return last_error_; }
    std::string error_text() const { return last_error_ ? *last_error_ : std::string(); }

    // Bumped on every change; observers compare against the value they last saw.
    std::uint64_t revision() const { return revision_; }

private:
    Metrics metrics_{};
    bool recording_ = false;
    std::optional<std::string> last_error_;
    std::uint64_t revision_ = 0;
};

} // namespace micviz
