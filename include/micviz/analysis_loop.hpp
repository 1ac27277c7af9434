#pragma once

#include "frame_scheduler.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace micviz {

namespace audio { class SpectralFrameSource; }
namespace dsp { class MetricsReducer; }
class PresentationState;

// Self-rescheduling poll -> reduce -> publish cycle, one cycle per displayed
// frame.
//
//   Idle --start--> Running --cancel--> Idle
//                   Running --cycle throws--> Cancelling --stop handler--> Idle
//
// The loop never holds the session's resources; on a failed cycle it asks
// its owner to stop the session through the stop handler, then publishes a
// user-facing error.
class AnalysisLoop {
public:
    enum class State { Idle, Running, Cancelling };
    using StopHandler = std::function<void()>;

    AnalysisLoop(FrameScheduler& scheduler, PresentationState& state);
    ~AnalysisLoop();

    AnalysisLoop(const AnalysisLoop&) = delete;
    AnalysisLoop& operator=(const AnalysisLoop&) = delete;

    // Ignored unless Idle. source and reducer must outlive the run.
    // on_failure releases the session; it must not restart the loop.
    void start(audio::SpectralFrameSource& source, const dsp::MetricsReducer& reducer, StopHandler on_failure);
    // Drops the pending cycle; safe in any state, including from inside a cycle.
    void cancel();

    State state() const { return state_; }
    bool is_running() const { return state_ == State::Running; }

    std::uint64_t cycles_run() const { return cycles_run_; }
    std::uint64_t frames_published() const { return frames_published_; }

private:
    void schedule_next();
    void run_cycle();
    void fail(const char* kind, const std::string& detail);

    FrameScheduler& scheduler_;
    PresentationState& state_out_;
    audio::SpectralFrameSource* source_ = nullptr;
    const dsp::MetricsReducer* reducer_ = nullptr;
    StopHandler on_failure_;

    State state_ = State::Idle;
    FrameScheduler::Handle pending_ = 0;
    std::uint64_t cycles_run_ = 0;
    std::uint64_t frames_published_ = 0;
};

const char* to_string(AnalysisLoop::State s);

} // namespace micviz
