#include "analysis_loop.hpp"

#include "SpectralFrameSource.hpp"
#include "errors.hpp"
#include "metrics_reducer.hpp"
#include "presentation_state.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace micviz {

AnalysisLoop::AnalysisLoop(FrameScheduler& scheduler, PresentationState& state)
    : scheduler_(scheduler), state_out_(state) {}

AnalysisLoop::~AnalysisLoop() {
    cancel();
}

void AnalysisLoop::start(audio::SpectralFrameSource& source, const dsp::MetricsReducer& reducer, StopHandler on_failure) {
    if (state_ != State::Idle) return;
    source_ = &source;
    reducer_ = &reducer;
    on_failure_ = std::move(on_failure);
    state_ = State::Running;
    schedule_next();
}

void AnalysisLoop::cancel() {
    scheduler_.cancel(pending_);
    pending_ = 0;
    source_ = nullptr;
    reducer_ = nullptr;
    state_ = State::Idle;
}

void AnalysisLoop::schedule_next() {
    pending_ = scheduler_.request([this] { run_cycle(); });
}

void AnalysisLoop::run_cycle() {
    pending_ = 0;
    if (state_ != State::Running || !source_ || !reducer_) return;
    ++cycles_run_;

    try {
        const SpectralFrame frame = source_->poll();
        if (auto metrics = reducer_->reduce(frame)) {
            state_out_.publish(*metrics);
            ++frames_published_;
        }
    } catch (const NotOpenError& e) {
        fail("contract violation", e.what());
        return;
    } catch (const std::exception& e) {
        fail("analysis error", e.what());
        return;
    } catch (...) {
        fail("analysis error", "unknown exception");
        return;
    }

    // The publish above may have fed an observer that cancelled us
    if (state_ == State::Running) schedule_next();
}

void AnalysisLoop::fail(const char* kind, const std::string& detail) {
    std::cerr << "Analysis loop stopped (" << kind << "): " << detail << std::endl;
    state_ = State::Cancelling;
    if (on_failure_) {
        on_failure_();
    } else if (reducer_) {
        state_out_.reset(reducer_->default_metrics());
    }
    cancel();
    state_out_.publish_error(kAnalysisErrorMessage);
}

const char* to_string(AnalysisLoop::State s) {
    switch (s) {
        case AnalysisLoop::State::Idle: return "idle";
        case AnalysisLoop::State::Running: return "running";
        case AnalysisLoop::State::Cancelling: return "cancelling";
    }
    return "?";
}

} // namespace micviz
