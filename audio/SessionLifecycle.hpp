#pragma once

#include "AudioSession.hpp"
#include "analysis_loop.hpp"
#include "app_settings.hpp"
#include "audio_input.hpp"
#include "metrics_reducer.hpp"
#include "spectrum_analyser.hpp"

#include <functional>
#include <memory>
#include <string>

namespace micviz {
class FrameScheduler;
class PresentationState;
}

namespace micviz::audio {

struct SessionConfig {
    AudioConfig audio{};
    dsp::AnalyserConfig analyser{};
    dsp::ReducerConfig reducer{};
};

SessionConfig make_session_config(const AppSettings& settings);

// Where sessions get their resources from. Tests swap in fakes.
struct Backends {
    std::function<std::unique_ptr<IAudioInput>(const AudioConfig&)> make_input = createAudioInput;
    std::function<std::unique_ptr<dsp::ISpectrumAnalyser>(const dsp::AnalyserConfig&)> make_analyser =
        dsp::createSpectrumAnalyser;
};

// Owns the one AudioSession and the AnalysisLoop that reads it.
// is_recording() is true exactly while a session with an open input and a
// live analyser exists; start() and stop() are idempotent.
class SessionLifecycle {
public:
    SessionLifecycle(PresentationState& state, FrameScheduler& scheduler,
                     const SessionConfig& config, Backends backends = Backends{});
    ~SessionLifecycle();

    SessionLifecycle(const SessionLifecycle&) = delete;
    SessionLifecycle& operator=(const SessionLifecycle&) = delete;

    // True when recording afterwards. On failure the reason is published
    // to the PresentationState and nothing stays acquired.
    bool start();
    void stop();
    bool is_recording() const { return session_ != nullptr; }

    // Switches capture device, resuming the session if one was running.
    bool restart_with_device(const std::string& device_name);

    const SessionConfig& config() const { return config_; }
    const AnalysisLoop& loop() const { return loop_; }
    const AudioSession* session() const { return session_.get(); }
    // Rate the current (or last) session actually captured at
    int sample_rate() const { return reducer_.config().sample_rate; }
    IAudioInput::LatencyStats latency_stats() const;

private:
    void abort_start(const std::string& detail);

    PresentationState& state_;
    SessionConfig config_;
    Backends backends_;
    dsp::MetricsReducer reducer_;
    std::unique_ptr<AudioSession> session_;
    AnalysisLoop loop_;
};

} // namespace micviz::audio
