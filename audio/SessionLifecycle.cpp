#include "SessionLifecycle.hpp"

#include "errors.hpp"
#include "frame_scheduler.hpp"
#include "presentation_state.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace micviz::audio {

SessionConfig make_session_config(const AppSettings& settings) {
    SessionConfig cfg;
    cfg.audio.device_name = settings.device_name;
    cfg.audio.sample_rate = static_cast<unsigned int>(settings.sample_rate);
    cfg.audio.period_size = static_cast<unsigned int>(settings.period_size);
    cfg.analyser.size = settings.fft_size;
    cfg.analyser.smoothing = settings.smoothing;
    cfg.reducer.sample_rate = settings.sample_rate;
    cfg.reducer.volume_scale = settings.volume_scale;
    cfg.reducer.band_scale = settings.band_scale;
    cfg.reducer.volume_floor = settings.volume_floor;
    return cfg;
}

SessionLifecycle::SessionLifecycle(PresentationState& state, FrameScheduler& scheduler,
                                   const SessionConfig& config, Backends backends)
    : state_(state),
      config_(config),
      backends_(std::move(backends)),
      reducer_(config.reducer),
      loop_(scheduler, state) {
    state_.reset(reducer_.default_metrics());
}

SessionLifecycle::~SessionLifecycle() {
    stop();
}

bool SessionLifecycle::start() {
    if (session_) return true;

    state_.clear_error();
    std::unique_ptr<AudioSession> session;
    try {
        std::unique_ptr<IAudioInput> input = backends_.make_input(config_.audio);
        if (!input) throw CaptureError("no audio input backend available");
        std::unique_ptr<dsp::ISpectrumAnalyser> analyser = backends_.make_analyser(config_.analyser);
        if (!analyser) throw std::runtime_error("no spectrum analyser available");

        session = std::make_unique<AudioSession>(std::move(input), std::move(analyser));
        if (!session->open()) {
            const std::string reason = session->input_error();
            session.reset();
            abort_start(reason.empty() ? std::string("audio input refused to open") : reason);
            return false;
        }
    } catch (const std::exception& e) {
        session.reset();
        abort_start(e.what());
        return false;
    }

    // A backend that reports no rate gets the configured one, never the last session's
    const AudioConfig& negotiated = session->input()->get_config();
    reducer_.set_sample_rate(config_.reducer.sample_rate);
    if (negotiated.sample_rate > 0) {
        reducer_.set_sample_rate(static_cast<int>(negotiated.sample_rate));
    }
    session_ = std::move(session);
    state_.set_recording(true);
    loop_.start(session_->frames(), reducer_, [this] { stop(); });

    std::cout << "Recording from " << negotiated.device_name << " at " << reducer_.config().sample_rate
              << " Hz, " << config_.analyser.size << " bins" << std::endl;
    return true;
}

void SessionLifecycle::stop() {
    loop_.cancel();
    if (session_) {
        session_->close();
        session_.reset();
        std::cout << "Recording stopped" << std::endl;
    }
    state_.reset(reducer_.default_metrics());
}

bool SessionLifecycle::restart_with_device(const std::string& device_name) {
    const bool was_recording = is_recording();
    stop();
    config_.audio.device_name = device_name;
    return was_recording ? start() : true;
}

IAudioInput::LatencyStats SessionLifecycle::latency_stats() const {
    if (session_ && session_->input()) return session_->input()->get_latency_stats();
    return IAudioInput::LatencyStats{};
}

void SessionLifecycle::abort_start(const std::string& detail) {
    std::cerr << "Could not start audio capture: " << detail << std::endl;
    state_.reset(reducer_.default_metrics());
    state_.publish_error(kAcquisitionErrorMessage);
}

} // namespace micviz::audio
