#pragma once

#include "metrics.hpp"

#include <optional>

namespace micviz::dsp {

// Calibration of the display metrics. The scale factors are presentation
// tuning, not physical units.
struct ReducerConfig {
    int sample_rate = 44100;
    float volume_scale = 1000.0f;  // mean |magnitude| -> volume units
    float band_scale = 500.0f;     // mean |magnitude| in a band -> percent
    int volume_floor = 0;          // lowest volume ever reported
};

// Reduces one spectral frame to frequency / volume / band metrics.
// Stateless and total: never throws, whatever the frame holds.
class MetricsReducer {
public:
    MetricsReducer() = default;
    explicit MetricsReducer(const ReducerConfig& config) : config_(config) {}

    // std::nullopt means "no update": the frame was empty and the caller
    // keeps whatever it published last.
    std::optional<Metrics> reduce(const SpectralFrame& frame) const;

    // What the display shows while nothing is recording.
    Metrics default_metrics() const;

    const ReducerConfig& config() const { return config_; }
    void set_sample_rate(int hz) { config_.sample_rate = hz; }

private:
    ReducerConfig config_{};
};

} // namespace micviz::dsp
