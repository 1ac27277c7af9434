#include "spectrum_analyser.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace micviz::dsp {

static int checked_window_len(const AnalyserConfig& cfg) {
    if (cfg.size < 16 || cfg.size > 16384 || !fft::is_power_of_two(cfg.size)) {
        throw std::invalid_argument("analyser size must be a power of two in [16, 16384], got "
                                    + std::to_string(cfg.size));
    }
    if (!(cfg.smoothing >= 0.0f && cfg.smoothing < 1.0f)) {
        throw std::invalid_argument("analyser smoothing must be in [0, 1)");
    }
    return cfg.size * 2;
}

FftSpectrumAnalyser::FftSpectrumAnalyser(const AnalyserConfig& config)
    : config_(config),
      window_len_(checked_window_len(config)),
      plan_(window_len_),
      window_(fft::hann_window(window_len_)),
      ring_(window_len_, 0.0f),
      snapshot_(window_len_, 0.0f),
      bins_(window_len_),
      smoothed_(config.size, 0.0f) {}

void FftSpectrumAnalyser::push_samples(const float* input, int num_samples) {
    if (!input || num_samples <= 0) return;
    std::lock_guard<std::mutex> lock(ring_mutex_);
    for (int i = 0; i < num_samples; ++i) {
        ring_[write_pos_] = input[i];
        write_pos_ = (write_pos_ + 1) % window_len_;
    }
    filled_ = std::min(window_len_, filled_ + num_samples);
}

SpectralFrame FftSpectrumAnalyser::get_value() {
    {
        std::lock_guard<std::mutex> lock(ring_mutex_);
        if (filled_ < window_len_) return SpectralFrame{};
        // Oldest sample sits at write_pos_
        for (int i = 0; i < window_len_; ++i) {
            snapshot_[i] = ring_[(write_pos_ + i) % window_len_];
        }
    }

    for (int i = 0; i < window_len_; ++i) {
        bins_[i] = std::complex<float>(snapshot_[i] * window_[i], 0.0f);
    }
    plan_.forward(bins_);

    // Hann coherent gain is 1/2, single-sided spectrum doubles: a sine of
    // amplitude A reads ~A in its bin.
    const float scale = 4.0f / static_cast<float>(window_len_);
    const float s = config_.smoothing;
    for (int k = 0; k < config_.size; ++k) {
        const float mag = std::abs(bins_[k]) * scale;
        smoothed_[k] = has_history_ ? s * smoothed_[k] + (1.0f - s) * mag : mag;
    }
    has_history_ = true;
    return smoothed_;
}

std::unique_ptr<ISpectrumAnalyser> createSpectrumAnalyser(const AnalyserConfig& config) {
    return std::make_unique<FftSpectrumAnalyser>(config);
}

} // namespace micviz::dsp
