#pragma once

#include "metrics.hpp"
#include "fft/fft_utils.hpp"

#include <complex>
#include <memory>
#include <mutex>
#include <vector>

namespace micviz::dsp {

struct AnalyserConfig {
    int size = 2048;          // output bins; the transform runs over 2*size samples
    float smoothing = 0.8f;   // 0 = none, must stay below 1
};

// Spectral transform fed by the capture callback. push_samples() may run on
// the capture thread while get_value() runs on the analysis thread.
class ISpectrumAnalyser {
public:
    virtual ~ISpectrumAnalyser() = default;

    virtual int size() const = 0;
    virtual void push_samples(const float* input, int num_samples) = 0;
    // Latest magnitude spectrum, size() bins. Empty until enough audio arrived.
    virtual SpectralFrame get_value() = 0;
};

class FftSpectrumAnalyser : public ISpectrumAnalyser {
public:
    // Throws std::invalid_argument for a size that is not a power of two
    // in [16, 16384] or a smoothing outside [0, 1).
    explicit FftSpectrumAnalyser(const AnalyserConfig& config);

    int size() const override { return config_.size; }
    void push_samples(const float* input, int num_samples) override;
    SpectralFrame get_value() override;

private:
    AnalyserConfig config_;
    int window_len_;
    fft::FftPlan plan_;
    std::vector<float> window_;

    std::mutex ring_mutex_;
    std::vector<float> ring_;
    int write_pos_ = 0;
    int filled_ = 0;

    // Analysis-thread scratch
    std::vector<float> snapshot_;
    std::vector<std::complex<float>> bins_;
    SpectralFrame smoothed_;
    bool has_history_ = false;
};

std::unique_ptr<ISpectrumAnalyser> createSpectrumAnalyser(const AnalyserConfig& config);

} // namespace micviz::dsp
