#include "fft/fft_utils.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace micviz::fft {

FftPlan::FftPlan(int size) : n_(size) {
    if (size < 2 || !is_power_of_two(size)) {
        throw std::invalid_argument("FFT size must be a power of two >= 2, got " + std::to_string(size));
    }
    int bits = 0; while ((1 << bits) < n_) ++bits;
    bitrev_.resize(n_);
    for (int i = 0; i < n_; ++i) {
        unsigned int v = static_cast<unsigned int>(i);
        unsigned int r = 0;
        for (int b = 0; b < bits; ++b) { r = (r << 1) | (v & 1u); v >>= 1; }
        bitrev_[i] = static_cast<int>(r);
    }

    const float two_pi = 6.28318530717958647692f;
    for (int len = 2; len <= n_; len <<= 1) {
        const float angle = -two_pi / static_cast<float>(len);
        const std::complex<float> wlen(std::cos(angle), std::sin(angle));
        const int half = len / 2;
        std::vector<std::complex<float>> stage(half);
        std::complex<float> w(1.0f, 0.0f);
        for (int k = 0; k < half; ++k) { stage[k] = w; w *= wlen; }
        stages_.push_back(std::move(stage));
    }
    scratch_.resize(n_);
}

void FftPlan::forward(std::vector<std::complex<float>>& data) const {
    if (static_cast<int>(data.size()) != n_) {
        throw std::invalid_argument("FFT input length does not match plan size");
    }

    for (int i = 0; i < n_; ++i) scratch_[bitrev_[i]] = data[i];
    data.swap(scratch_);

    int stage_index = 0;
    for (int len = 2; len <= n_; len <<= 1, ++stage_index) {
        const auto& W = stages_[stage_index];
        const int half = len / 2;
        for (int i = 0; i < n_; i += len) {
            for (int k = 0; k < half; ++k) {
                const auto u = data[i + k];
                const auto v = data[i + k + half] * W[k];
                data[i + k] = u + v;
                data[i + k + half] = u - v;
            }
        }
    }
}

std::vector<float> hann_window(int n) {
    std::vector<float> w(n > 0 ? n : 0);
    const float two_pi = 6.28318530717958647692f;
    for (int i = 0; i < n; ++i) {
        w[i] = 0.5f * (1.0f - std::cos(two_pi * static_cast<float>(i) / static_cast<float>(n)));
    }
    return w;
}

} // namespace micviz::fft
