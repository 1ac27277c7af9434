#include "fft/fft_utils.hpp"
#include "spectrum_analyser.hpp"

#include <algorithm>
#include <cmath>
#include <complex>
#include <iostream>
#include <stdexcept>
#include <vector>

using namespace micviz;

static int g_failures = 0;

static void check(bool ok, const char* what) {
    std::cout << (ok ? "  ok    " : "  FAIL  ") << what << std::endl;
    if (!ok) ++g_failures;
}

static const double kTwoPi = 6.283185307179586;

static std::vector<float> sine(int n, double cycles_per_sample, float amp, long start = 0) {
    std::vector<float> out(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        out[i] = amp * static_cast<float>(std::sin(kTwoPi * cycles_per_sample * static_cast<double>(start + i)));
    }
    return out;
}

static int peak_bin(const SpectralFrame& f) {
    return static_cast<int>(std::max_element(f.begin(), f.end()) - f.begin());
}

template <typename Fn>
static bool throws_invalid(Fn fn) {
    try {
        fn();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

static void test_fft_plan() {
    std::cout << "FftPlan" << std::endl;
    check(throws_invalid([] { fft::FftPlan p(1000); }), "non power of two rejected");
    check(throws_invalid([] { fft::FftPlan p(0); }), "zero rejected");

    fft::FftPlan plan(16);
    std::vector<std::complex<float>> wrong(8);
    check(throws_invalid([&] { plan.forward(wrong); }), "length mismatch rejected");

    // Impulse -> flat spectrum
    std::vector<std::complex<float>> data(16, {0.0f, 0.0f});
    data[0] = {1.0f, 0.0f};
    plan.forward(data);
    bool flat = true;
    for (const auto& c : data) if (std::abs(std::abs(c) - 1.0f) > 1e-5f) flat = false;
    check(flat, "impulse transforms to a flat spectrum");

    // Cosine on bin 3 -> energy at 3 and 13 only
    for (int i = 0; i < 16; ++i) data[i] = {static_cast<float>(std::cos(kTwoPi * 3.0 * i / 16.0)), 0.0f};
    plan.forward(data);
    check(std::abs(std::abs(data[3]) - 8.0f) < 1e-3f && std::abs(std::abs(data[13]) - 8.0f) < 1e-3f,
          "cosine lands in its bin and the mirror");
    check(std::abs(data[5]) < 1e-3f, "no leakage for an exact bin");

    auto w = fft::hann_window(8);
    check(w.size() == 8 && w[0] == 0.0f && std::abs(w[4] - 1.0f) < 1e-6f, "periodic Hann window");
}

static void test_config_validation() {
    std::cout << "analyser config" << std::endl;
    check(throws_invalid([] { dsp::FftSpectrumAnalyser a(dsp::AnalyserConfig{1000, 0.8f}); }), "size 1000 rejected");
    check(throws_invalid([] { dsp::FftSpectrumAnalyser a(dsp::AnalyserConfig{8, 0.8f}); }), "size 8 rejected");
    check(throws_invalid([] { dsp::FftSpectrumAnalyser a(dsp::AnalyserConfig{32768, 0.8f}); }), "size 32768 rejected");
    check(throws_invalid([] { dsp::FftSpectrumAnalyser a(dsp::AnalyserConfig{2048, 1.0f}); }), "smoothing 1 rejected");
    check(throws_invalid([] { dsp::FftSpectrumAnalyser a(dsp::AnalyserConfig{2048, -0.1f}); }), "negative smoothing rejected");
    auto a = dsp::createSpectrumAnalyser(dsp::AnalyserConfig{});
    check(a->size() == 2048, "default is 2048 bins");
}

static void test_fill_and_peak() {
    std::cout << "spectrum of a sine" << std::endl;
    dsp::FftSpectrumAnalyser a(dsp::AnalyserConfig{256, 0.0f});
    check(a.get_value().empty(), "empty before any audio");

    const double cps = 40.0 / 512.0;  // bin 40 of the 512-sample window
    auto first = sine(300, cps, 0.5f);
    a.push_samples(first.data(), static_cast<int>(first.size()));
    check(a.get_value().empty(), "still empty with a partial window");

    auto rest = sine(212, cps, 0.5f, 300);
    a.push_samples(rest.data(), static_cast<int>(rest.size()));
    SpectralFrame f = a.get_value();
    check(f.size() == 256, "one value per bin");
    check(peak_bin(f) == 40, "peak in the sine's bin");
    check(std::abs(f[40] - 0.5f) < 0.02f, "magnitude reads the sine amplitude");
    check(f[100] < 1e-3f, "far bins stay near zero");

    a.push_samples(nullptr, 10);
    a.push_samples(rest.data(), 0);
    check(a.get_value().size() == 256, "null and empty pushes are ignored");
}

static void test_smoothing() {
    std::cout << "smoothing" << std::endl;
    dsp::FftSpectrumAnalyser a(dsp::AnalyserConfig{64, 0.5f});
    const double cps = 8.0 / 128.0;
    auto loud = sine(128, cps, 1.0f);
    a.push_samples(loud.data(), 128);
    const float first = a.get_value()[8];
    check(std::abs(first - 1.0f) < 0.05f, "first frame is not smoothed");

    std::vector<float> silence(128, 0.0f);
    a.push_samples(silence.data(), 128);
    const float second = a.get_value()[8];
    check(std::abs(second - 0.5f * first) < 1e-4f, "decays by the smoothing factor");
    const float third = a.get_value()[8];
    check(std::abs(third - 0.25f * first) < 1e-4f, "and keeps decaying on silence");
}

int main() {
    std::cout << "Spectrum analyser tests" << std::endl;
    test_fft_plan();
    test_config_validation();
    test_fill_and_peak();
    test_smoothing();
    if (g_failures) {
        std::cout << g_failures << " check(s) FAILED" << std::endl;
        return 1;
    }
    std::cout << "All checks passed" << std::endl;
    return 0;
}
