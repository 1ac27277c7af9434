#include "metrics_reducer.hpp"
#include "fakes.hpp"
#include <cmath>
#include <iostream>
#include <limits>
#include <random>

using namespace micviz;
using micviz::dsp::MetricsReducer;
using micviz::dsp::ReducerConfig;

static int g_failures = 0;

static void check(bool ok, const char* what) {
    std::cout << (ok ? "  ok    " : "  FAIL  ") << what << std::endl;
    if (!ok) ++g_failures;
}

static bool bands_all(const Metrics& m, float value) {
    for (float b : m.bands) if (b != value) return false;
    return true;
}

static void test_silence() {
    std::cout << "silent frame" << std::endl;
    MetricsReducer reducer;
    auto m = reducer.reduce(SpectralFrame(2048, 0.0f));
    check(m.has_value(), "zeros still produce an update");
    check(m->volume == 0, "volume at floor");
    check(m->frequency_hz == 0, "frequency 0");
    check(bands_all(*m, 0.0f), "all 32 bands 0");
    check(*m == reducer.default_metrics(), "equals the stopped defaults");
}

static void test_single_spike() {
    std::cout << "single spike at bin 1024" << std::endl;
    MetricsReducer reducer;  // 44100 Hz
    auto m = reducer.reduce(fakes::spike(2048, 1024, 1.0f));
    check(m.has_value(), "update produced");
    check(m->frequency_hz == 11025, "peak frequency 11025 Hz");
    check(m->volume == 0, "volume round(1/2048*1000) = 0");
    // 64 bins per band, bin 1024 is the first bin of band 16
    check(std::fabs(m->bands[16] - 500.0f / 64.0f) < 1e-4f, "band 16 = 1/64 * 500");
    bool others_zero = true;
    for (int b = 0; b < kBandCount; ++b) if (b != 16 && m->bands[b] != 0.0f) others_zero = false;
    check(others_zero, "every other band 0");
}

static void test_empty_is_no_update() {
    std::cout << "empty frame" << std::endl;
    MetricsReducer reducer;
    check(!reducer.reduce(SpectralFrame{}).has_value(), "empty frame means no update");
}

static void test_tie_break_and_sign() {
    std::cout << "peak selection" << std::endl;
    MetricsReducer reducer;
    SpectralFrame f(2048, 0.0f);
    f[300] = 0.5f;
    f[100] = -0.5f;  // same magnitude, lower index
    f[900] = 0.5f;
    auto m = reducer.reduce(f);
    check(m->frequency_hz == static_cast<int>(std::round(100 * 22050.0 / 2048)), "lowest index wins a tie, sign ignored");

    SpectralFrame g(2048, 0.0f);
    g[10] = -0.9f;
    g[20] = 0.8f;
    m = reducer.reduce(g);
    check(m->frequency_hz == static_cast<int>(std::round(10 * 22050.0 / 2048)), "negative sample can be the peak");
}

static void test_volume_and_clamping() {
    std::cout << "volume and band clamping" << std::endl;
    MetricsReducer reducer;
    auto m = reducer.reduce(SpectralFrame(2048, -0.25f));
    check(m->volume == 250, "mean |x| 0.25 * 1000 = 250");
    check(bands_all(*m, 100.0f), "0.25 * 500 clamps to 100");

    m = reducer.reduce(SpectralFrame(2048, 0.1f));
    check(bands_all(*m, 50.0f), "0.1 * 500 = 50");

    ReducerConfig cfg;
    cfg.volume_scale = 10.0f;
    cfg.band_scale = 100.0f;
    cfg.volume_floor = 3;
    MetricsReducer custom(cfg);
    check(custom.default_metrics().volume == 3, "defaults use the configured floor");
    m = custom.reduce(SpectralFrame(2048, 0.1f));
    check(m->volume == 3, "volume never below the floor");
    check(bands_all(*m, 10.0f), "configured band scale");
}

static void test_remainder_ignored() {
    std::cout << "tail remainder" << std::endl;
    MetricsReducer reducer;
    // 100 samples: 3 per band, samples 96..99 belong to no band
    SpectralFrame f(100, 0.0f);
    f[97] = 1.0f;
    auto m = reducer.reduce(f);
    check(bands_all(*m, 0.0f), "samples past 32*floor(n/32) are not banded");
    check(m->frequency_hz == static_cast<int>(std::round(97 * 22050.0 / 100)), "but still count for the peak");
    check(m->volume == 10, "and for the volume");

    auto tiny = reducer.reduce(SpectralFrame(8, 1.0f));
    check(tiny.has_value() && bands_all(*tiny, 0.0f), "frame shorter than the band count gives zero bands");
}

static void test_non_finite() {
    std::cout << "non-finite samples" << std::endl;
    MetricsReducer reducer;
    SpectralFrame f(2048, 0.0f);
    f[5] = std::numeric_limits<float>::quiet_NaN();
    f[6] = std::numeric_limits<float>::infinity();
    f[700] = 0.2f;
    auto m = reducer.reduce(f);
    check(m.has_value(), "no exception, an update");
    check(m->frequency_hz == static_cast<int>(std::round(700 * 22050.0 / 2048)), "NaN/inf never win the peak");
    bool finite = true;
    for (float b : m->bands) if (!std::isfinite(b)) finite = false;
    check(finite, "bands stay finite");
}

static void test_properties_random() {
    std::cout << "random frames" << std::endl;
    std::mt19937 rng(1234);
    std::uniform_real_distribution<float> amp(-3.0f, 3.0f);
    std::uniform_int_distribution<int> len(1, 5000);
    MetricsReducer reducer;
    bool bands_ok = true, freq_ok = true, vol_ok = true;
    for (int iter = 0; iter < 300; ++iter) {
        SpectralFrame f(static_cast<size_t>(len(rng)));
        for (auto& v : f) v = amp(rng);
        auto m = reducer.reduce(f);
        if (!m) { bands_ok = false; continue; }
        for (float b : m->bands) if (!(b >= 0.0f && b <= 100.0f)) bands_ok = false;
        if (m->frequency_hz < 0 || m->frequency_hz > 22050) freq_ok = false;
        if (m->volume < 0) vol_ok = false;
    }
    check(bands_ok, "bands always within [0,100]");
    check(freq_ok, "frequency always within [0, 22050]");
    check(vol_ok, "volume never negative");
}

static void test_sample_rate() {
    std::cout << "sample rate" << std::endl;
    MetricsReducer reducer;
    reducer.set_sample_rate(48000);
    auto m = reducer.reduce(fakes::spike(2048, 1024, 1.0f));
    check(m->frequency_hz == 12000, "bin 1024 of 2048 at 48 kHz = 12000 Hz");
}

int main() {
    std::cout << "MetricsReducer tests" << std::endl;
    test_silence();
    test_single_spike();
    test_empty_is_no_update();
    test_tie_break_and_sign();
    test_volume_and_clamping();
    test_remainder_ignored();
    test_non_finite();
    test_properties_random();
    test_sample_rate();
    if (g_failures) {
        std::cout << g_failures << " check(s) FAILED" << std::endl;
        return 1;
    }
    std::cout << "All checks passed" << std::endl;
    return 0;
}
