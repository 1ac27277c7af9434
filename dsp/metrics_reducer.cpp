#include "metrics_reducer.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace micviz::dsp {

// NaN and infinities count as silence so every output stays finite
static inline double magnitude_of(float v) {
    return std::isfinite(v) ? std::fabs(static_cast<double>(v)) : 0.0;
}

Metrics MetricsReducer::default_metrics() const {
    Metrics m;
    m.volume = std::max(0, config_.volume_floor);
    return m;
}

std::optional<Metrics> MetricsReducer::reduce(const SpectralFrame& frame) const {
    if (frame.empty()) return std::nullopt;

    const std::size_t n = frame.size();
    Metrics out = default_metrics();

    double sum = 0.0;
    double peak = -1.0;
    std::size_t peak_index = 0;
    for (std::size_t i = 0; i < n; ++i) {
        const double m = magnitude_of(frame[i]);
        sum += m;
        // Strictly greater: the lowest index wins a tie
        if (m > peak) { peak = m; peak_index = i; }
    }

    const double volume = std::round(sum / static_cast<double>(n) * config_.volume_scale);
    if (std::isfinite(volume)) {
        out.volume = std::max(out.volume, static_cast<int>(std::min(volume, 2147483647.0)));
    }

    const double nyquist = std::max(0, config_.sample_rate) / 2.0;
    out.frequency_hz = static_cast<int>(std::round(static_cast<double>(peak_index) * nyquist / static_cast<double>(n)));

    const std::size_t per_band = n / kBandCount;
    if (per_band > 0) {
        for (int b = 0; b < kBandCount; ++b) {
            double acc = 0.0;
            const std::size_t start = static_cast<std::size_t>(b) * per_band;
            for (std::size_t i = start; i < start + per_band; ++i) acc += magnitude_of(frame[i]);
            const double value = acc / static_cast<double>(per_band) * config_.band_scale;
            out.bands[b] = static_cast<float>(std::clamp(std::isfinite(value) ? value : 0.0, 0.0, 100.0));
        }
    }
    return out;
}

} // namespace micviz::dsp
