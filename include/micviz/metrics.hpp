#pragma once

#include <array>
#include <vector>

namespace micviz {

// One snapshot of magnitude samples from the spectral transform,
// bin 0 = DC, last bin just below Nyquist.
using SpectralFrame = std::vector<float>;

constexpr int kBandCount = 32;

struct Metrics {
    int frequency_hz = 0;
    // Relative loudness units (scaled mean magnitude), not dB SPL.
    int volume = 0;
    // Percentages 0..100, lowest frequencies first.
    std::array<float, kBandCount> bands{};
};

inline bool operator==(const Metrics& a, const Metrics& b) {
    return a.frequency_hz == b.frequency_hz && a.volume == b.volume && a.bands == b.bands;
}
inline bool operator!=(const Metrics& a, const Metrics& b) { return !(a == b); }

} // namespace micviz
