#pragma once

#include <string>

namespace micviz {

struct AppSettings {
    // Capture
    std::string device_name = "default";
    int sample_rate = 44100;
    int period_size = 512;
    bool auto_start = false;

    // Analyser
    int fft_size = 2048;        // output bins; power of two 16..16384
    float smoothing = 0.8f;

    // Calibration of the displayed metrics
    float volume_scale = 1000.0f;
    float band_scale = 500.0f;
    int volume_floor = 0;
    float meter_min_db = -100.0f;
    float meter_max_db = 0.0f;

    // Band view
    int color_scheme_idx = 2; // Viridis
    bool show_peak_label = true;
};

// Clamp anything a hand-edited file could break back into a usable range.
void sanitize_settings(AppSettings& st);

} // namespace micviz
