// 32-band envelope renderer for ImGui
#pragma once

#include "metrics.hpp"

#include <imgui.h>
#include <vector>

namespace gui {

class BandView {
public:
    // Options
    int color_scheme_idx = 2;       // 0..N-1 (default Viridis)
    bool show_peak_label = true;
    bool show_grid = true;

    BandView();

    // Bars are absolute percentages (0..100), not normalized to the loudest band
    void draw(ImDrawList* dl,
              const ImVec2& canvas_pos,
              float width,
              float height,
              const micviz::Metrics& metrics,
              int sample_rate);

    struct ColorStop { float position; float r, g, b; };
    struct ColorScheme { const char* name; std::vector<ColorStop> stops; };
    const std::vector<ColorScheme>& schemes() const { return color_schemes; }

private:
    std::vector<ColorScheme> color_schemes;

    static inline float clamp01(float v) { return v < 0.0f ? 0.0f : (v > 1.0f ? 1.0f : v); }
    ImU32 color_from_scheme(float t01) const;
};

} // namespace gui
