#include "band_view.hpp"
#include <cmath>
#include <cstdio>

namespace gui {

BandView::BandView() {
    color_schemes = {
        {"Grayscale", {{0.0f,0.10f,0.10f,0.10f},{0.5f,0.50f,0.50f,0.50f},{1.0f,1.00f,1.00f,1.00f}}},
        {"Jet", {{0.00f,0.00f,0.00f,0.50f},{0.25f,0.00f,0.50f,1.00f},{0.50f,0.00f,1.00f,0.00f},{0.75f,1.00f,1.00f,0.00f},{1.00f,1.00f,0.00f,0.00f}}},
        {"Viridis", {{0.00f,0.267f,0.005f,0.329f},{0.25f,0.253f,0.265f,0.529f},{0.50f,0.127f,0.567f,0.551f},{0.75f,0.369f,0.787f,0.382f},{1.00f,0.993f,0.906f,0.144f}}},
        {"Thermal", {{0.00f,0.00f,0.00f,0.00f},{0.30f,0.50f,0.00f,0.00f},{0.60f,1.00f,0.50f,0.00f},{0.80f,1.00f,0.80f,0.20f},{1.00f,1.00f,1.00f,1.00f}}},
        {"Batlow", {{0.00f,0.005f,0.089f,0.209f},{0.25f,0.107f,0.288f,0.399f},{0.50f,0.458f,0.444f,0.444f},{0.75f,0.796f,0.555f,0.322f},{1.00f,0.993f,0.747f,0.009f}}},
    };
}

static ImU32 to_col32(float r, float g, float b) {
    return IM_COL32((int)(r * 255.0f), (int)(g * 255.0f), (int)(b * 255.0f), 255);
}

ImU32 BandView::color_from_scheme(float t01) const {
    if (color_schemes.empty()) return IM_COL32_WHITE;
    const int idx = (color_scheme_idx >= 0 && color_scheme_idx < (int)color_schemes.size()) ? color_scheme_idx : 0;
    const auto& stops = color_schemes[idx].stops;
    if (stops.empty()) return IM_COL32_WHITE;

    t01 = clamp01(t01);
    // First stop at or above t; interpolate from the one before it
    size_t hi = 0;
    while (hi < stops.size() && stops[hi].position < t01) ++hi;
    if (hi == 0) return to_col32(stops[0].r, stops[0].g, stops[0].b);
    if (hi == stops.size()) return to_col32(stops.back().r, stops.back().g, stops.back().b);

    const ColorStop& lo_s = stops[hi - 1];
    const ColorStop& hi_s = stops[hi];
    const float span = hi_s.position - lo_s.position;
    const float u = span > 0.0f ? (t01 - lo_s.position) / span : 0.0f;
    return to_col32(lo_s.r + (hi_s.r - lo_s.r) * u,
                    lo_s.g + (hi_s.g - lo_s.g) * u,
                    lo_s.b + (hi_s.b - lo_s.b) * u);
}

void BandView::draw(ImDrawList* dl,
                    const ImVec2& canvas_pos,
                    float width,
                    float height,
                    const micviz::Metrics& metrics,
                    int sample_rate) {
    if (!dl || width <= 0 || height <= 0) return;

    dl->AddRectFilled(canvas_pos, ImVec2(canvas_pos.x + width, canvas_pos.y + height), IM_COL32(20,20,20,255));
    dl->AddRect(canvas_pos, ImVec2(canvas_pos.x + width, canvas_pos.y + height), IM_COL32(60,60,60,255));

    const float base_y = canvas_pos.y + height;
    if (show_grid) {
        ImU32 grid = IM_COL32(70,70,70,160);
        for (int pct = 25; pct < 100; pct += 25) {
            float y = base_y - height * (pct / 100.0f);
            dl->AddLine(ImVec2(canvas_pos.x, y), ImVec2(canvas_pos.x + width, y), grid, 1.0f);
        }
    }

    const float slot = width / static_cast<float>(micviz::kBandCount);
    const float gap = slot > 6.0f ? 2.0f : 0.0f;
    for (int i = 0; i < micviz::kBandCount; ++i) {
        float v = clamp01(metrics.bands[i] / 100.0f);
        if (v <= 0.0f) continue;
        float px0 = canvas_pos.x + slot * i + gap * 0.5f;
        float px1 = canvas_pos.x + slot * (i + 1) - gap * 0.5f;
        dl->AddRectFilled(ImVec2(px0, base_y - v * height), ImVec2(px1, base_y), color_from_scheme(v));
    }

    // kHz ticks along the bottom edge
    if (show_grid && sample_rate > 0) {
        const float nyquist = sample_rate * 0.5f;
        const int step_hz = nyquist > 12000.0f ? 4000 : 2000;
        for (int hz = step_hz; hz < (int)nyquist; hz += step_hz) {
            float x = canvas_pos.x + (hz / nyquist) * width;
            dl->AddLine(ImVec2(x, base_y - 4.0f), ImVec2(x, base_y), IM_COL32(120,120,120,200), 1.0f);
            char tick[16];
            std::snprintf(tick, sizeof(tick), "%dk", hz / 1000);
            dl->AddText(ImVec2(x + 2.0f, base_y - ImGui::GetTextLineHeight() - 2.0f), IM_COL32(140,140,140,220), tick);
        }
    }

    // Peak marker: position along the 0..Nyquist axis the bands span
    if (show_peak_label && metrics.frequency_hz > 0 && sample_rate > 0) {
        float nyquist = sample_rate * 0.5f;
        float x = canvas_pos.x + clamp01(metrics.frequency_hz / nyquist) * width;
        dl->AddLine(ImVec2(x, canvas_pos.y), ImVec2(x, base_y), IM_COL32(204,0,0,230), 2.0f);
        char buf[24];
        std::snprintf(buf, sizeof(buf), "%d Hz", metrics.frequency_hz);
        ImVec2 ts = ImGui::CalcTextSize(buf);
        float tx = std::fmin(x + 4.0f, canvas_pos.x + width - ts.x - 2.0f);
        dl->AddText(ImVec2(tx, canvas_pos.y + 4.0f), IM_COL32(230,230,230,255), buf);
    }
}

} // namespace gui
