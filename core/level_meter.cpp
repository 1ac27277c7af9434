#include "level_meter.hpp"

#include <algorithm>
#include <cmath>

namespace micviz {

float volume_to_db(int volume, float volume_scale, float min_db, float max_db) {
    if (volume <= 0 || !(volume_scale > 0.0f)) return min_db;
    const float mean_mag = static_cast<float>(volume) / volume_scale;
    const float db = 20.0f * std::log10(std::max(1e-10f, mean_mag));
    return std::clamp(db, min_db, max_db);
}

float meter_fraction(float level_db, float min_db, float max_db) {
    if (!(max_db > min_db) || !std::isfinite(level_db)) return 0.0f;
    return std::clamp((level_db - min_db) / (max_db - min_db), 0.0f, 1.0f);
}

std::string render_meter_bar(float fraction, int width) {
    if (width <= 0) return "[]";
    fraction = std::clamp(std::isfinite(fraction) ? fraction : 0.0f, 0.0f, 1.0f);
    const int filled = static_cast<int>(fraction * width + 0.5f);
    std::string out;
    out.reserve(static_cast<size_t>(width) + 2);
    out.push_back('[');
    for (int i = 0; i < width; ++i) {
        if (i >= filled) out.push_back(' ');
        else if (i >= width * 9 / 10) out.push_back('#');   // top 10%: hot
        else if (i >= width * 3 / 4) out.push_back('=');
        else out.push_back('-');
    }
    out.push_back(']');
    return out;
}

} // namespace micviz
