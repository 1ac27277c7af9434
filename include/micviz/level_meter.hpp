#pragma once

#include <string>

namespace micviz {

// Volume units back to a dB level for the meter: volume / volume_scale is
// the mean bin magnitude, 20*log10 of it clamped to [min_db, max_db].
float volume_to_db(int volume, float volume_scale, float min_db, float max_db);

// Position of a dB level inside [min_db, max_db], 0..1
float meter_fraction(float level_db, float min_db, float max_db);

// Console meter line used by the headless mode, e.g. "[#####     ]"
std::string render_meter_bar(float fraction, int width);

} // namespace micviz
