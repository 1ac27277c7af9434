#include "app_settings.hpp"
#include "app_settings_io.hpp"
#include "fft/fft_utils.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

namespace micviz {

// Flat JSON object of scalars, as written by save_settings(). Keys are looked
// up by their quoted name; anything else in the file is ignored.
static const char* value_of(const char* json, const char* key) {
    const char* p = std::strstr(json, key);
    if (!p) return nullptr;
    p = std::strchr(p + std::strlen(key), ':');
    if (!p) return nullptr;
    ++p;
    while (*p == ' ' || *p == '\t') ++p;
    return p;
}

static void read_value(const char* json, const char* key, float& out) {
    const char* p = value_of(json, key);
    if (!p) return;
    char* end = nullptr;
    const float v = std::strtof(p, &end);
    if (end != p) out = v;
}

static void read_value(const char* json, const char* key, int& out) {
    const char* p = value_of(json, key);
    if (!p) return;
    char* end = nullptr;
    const long v = std::strtol(p, &end, 10);
    if (end != p) out = static_cast<int>(v);
}

static void read_value(const char* json, const char* key, bool& out) {
    const char* p = value_of(json, key);
    if (!p) return;
    if (std::strncmp(p, "true", 4) == 0) out = true;
    else if (std::strncmp(p, "false", 5) == 0) out = false;
}

// Strings only ever carry \" and \\ escapes (see escape_string)
static void read_value(const char* json, const char* key, std::string& out) {
    const char* p = value_of(json, key);
    if (!p || *p != '"') return;
    ++p;
    std::string value;
    while (*p && *p != '"' && *p != '\n' && *p != '\r') {
        if (*p == '\\' && p[1] != '\0') ++p;
        value.push_back(*p++);
    }
    if (*p != '"') return;  // unterminated: keep the old value
    out = value;
}

static std::string escape_string(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

void sanitize_settings(AppSettings& st) {
    if (st.device_name.empty()) st.device_name = "default";
    if (st.sample_rate < 8000 || st.sample_rate > 192000) st.sample_rate = 44100;
    st.period_size = std::clamp(st.period_size, 32, 8192);
    if (st.fft_size < 16 || st.fft_size > 16384 || !fft::is_power_of_two(st.fft_size)) st.fft_size = 2048;
    if (!(st.smoothing >= 0.0f && st.smoothing < 1.0f)) st.smoothing = 0.8f;
    if (!std::isfinite(st.volume_scale) || st.volume_scale <= 0.0f) st.volume_scale = 1000.0f;
    if (!std::isfinite(st.band_scale) || st.band_scale <= 0.0f) st.band_scale = 500.0f;
    if (st.volume_floor < 0) st.volume_floor = 0;
    if (!std::isfinite(st.meter_min_db) || !std::isfinite(st.meter_max_db) || st.meter_min_db >= st.meter_max_db) {
        st.meter_min_db = -100.0f;
        st.meter_max_db = 0.0f;
    }
    if (st.color_scheme_idx < 0) st.color_scheme_idx = 2;
}

bool load_settings(const char* path, AppSettings& st) {
    FILE* f = std::fopen(path, "rb");
    if (!f) return false;
    std::fseek(f, 0, SEEK_END);
    long sz = std::ftell(f);
    std::fseek(f, 0, SEEK_SET);
    if (sz <= 0 || sz > 1<<20) { std::fclose(f); return false; }
    std::string buf; buf.resize((size_t)sz);
    size_t n = std::fread(buf.data(), 1, (size_t)sz, f);
    std::fclose(f);
    if (n != (size_t)sz) return false;

    const char* s = buf.c_str();
    read_value(s, "\"device_name\"", st.device_name);
    read_value(s, "\"sample_rate\"", st.sample_rate);
    read_value(s, "\"period_size\"", st.period_size);
    read_value(s, "\"auto_start\"", st.auto_start);
    read_value(s, "\"fft_size\"", st.fft_size);
    read_value(s, "\"smoothing\"", st.smoothing);
    read_value(s, "\"volume_scale\"", st.volume_scale);
    read_value(s, "\"band_scale\"", st.band_scale);
    read_value(s, "\"volume_floor\"", st.volume_floor);
    read_value(s, "\"meter_min_db\"", st.meter_min_db);
    read_value(s, "\"meter_max_db\"", st.meter_max_db);
    read_value(s, "\"color_scheme_idx\"", st.color_scheme_idx);
    read_value(s, "\"show_peak_label\"", st.show_peak_label);
    sanitize_settings(st);
    return true;
}

bool save_settings(const char* path, const AppSettings& st) {
    FILE* f = std::fopen(path, "wb");
    if (!f) return false;
    std::fprintf(f,
        "{\n"
        "  \"device_name\": \"%s\",\n"
        "  \"sample_rate\": %d,\n"
        "  \"period_size\": %d,\n"
        "  \"auto_start\": %s,\n"
        "  \"fft_size\": %d,\n"
        "  \"smoothing\": %.3f,\n"
        "  \"volume_scale\": %.3f,\n"
        "  \"band_scale\": %.3f,\n"
        "  \"volume_floor\": %d,\n"
        "  \"meter_min_db\": %.2f,\n"
        "  \"meter_max_db\": %.2f,\n"
        "  \"color_scheme_idx\": %d,\n"
        "  \"show_peak_label\": %s\n"
        "}\n",
        escape_string(st.device_name).c_str(),
        st.sample_rate,
        st.period_size,
        st.auto_start ? "true" : "false",
        st.fft_size,
        st.smoothing,
        st.volume_scale,
        st.band_scale,
        st.volume_floor,
        st.meter_min_db,
        st.meter_max_db,
        st.color_scheme_idx,
        st.show_peak_label ? "true" : "false");
    const bool ok = std::ferror(f) == 0;
    return std::fclose(f) == 0 && ok;
}

} // namespace micviz
