#include "app_settings.hpp"
#include "app_settings_io.hpp"
#include "level_meter.hpp"
#include "SessionLifecycle.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <unistd.h>

using namespace micviz;

static int g_failures = 0;

static void check(bool ok, const char* what) {
    std::cout << (ok ? "  ok    " : "  FAIL  ") << what << std::endl;
    if (!ok) ++g_failures;
}

static std::string temp_path() {
    char tmpl[] = "/tmp/micviz_settings_XXXXXX";
    int fd = mkstemp(tmpl);
    if (fd >= 0) close(fd);
    return tmpl;
}

static void write_file(const std::string& path, const char* text) {
    FILE* f = std::fopen(path.c_str(), "wb");
    if (!f) return;
    std::fputs(text, f);
    std::fclose(f);
}

static void test_round_trip() {
    std::cout << "save / load" << std::endl;
    const std::string path = temp_path();
    AppSettings out;
    out.device_name = "plughw:1,0";
    out.sample_rate = 48000;
    out.period_size = 256;
    out.auto_start = true;
    out.fft_size = 4096;
    out.smoothing = 0.5f;
    out.volume_scale = 2000.0f;
    out.volume_floor = 3;
    out.meter_min_db = -80.0f;
    out.color_scheme_idx = 4;
    out.show_peak_label = false;
    check(save_settings(path.c_str(), out), "saved");

    AppSettings in;
    check(load_settings(path.c_str(), in), "loaded");
    check(in.device_name == "plughw:1,0", "device name");
    check(in.sample_rate == 48000 && in.period_size == 256, "capture settings");
    check(in.auto_start, "auto start");
    check(in.fft_size == 4096 && std::abs(in.smoothing - 0.5f) < 1e-3f, "analyser settings");
    check(std::abs(in.volume_scale - 2000.0f) < 1e-2f && in.volume_floor == 3, "calibration");
    check(std::abs(in.meter_min_db + 80.0f) < 1e-2f && std::abs(in.meter_max_db) < 1e-2f, "meter range");
    check(in.color_scheme_idx == 4 && !in.show_peak_label, "view settings");
    std::remove(path.c_str());
}

static void test_device_name_quoting() {
    std::cout << "device names with quotes and backslashes" << std::endl;
    const std::string path = temp_path();
    AppSettings out;
    out.device_name = "plug:\"my mic\"\\dev";
    out.sample_rate = 32000;
    check(save_settings(path.c_str(), out), "saved");

    AppSettings in;
    check(load_settings(path.c_str(), in), "loaded");
    check(in.device_name == out.device_name, "name survives intact");
    check(in.sample_rate == 32000, "keys after the name still parse");

    write_file(path, "{\n  \"device_name\": \"hw:1,0\n}\n");
    AppSettings broken;
    broken.device_name = "plughw:0,0";
    load_settings(path.c_str(), broken);
    check(broken.device_name == "plughw:0,0", "unterminated string keeps the previous name");
    std::remove(path.c_str());
}

static void test_missing_and_partial() {
    std::cout << "missing and partial files" << std::endl;
    AppSettings st;
    check(!load_settings("/nonexistent/micviz/settings.json", st), "missing file reports false");
    check(st.fft_size == 2048 && st.device_name == "default", "defaults untouched");

    const std::string path = temp_path();
    write_file(path, "{\n  \"sample_rate\": 22050\n}\n");
    AppSettings partial;
    partial.band_scale = 250.0f;
    check(load_settings(path.c_str(), partial), "partial file loads");
    check(partial.sample_rate == 22050, "present key applied");
    check(partial.band_scale == 250.0f, "absent key keeps the caller's value");
    std::remove(path.c_str());
}

static void test_sanitize() {
    std::cout << "sanitize" << std::endl;
    const std::string path = temp_path();
    write_file(path,
               "{\n"
               "  \"device_name\": \"\",\n"
               "  \"sample_rate\": 5,\n"
               "  \"fft_size\": 1000,\n"
               "  \"smoothing\": 1.5,\n"
               "  \"volume_scale\": -1,\n"
               "  \"volume_floor\": -4,\n"
               "  \"meter_min_db\": 10,\n"
               "  \"meter_max_db\": -10\n"
               "}\n");
    AppSettings st;
    check(load_settings(path.c_str(), st), "loads");
    check(st.device_name == "default", "empty device falls back to default");
    check(st.sample_rate == 44100, "absurd rate replaced");
    check(st.fft_size == 2048, "non power of two size replaced");
    check(st.smoothing == 0.8f, "smoothing back in range");
    check(st.volume_scale == 1000.0f, "scale must be positive");
    check(st.volume_floor == 0, "floor not negative");
    check(st.meter_min_db == -100.0f && st.meter_max_db == 0.0f, "inverted meter range reset");
    std::remove(path.c_str());
}

static void test_session_config() {
    std::cout << "settings -> session config" << std::endl;
    AppSettings st;
    st.device_name = "hw:2,0";
    st.sample_rate = 48000;
    st.fft_size = 1024;
    st.volume_floor = 2;
    auto cfg = audio::make_session_config(st);
    check(cfg.audio.device_name == "hw:2,0" && cfg.audio.sample_rate == 48000u, "audio config");
    check(cfg.analyser.size == 1024, "analyser size");
    check(cfg.reducer.sample_rate == 48000 && cfg.reducer.volume_floor == 2, "reducer config");
}

static void test_level_meter() {
    std::cout << "level meter" << std::endl;
    check(volume_to_db(0, 1000.0f, -100.0f, 0.0f) == -100.0f, "silence is the bottom of the range");
    check(std::abs(volume_to_db(1000, 1000.0f, -100.0f, 0.0f)) < 1e-4f, "full scale is 0 dB");
    check(std::abs(volume_to_db(100, 1000.0f, -100.0f, 0.0f) + 20.0f) < 1e-3f, "a tenth is -20 dB");
    check(volume_to_db(5000, 1000.0f, -100.0f, 0.0f) == 0.0f, "clamped at the top");

    check(meter_fraction(-50.0f, -100.0f, 0.0f) == 0.5f, "midpoint");
    check(meter_fraction(-200.0f, -100.0f, 0.0f) == 0.0f, "below range");
    check(meter_fraction(0.0f, 0.0f, 0.0f) == 0.0f, "empty range");

    check(render_meter_bar(0.0f, 10) == "[          ]", "empty bar");
    check(render_meter_bar(0.5f, 10) == "[-----     ]", "half bar");
    check(render_meter_bar(1.0f, 10) == "[-------==#]", "full bar marks the hot end");
    check(render_meter_bar(0.5f, 0) == "[]", "zero width");
}

int main() {
    std::cout << "Settings and meter tests" << std::endl;
    test_round_trip();
    test_device_name_quoting();
    test_missing_and_partial();
    test_sanitize();
    test_session_config();
    test_level_meter();
    if (g_failures) {
        std::cout << g_failures << " check(s) FAILED" << std::endl;
        return 1;
    }
    std::cout << "All checks passed" << std::endl;
    return 0;
}
