#include "headless_meter.hpp"

#include "SessionLifecycle.hpp"
#include "frame_scheduler.hpp"
#include "level_meter.hpp"
#include "presentation_state.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>

using namespace micviz;

static std::atomic<bool> g_running(true);

static void signal_handler(int) {
    g_running = false;
}

static std::string band_sparkline(const Metrics& m) {
    static const char levels[] = " .:-=+*#%@";
    std::string out;
    out.reserve(kBandCount);
    for (float v : m.bands) {
        int idx = static_cast<int>(v / 100.0f * 9.0f + 0.5f);
        if (idx < 0) idx = 0;
        if (idx > 9) idx = 9;
        out.push_back(levels[idx]);
    }
    return out;
}

int run_headless(const AppSettings& settings) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    PresentationState state;
    FrameScheduler scheduler;
    audio::SessionLifecycle lifecycle(state, scheduler, audio::make_session_config(settings));

    std::cout << "micviz headless meter\n"
              << "Device: " << settings.device_name << "\n"
              << "Press Ctrl+C to exit\n" << std::endl;

    if (!lifecycle.start()) {
        std::cerr << state.error_text() << std::endl;
        return 1;
    }

    std::uint64_t last_revision = 0;
    while (g_running.load() && lifecycle.is_recording()) {
        scheduler.run_pending();
        if (state.revision() != last_revision) {
            last_revision = state.revision();
            const Metrics& m = state.metrics();
            const float db = volume_to_db(m.volume, settings.volume_scale, settings.meter_min_db, settings.meter_max_db);
            std::cout << "\r" << render_meter_bar(meter_fraction(db, settings.meter_min_db, settings.meter_max_db), 30)
                      << " " << std::fixed << std::setprecision(1) << std::setw(6) << db << " dB"
                      << "  vol " << std::setw(5) << m.volume
                      << "  " << std::setw(5) << m.frequency_hz << " Hz"
                      << "  |" << band_sparkline(m) << "|" << std::flush;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(16));
    }

    std::cout << "\n\nShutting down..." << std::endl;
    lifecycle.stop();
    if (state.last_error()) {
        std::cerr << state.error_text() << std::endl;
        return 1;
    }
    return 0;
}
