#include "SessionLifecycle.hpp"
#include "app_settings.hpp"
#include "app_settings_io.hpp"
#include "frame_scheduler.hpp"
#include "level_meter.hpp"
#include "presentation_state.hpp"
#include "headless_meter.hpp"
#include "views/band_view.hpp"
#include "windows/mic_setup.hpp"
#include "command_registry.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

// ImGui + OpenGL ES 3
#include <GLES3/gl3.h>
#include <GLFW/glfw3.h>
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_opengl3.h>

using namespace micviz;

class MicvizGUI {
public:
    MicvizGUI(AppSettings& app_settings, const std::string& path, bool start_now)
        : settings(app_settings),
          settings_path(path),
          start_immediately(start_now || app_settings.auto_start),
          lifecycle(state, scheduler, audio::make_session_config(app_settings)) {
        band_view.color_scheme_idx = settings.color_scheme_idx;
        band_view.show_peak_label = settings.show_peak_label;
        selected_device = settings.device_name;
    }

    bool init_gui() {
        if (!glfwInit()) {
            std::cerr << "Failed to initialize GLFW" << std::endl;
            return false;
        }

        glfwWindowHint(GLFW_CLIENT_API, GLFW_OPENGL_ES_API);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);

        window = glfwCreateWindow(960, 600, "micviz - Microphone Spectrum", nullptr, nullptr);
        if (!window) {
            std::cerr << "Failed to create window" << std::endl;
            glfwTerminate();
            return false;
        }

        glfwMakeContextCurrent(window);
        // vsync: one main-loop iteration, and one analysis cycle, per refresh
        glfwSwapInterval(1);

        IMGUI_CHECKVERSION();
        ImGui::CreateContext();
        ImGuiIO& io = ImGui::GetIO();
        io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
        io.IniFilename = nullptr;
        ImGui::StyleColorsDark();

        auto file_exists = [](const char* path) -> bool {
            std::ifstream f(path, std::ios::binary); return (bool)f;
        };
        const char* font_paths[] = {
            "/usr/share/fonts/truetype/roboto/Roboto-Regular.ttf",
            "/usr/share/fonts/truetype/roboto/hinted/Roboto-Regular.ttf",
            "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        };
        const char* font_used = nullptr;
        for (const char* p : font_paths) { if (file_exists(p)) { font_used = p; break; } }
        if (font_used) {
            io.Fonts->AddFontFromFileTTF(font_used, 18.0f);
        } else {
            io.Fonts->AddFontDefault();
        }

        ImGui_ImplGlfw_InitForOpenGL(window, true);
        ImGui_ImplOpenGL3_Init("#version 300 es");

        build_commands();
        return true;
    }

    int run() {
        if (!init_gui()) return 1;

        if (start_immediately) lifecycle.start();

        while (!glfwWindowShouldClose(window)) {
            glfwPollEvents();

            // The analysis loop's redraw-synchronized callbacks
            scheduler.run_pending();

            ImGui_ImplOpenGL3_NewFrame();
            ImGui_ImplGlfw_NewFrame();
            ImGui::NewFrame();

            command_registry.handle_shortcuts();
            render_gui();

            ImGui::Render();
            int display_w, display_h;
            glfwGetFramebufferSize(window, &display_w, &display_h);
            glViewport(0, 0, display_w, display_h);
            glClearColor(0.1f, 0.1f, 0.1f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT);
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

            glfwSwapBuffers(window);
        }

        lifecycle.stop();

        settings.device_name = lifecycle.config().audio.device_name;
        settings.color_scheme_idx = band_view.color_scheme_idx;
        settings.show_peak_label = band_view.show_peak_label;
        if (!save_settings(settings_path.c_str(), settings)) {
            std::cerr << "Could not save settings to " << settings_path << std::endl;
        }

        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return 0;
    }

private:
    AppSettings& settings;
    std::string settings_path;
    bool start_immediately;

    PresentationState state;
    FrameScheduler scheduler;
    audio::SessionLifecycle lifecycle;

    GLFWwindow* window = nullptr;
    gui::BandView band_view;
    gui::CommandRegistry command_registry;
    std::string selected_device;
    bool show_mic_setup = false;
    bool show_about = false;

    float meter_db() const {
        return volume_to_db(state.metrics().volume, settings.volume_scale,
                            settings.meter_min_db, settings.meter_max_db);
    }

    void render_gui() {
        if (ImGui::BeginMainMenuBar()) {
            command_registry.draw_main_menu_bar();
            ImGui::EndMainMenuBar();
        }

        const ImGuiViewport* vp = ImGui::GetMainViewport();
        ImGui::SetNextWindowPos(vp->WorkPos);
        ImGui::SetNextWindowSize(vp->WorkSize);
        ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
                                 ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoBringToFrontOnFocus;
        if (ImGui::Begin("##main", nullptr, flags)) {
            render_controls();
            ImGui::Separator();
            render_readouts();
            ImGui::Spacing();

            ImVec2 avail = ImGui::GetContentRegionAvail();
            float status_h = ImGui::GetTextLineHeightWithSpacing() * 2.0f;
            float canvas_h = std::fmax(80.0f, avail.y - status_h);
            ImVec2 pos = ImGui::GetCursorScreenPos();
            band_view.draw(ImGui::GetWindowDrawList(), pos, avail.x, canvas_h,
                           state.metrics(), lifecycle.sample_rate());
            ImGui::Dummy(ImVec2(avail.x, canvas_h));

            render_status_line();
        }
        ImGui::End();

        gui::MicSetupView mic_view;
        mic_view.active_device = lifecycle.config().audio.device_name;
        mic_view.recording = state.is_recording();
        mic_view.level_db = meter_db();
        mic_view.level01 = meter_fraction(mic_view.level_db, settings.meter_min_db, settings.meter_max_db);
        if (gui::render_mic_setup_window(selected_device, show_mic_setup, mic_view)) {
            settings.device_name = selected_device;
            lifecycle.restart_with_device(selected_device);
        }
        render_about();
        command_registry.render_command_palette();
    }

    void render_controls() {
        const bool recording = state.is_recording();
        ImGui::BeginDisabled(recording);
        if (ImGui::Button("Start", ImVec2(110, 0))) lifecycle.start();
        ImGui::EndDisabled();
        ImGui::SameLine();
        ImGui::BeginDisabled(!recording);
        if (ImGui::Button("Stop", ImVec2(110, 0))) lifecycle.stop();
        ImGui::EndDisabled();
        ImGui::SameLine();
        if (recording) {
            ImGui::TextColored(ImVec4(0.95f, 0.25f, 0.25f, 1.0f), "REC");
        } else {
            ImGui::TextDisabled("stopped");
        }

        const std::string err = state.error_text();
        if (!err.empty()) {
            ImGui::PushTextWrapPos(0.0f);
            ImGui::TextColored(ImVec4(1.0f, 0.45f, 0.35f, 1.0f), "%s", err.c_str());
            ImGui::PopTextWrapPos();
        }
    }

    void render_readouts() {
        const Metrics& m = state.metrics();
        ImGui::Text("Frequency: %5d Hz", m.frequency_hz);
        ImGui::SameLine(260.0f);
        ImGui::Text("Volume: %5d", m.volume);
        ImGui::SameLine(420.0f);

        const float db = meter_db();
        char overlay[32];
        std::snprintf(overlay, sizeof(overlay), "%.1f dB", db);
        ImGui::ProgressBar(meter_fraction(db, settings.meter_min_db, settings.meter_max_db),
                           ImVec2(-FLT_MIN, 0.0f), overlay);
    }

    void render_status_line() {
        const AnalysisLoop& loop = lifecycle.loop();
        auto stats = lifecycle.latency_stats();
        ImGui::TextDisabled("loop %s | cycles %llu | frames %llu | %s @ %d Hz | callback %.2f ms avg, %d xruns",
                            to_string(loop.state()),
                            static_cast<unsigned long long>(loop.cycles_run()),
                            static_cast<unsigned long long>(loop.frames_published()),
                            lifecycle.config().audio.device_name.c_str(),
                            lifecycle.sample_rate(),
                            stats.avg_ms, stats.xruns);
    }

    void render_about() {
        if (!show_about) return;
        ImGui::SetNextWindowSize(ImVec2(380, 0), ImGuiCond_FirstUseEver);
        if (ImGui::Begin("About micviz", &show_about)) {
            ImGui::TextWrapped("Live microphone frequency, volume and %d-band spectrum.", kBandCount);
            ImGui::TextWrapped("Volume is a relative loudness figure, not a calibrated sound level.");
            ImGui::Separator();
            ImGui::TextUnformatted("Space: start/stop   Ctrl+M: microphone   Ctrl+P: commands");
        }
        ImGui::End();
    }

    void build_commands() {
        using gui::Command;
        command_registry.register_command(Command{
            "audio.start", "Start", "", "Audio",
            [this]{ return !state.is_recording(); },
            [this]{ lifecycle.start(); }
        });
        command_registry.register_command(Command{
            "audio.stop", "Stop", "", "Audio",
            [this]{ return state.is_recording(); },
            [this]{ lifecycle.stop(); }
        });
        // Shortcut-only toggle, hidden from the menus
        command_registry.register_command(Command{
            "audio.toggle", "Start / Stop", "Space", "",
            nullptr,
            [this]{ if (state.is_recording()) lifecycle.stop(); else lifecycle.start(); }
        });
        command_registry.register_command(Command{
            "audio.mic_setup", "Microphone Setup...", "Ctrl+M", "Audio",
            nullptr,
            [this]{ selected_device = lifecycle.config().audio.device_name; show_mic_setup = true; }
        });
        const auto& schemes = band_view.schemes();
        for (int i = 0; i < (int)schemes.size(); ++i) {
            command_registry.register_command(Command{
                "view.scheme." + std::to_string(i),
                std::string("Colors: ") + schemes[i].name, "", "View",
                [this, i]{ return band_view.color_scheme_idx != i; },
                [this, i]{ band_view.color_scheme_idx = i; }
            });
        }
        command_registry.register_command(Command{
            "view.peak_label", "Toggle Peak Marker", "", "View",
            nullptr,
            [this]{ band_view.show_peak_label = !band_view.show_peak_label; }
        });
        command_registry.register_command(Command{
            "help.palette", "Command Palette...", "Ctrl+P", "Help",
            nullptr,
            [this]{ command_registry.open_palette(); }
        });
        command_registry.register_command(Command{
            "help.about", "About", "", "Help",
            nullptr,
            [this]{ show_about = true; }
        });
    }
};

static void print_usage(const char* argv0) {
    std::cout << "micviz - live microphone spectrum\n"
              << "Usage: " << argv0 << " [options]\n"
              << "  --device <name>   ALSA capture device (default from settings)\n"
              << "  --rate <hz>       Requested sample rate\n"
              << "  --config <path>   Settings file (default: config/settings.json)\n"
              << "  --start           Start recording immediately\n"
              << "  --headless        Console meter instead of a window\n"
              << "  --help            Show this help\n";
}

int main(int argc, char* argv[]) {
    std::string settings_path = "config/settings.json";
    std::string device_override;
    int rate_override = 0;
    bool headless = false;
    bool start_now = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--device" && i + 1 < argc) {
            device_override = argv[++i];
        } else if (arg == "--rate" && i + 1 < argc) {
            rate_override = std::atoi(argv[++i]);
        } else if (arg == "--config" && i + 1 < argc) {
            settings_path = argv[++i];
        } else if (arg == "--start") {
            start_now = true;
        } else if (arg == "--headless") {
            headless = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 2;
        }
    }

    AppSettings settings;
    if (!load_settings(settings_path.c_str(), settings)) {
        std::cout << "No settings at " << settings_path << ", using defaults" << std::endl;
    }
    if (!device_override.empty()) settings.device_name = device_override;
    if (rate_override > 0) settings.sample_rate = rate_override;
    sanitize_settings(settings);

    if (headless) return run_headless(settings);

    MicvizGUI gui(settings, settings_path, start_now);
    return gui.run();
}
