#include "mic_setup.hpp"
#include <imgui.h>
#include <alsa/asoundlib.h>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace gui {

static int device_rank(const std::string& name) {
    if (name == "default") return 0;
    if (name.rfind("plughw:", 0) == 0) return 1;
    if (name.rfind("hw:", 0) == 0) return 2;
    return -1;
}

std::vector<MicDeviceInfo> list_capture_devices() {
    std::vector<MicDeviceInfo> out;
    void** hints = nullptr;
    if (snd_device_name_hint(-1, "pcm", &hints) != 0 || !hints) return out;

    for (void** n = hints; *n != nullptr; ++n) {
        char* name = snd_device_name_get_hint(*n, "NAME");
        char* ioid = snd_device_name_get_hint(*n, "IOID");
        char* desc = snd_device_name_get_hint(*n, "DESC");
        // IOID is absent for pcms that do both directions
        const bool capture = name && (!ioid || std::strcmp(ioid, "Input") == 0);
        if (capture && device_rank(name) >= 0) {
            MicDeviceInfo d;
            d.name = name;
            d.desc = desc ? desc : "";
            std::replace(d.desc.begin(), d.desc.end(), '\n', ' ');
            out.push_back(d);
        }
        std::free(name);
        std::free(ioid);
        std::free(desc);
    }
    snd_device_name_free_hint(hints);

    std::stable_sort(out.begin(), out.end(), [](const MicDeviceInfo& a, const MicDeviceInfo& b) {
        return device_rank(a.name) < device_rank(b.name);
    });
    return out;
}

bool render_mic_setup_window(std::string& selected_device, bool& open, const MicSetupView& view) {
    if (!open) return false;
    bool applied = false;

    ImGui::SetNextWindowSize(ImVec2(520, 400), ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Microphone Setup", &open)) {
        static std::vector<MicDeviceInfo> devices;
        static bool scanned = false;
        if (!scanned || ImGui::Button("Rescan")) {
            devices = list_capture_devices();
            scanned = true;
        }
        ImGui::SameLine();
        ImGui::TextDisabled("%d capture device(s)", (int)devices.size());

        const ImGuiTableFlags tflags = ImGuiTableFlags_RowBg | ImGuiTableFlags_BordersInnerV |
                                       ImGuiTableFlags_ScrollY | ImGuiTableFlags_SizingStretchProp;
        if (ImGui::BeginTable("##mic_devices", 2, tflags, ImVec2(-FLT_MIN, 200))) {
            ImGui::TableSetupScrollFreeze(0, 1);
            ImGui::TableSetupColumn("Device", ImGuiTableColumnFlags_WidthStretch, 0.45f);
            ImGui::TableSetupColumn("Description", ImGuiTableColumnFlags_WidthStretch, 0.55f);
            ImGui::TableHeadersRow();
            for (const auto& d : devices) {
                ImGui::TableNextRow();
                ImGui::TableSetColumnIndex(0);
                std::string label = d.name;
                if (d.name == view.active_device) label += view.recording ? "  (in use)" : "  (last used)";
                if (ImGui::Selectable(label.c_str(), d.name == selected_device,
                                      ImGuiSelectableFlags_SpanAllColumns)) {
                    selected_device = d.name;
                }
                ImGui::TableSetColumnIndex(1);
                ImGui::TextDisabled("%s", d.desc.c_str());
            }
            ImGui::EndTable();
        }
        if (devices.empty()) ImGui::TextDisabled("No capture devices reported by ALSA");

        ImGui::Separator();
        const bool changed = selected_device != view.active_device;
        ImGui::BeginDisabled(selected_device.empty() || !changed);
        if (ImGui::Button(view.recording ? "Switch Device" : "Use Device")) applied = true;
        ImGui::EndDisabled();
        ImGui::SameLine();
        if (ImGui::Button("Close")) open = false;

        ImGui::Separator();
        if (view.recording) {
            char overlay[32];
            std::snprintf(overlay, sizeof(overlay), "%.1f dB", view.level_db);
            ImGui::TextUnformatted("Input level");
            ImGui::ProgressBar(std::clamp(view.level01, 0.0f, 1.0f), ImVec2(-FLT_MIN, 16.0f), overlay);
        } else {
            ImGui::TextDisabled("Start recording to see the input level");
        }
    }
    ImGui::End();
    return applied;
}

}
