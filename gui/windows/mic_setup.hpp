#pragma once

#include <string>
#include <vector>

namespace gui {

struct MicDeviceInfo {
    std::string name;   // ALSA pcm name, e.g. plughw:CARD=PCH,DEV=0
    std::string desc;   // card description from the hint, may span lines
};

// ALSA capture-capable pcms: "default" first, then plughw:, then hw:
std::vector<MicDeviceInfo> list_capture_devices();

struct MicSetupView {
    std::string active_device;  // device the running (or last) session used
    bool recording = false;
    float level01 = 0.0f;       // meter position
    float level_db = -100.0f;
};

// Returns true when the user applied a new device; it is written to
// selected_device.
bool render_mic_setup_window(std::string& selected_device, bool& open, const MicSetupView& view);

}
