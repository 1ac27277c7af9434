// Minimal, header-only command registry and command palette for ImGui
#pragma once

#include <imgui.h>
#include <algorithm>
#include <cctype>
#include <functional>
#include <string>
#include <vector>

namespace gui {

struct Command {
    std::string id;         // e.g., "audio.start"
    std::string label;
    std::string shortcut;   // display only, e.g., "Space"
    std::string group;      // "Audio", "View" or "Help"
    std::function<bool()> is_enabled; // optional; defaults to always true
    std::function<void()> action;     // required
};

class CommandRegistry {
public:
    void register_command(const Command& cmd) {
        Command c = cmd;
        if (!c.is_enabled) c.is_enabled = [] { return true; };
        commands_.push_back(c);
    }

    void draw_main_menu_bar() {
        for (const char* group : {"Audio", "View", "Help"}) {
            if (ImGui::BeginMenu(group)) {
                draw_group(group);
                ImGui::EndMenu();
            }
        }
    }

    // Call once per frame, before any window takes keyboard focus.
    void handle_shortcuts() {
        ImGuiIO& io = ImGui::GetIO();
        if (ImGui::IsAnyItemActive() || io.WantTextInput) return;

        const bool ctrl = (io.KeyMods & ImGuiMod_Ctrl) != 0;
        if (!ctrl && ImGui::IsKeyPressed(ImGuiKey_Space, false)) trigger_by_id("audio.toggle");
        if (ctrl && ImGui::IsKeyPressed(ImGuiKey_M, false)) trigger_by_id("audio.mic_setup");
        if (ctrl && ImGui::IsKeyPressed(ImGuiKey_P, false)) palette_open_ = true;
    }

    void open_palette() { palette_open_ = true; }
    bool is_palette_open() const { return palette_open_; }

    // Call each frame; renders when palette is open
    void render_command_palette(const char* title = "Command Palette") {
        if (!palette_open_) return;
        ImGui::SetNextWindowSize(ImVec2(480, 320), ImGuiCond_FirstUseEver);
        if (ImGui::Begin(title, &palette_open_)) {
            ImGui::PushItemWidth(-1.0f);
            if (ImGui::InputTextWithHint("##cmd_query", "Search...", palette_buf_, sizeof(palette_buf_))) {
                palette_query_ = palette_buf_;
            }
            ImGui::PopItemWidth();
            ImGui::Separator();

            const Command* first = nullptr;
            ImGui::BeginChild("##cmd_list");
            for (const auto& cmd : commands_) {
                if (!cmd.is_enabled() || !matches_query(cmd)) continue;
                if (!first) first = &cmd;
                std::string text = cmd.label;
                if (!cmd.shortcut.empty()) text += "\t" + cmd.shortcut;
                if (ImGui::Selectable(text.c_str())) {
                    run_and_close(cmd);
                    break;
                }
            }
            ImGui::EndChild();

            if (palette_open_ && first && ImGui::IsKeyPressed(ImGuiKey_Enter)) run_and_close(*first);
            if (ImGui::IsKeyPressed(ImGuiKey_Escape)) close_palette();
        }
        ImGui::End();
    }

    void trigger_by_id(const std::string& id) {
        for (const auto& c : commands_) {
            if (c.id == id) {
                if (c.is_enabled() && c.action) c.action();
                return;
            }
        }
    }

private:
    std::vector<Command> commands_;
    bool palette_open_ = false;
    std::string palette_query_;
    char palette_buf_[128] = {};

    void close_palette() {
        palette_open_ = false;
        palette_query_.clear();
        palette_buf_[0] = '\0';
    }

    void run_and_close(const Command& cmd) {
        auto action = cmd.action;
        close_palette();
        if (action) action();
    }

    void draw_group(const char* group) {
        for (const auto& c : commands_) {
            if (c.group != group) continue;
            bool enabled = c.is_enabled();
            if (ImGui::MenuItem(c.label.c_str(), c.shortcut.empty() ? nullptr : c.shortcut.c_str(), false, enabled)) {
                if (c.action) c.action();
            }
        }
    }

    bool matches_query(const Command& c) const {
        if (palette_query_.empty()) return true;
        std::string q = to_lower(palette_query_);
        return contains(to_lower(c.label), q) || contains(to_lower(c.group), q) || contains(to_lower(c.id), q);
    }

    static std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char ch){ return (char)std::tolower(ch); });
        return s;
    }

    static bool contains(const std::string& hay, const std::string& needle) {
        return hay.find(needle) != std::string::npos;
    }
};

} // namespace gui
