#include "window.hpp"

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
Window::Window() {
    if (m_Niri.IsAvailable()) {
        m_WM = NIRI;
        spdlog::info("Window manager detected: NIRI");
    } else if (m_Hypr.IsAvailable()) {
        m_WM = HYPRLAND;
        spdlog::info("Window manager detected: HYPRLAND");
    } else {
        m_WM = NONE;
        spdlog::warn("No supported compositor found; foreground app and fullscreen detection "
                     "are disabled");
    }
}

// ─────────────────────────────────────
bool Window::IsAvailable() const {
    return m_WM != NONE;
}

// ─────────────────────────────────────
Window::WM Window::GetWM() const {
    return m_WM;
}

// ─────────────────────────────────────
FocusedWindow Window::ParseNiriFocusedWindow(const nlohmann::json &reply) {
    FocusedWindow focus;
    // {"Ok":{"FocusedWindow":{...}}} or {"Ok":{"FocusedWindow":null}}
    if (!reply.is_object() || !reply.contains("Ok")) {
        return focus;
    }
    const auto &ok = reply["Ok"];
    if (!ok.is_object() || !ok.contains("FocusedWindow")) {
        return focus;
    }
    const auto &w = ok["FocusedWindow"];
    if (!w.is_object()) {
        return focus;
    }

    if (w.contains("id") && w["id"].is_number_integer()) {
        focus.window_id = w["id"].get<int>();
    }
    if (w.contains("title") && w["title"].is_string()) {
        focus.title = w["title"].get<std::string>();
    }
    if (w.contains("app_id") && w["app_id"].is_string()) {
        focus.app_id = w["app_id"].get<std::string>();
    }
    if (w.contains("is_fullscreen") && w["is_fullscreen"].is_boolean()) {
        focus.fullscreen = w["is_fullscreen"].get<bool>();
    }
    focus.valid = true;
    return focus;
}

// ─────────────────────────────────────
FocusedWindow Window::ParseHyprlandActiveWindow(const nlohmann::json &reply) {
    FocusedWindow focus;
    if (!reply.is_object() || reply.empty()) {
        return focus;
    }

    if (reply.contains("class") && reply["class"].is_string()) {
        focus.app_id = reply["class"].get<std::string>();
    }
    if (reply.contains("title") && reply["title"].is_string()) {
        focus.title = reply["title"].get<std::string>();
    }

    // Older releases report a bool, newer ones a mode bitmask (2 = real fullscreen).
    if (reply.contains("fullscreen")) {
        const auto &fs = reply["fullscreen"];
        if (fs.is_boolean()) {
            focus.fullscreen = fs.get<bool>();
        } else if (fs.is_number_integer()) {
            focus.fullscreen = (fs.get<int>() & 2) != 0;
        }
    }
    if (!focus.fullscreen && reply.contains("fullscreenMode") &&
        reply["fullscreenMode"].is_number_integer()) {
        focus.fullscreen = (reply["fullscreenMode"].get<int>() & 2) != 0;
    }

    focus.valid = !focus.app_id.empty() || !focus.title.empty();
    return focus;
}

// ─────────────────────────────────────
FocusedWindow Window::GetFocusedWindow() {
    switch (m_WM) {
    case NIRI: {
        auto reply = m_Niri.SendEnumRequest("FocusedWindow");
        if (!reply) {
            if (!m_WarnedOnce) {
                spdlog::warn("niri did not answer the FocusedWindow request");
                m_WarnedOnce = true;
            }
            return {};
        }
        m_WarnedOnce = false;
        return ParseNiriFocusedWindow(*reply);
    }
    case HYPRLAND: {
        auto reply = m_Hypr.SendJsonRequest("activewindow");
        if (!reply) {
            if (!m_WarnedOnce) {
                spdlog::warn("Hyprland did not answer the activewindow request");
                m_WarnedOnce = true;
            }
            return {};
        }
        m_WarnedOnce = false;
        return ParseHyprlandActiveWindow(*reply);
    }
    case NONE:
    default:
        return {};
    }
}
