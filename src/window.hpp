#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "common.hpp"
#include "hyprland.hpp"
#include "niri.hpp"

// Foreground window lookup through the running compositor's IPC socket.
class Window {
  public:
    enum WM { NONE, NIRI, HYPRLAND };

    Window();

    FocusedWindow GetFocusedWindow();
    bool IsAvailable() const;
    WM GetWM() const;

    static FocusedWindow ParseNiriFocusedWindow(const nlohmann::json &reply);
    static FocusedWindow ParseHyprlandActiveWindow(const nlohmann::json &reply);

  private:
    WM m_WM = NONE;
    NiriIPC m_Niri;
    HyprlandIPC m_Hypr;
    bool m_WarnedOnce = false;
};
