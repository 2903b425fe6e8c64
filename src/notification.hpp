#pragma once

#include <dbus/dbus.h>

#include <chrono>
#include <optional>
#include <string>

#include "gateway.hpp"

// freedesktop desktop notifications over the session bus.
class Notification {
  public:
    struct Message {
        std::string icon;
        std::string summary;
        std::string body;
    };

    Notification();
    ~Notification();

    Notification(const Notification &) = delete;
    Notification &operator=(const Notification &) = delete;

    bool IsConnected() const;
    void SendNotification(const std::string &icon, const std::string &summary,
                          const std::string &msg);

    // Mirrors break_due and schedule_warning events; everything else is ignored.
    void OnEvent(const Event &ev);

    static std::optional<Message> FormatEvent(const Event &ev);

  private:
    DBusError m_Err;
    DBusConnection *m_Conn = nullptr;
    std::chrono::time_point<std::chrono::system_clock> m_LastNotification;

    static constexpr std::chrono::milliseconds kRateLimit{3000};
};
