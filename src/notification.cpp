#include "notification.hpp"

#include <spdlog/spdlog.h>

#include "json.hpp"

// ─────────────────────────────────────
Notification::Notification() {
    dbus_error_init(&m_Err);
    m_Conn = dbus_bus_get(DBUS_BUS_SESSION, &m_Err);
    if (dbus_error_is_set(&m_Err) || !m_Conn) {
        spdlog::error("Failed to connect to session bus: {}",
                      m_Err.message ? m_Err.message : "unknown error");
        dbus_error_free(&m_Err);
        m_Conn = nullptr;
        return;
    }
    // The daemon exits through its own signal handling, not libdbus.
    dbus_connection_set_exit_on_disconnect(m_Conn, FALSE);
}

// ─────────────────────────────────────
Notification::~Notification() {
    if (m_Conn) {
        dbus_connection_unref(m_Conn);
        m_Conn = nullptr;
    }

    if (dbus_error_is_set(&m_Err)) {
        dbus_error_free(&m_Err);
    }
}

// ─────────────────────────────────────
bool Notification::IsConnected() const {
    return m_Conn != nullptr;
}

// ─────────────────────────────────────
void Notification::SendNotification(const std::string &icon, const std::string &summary,
                                    const std::string &msg) {
    if (!m_Conn) {
        spdlog::debug("Notification skipped: no session bus");
        return;
    }

    int32_t timeout = static_cast<int32_t>(kRateLimit.count());
    const auto now = std::chrono::system_clock::now();
    if (now - m_LastNotification < kRateLimit) {
        spdlog::debug("Notification skipped: rate limit exceeded");
        return;
    }

    DBusMessage *msg_dbus = dbus_message_new_method_call("org.freedesktop.Notifications",
                                                         "/org/freedesktop/Notifications",
                                                         "org.freedesktop.Notifications", "Notify");
    if (!msg_dbus) {
        spdlog::error("Failed to create DBus message");
        return;
    }

    DBusMessageIter args;
    dbus_message_iter_init_append(msg_dbus, &args);

    const char *app_name = "Aura";
    uint32_t replaces_id = 0;
    const char *icon_cstr = icon.c_str();
    const char *summary_cstr = summary.c_str();
    const char *body = msg.c_str();

    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &app_name);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_UINT32, &replaces_id);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &icon_cstr);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &summary_cstr);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &body);

    DBusMessageIter array;
    dbus_message_iter_open_container(&args, DBUS_TYPE_ARRAY, "s", &array);
    dbus_message_iter_close_container(&args, &array);

    DBusMessageIter dict;
    dbus_message_iter_open_container(&args, DBUS_TYPE_ARRAY, "{sv}", &dict);
    dbus_message_iter_close_container(&args, &dict);

    dbus_message_iter_append_basic(&args, DBUS_TYPE_INT32, &timeout);

    if (!dbus_connection_send(m_Conn, msg_dbus, nullptr)) {
        spdlog::error("Failed to send DBus message");
        dbus_message_unref(msg_dbus);
        return;
    }
    dbus_connection_flush(m_Conn);

    dbus_message_unref(msg_dbus);
    m_LastNotification = now;
}

// ─────────────────────────────────────
// "3 min", "45 s", "1 min 30 s"
static std::string FormatDuration(int seconds) {
    if (seconds < 60) {
        return std::to_string(seconds) + " s";
    }
    std::string out = std::to_string(seconds / 60) + " min";
    if (seconds % 60 != 0) {
        out += " " + std::to_string(seconds % 60) + " s";
    }
    return out;
}

// ─────────────────────────────────────
std::optional<Notification::Message> Notification::FormatEvent(const Event &ev) {
    JsonParse parse;
    Message m;

    if (ev.type == EventType::BREAK_DUE) {
        const std::string kind = parse.GetString(ev.data, "break_type", "micro");
        const int duration = parse.GetInt(ev.data, "duration_seconds", 0);
        if (kind == "hydration") {
            m.icon = "dialog-information";
            m.summary = "Hydration";
            m.body = "Time for a glass of water.";
        } else if (kind == "macro") {
            m.icon = "appointment-soon";
            m.summary = "Stretch break";
            m.body = "Stand up and move for " + FormatDuration(duration) + ".";
        } else {
            m.icon = "appointment-soon";
            m.summary = "Eye break";
            m.body = "Look at something far away for " + std::to_string(duration) + " s.";
        }
        return m;
    }

    if (ev.type == EventType::SCHEDULE_WARNING) {
        m.icon = "alarm";
        m.summary = parse.GetString(ev.data, "title", "Scheduled action");
        m.body = "Runs at " + parse.GetString(ev.data, "time", "") + " (in " +
                 std::to_string(parse.GetInt(ev.data, "seconds_remaining", 60)) + " s).";
        return m;
    }

    return std::nullopt;
}

// ─────────────────────────────────────
void Notification::OnEvent(const Event &ev) {
    auto m = FormatEvent(ev);
    if (!m) {
        return;
    }
    SendNotification(m->icon, m->summary, m->body);
}
