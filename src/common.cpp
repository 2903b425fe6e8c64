#include "common.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <ctime>

// ─────────────────────────────────────
const char *ToString(ActivityState state) {
    switch (state) {
    case ActivityState::ACTIVE:
        return "active";
    case ActivityState::IDLE:
        return "idle";
    case ActivityState::IMMERSIVE:
        return "immersive";
    }
    return "active";
}

// ─────────────────────────────────────
const char *ToString(BreakKind kind) {
    switch (kind) {
    case BreakKind::MICRO:
        return "micro";
    case BreakKind::MACRO:
        return "macro";
    case BreakKind::HYDRATION:
        return "hydration";
    }
    return "micro";
}

// ─────────────────────────────────────
const char *ToString(BreakPhase phase) {
    switch (phase) {
    case BreakPhase::IDLE:
        return "idle";
    case BreakPhase::FIRED_PENDING:
        return "fired_pending";
    case BreakPhase::RESOLVED:
        return "resolved";
    }
    return "idle";
}

// ─────────────────────────────────────
const char *ToString(SessionState state) {
    switch (state) {
    case SessionState::IDLE:
        return "idle";
    case SessionState::ACTIVE:
        return "active";
    case SessionState::PAUSED:
        return "paused";
    }
    return "idle";
}

// ─────────────────────────────────────
const char *ToString(TimerMode mode) {
    switch (mode) {
    case TimerMode::ACTIVE_TIME:
        return "active";
    case TimerMode::WALL_CLOCK:
        return "wall-clock";
    }
    return "wall-clock";
}

// ─────────────────────────────────────
const char *ToString(ScheduleAction action) {
    switch (action) {
    case ScheduleAction::PAUSE:
        return "pause";
    case ScheduleAction::RESUME:
        return "resume";
    case ScheduleAction::RESET:
        return "reset";
    case ScheduleAction::START_SESSION:
        return "start_session";
    case ScheduleAction::END_SESSION:
        return "end_session";
    }
    return "pause";
}

// ─────────────────────────────────────
std::optional<BreakKind> BreakKindFromString(const std::string &s) {
    if (s == "micro") {
        return BreakKind::MICRO;
    }
    if (s == "macro") {
        return BreakKind::MACRO;
    }
    if (s == "hydration") {
        return BreakKind::HYDRATION;
    }
    return std::nullopt;
}

// ─────────────────────────────────────
std::optional<BreakPhase> BreakPhaseFromString(const std::string &s) {
    if (s == "idle") {
        return BreakPhase::IDLE;
    }
    if (s == "fired_pending") {
        return BreakPhase::FIRED_PENDING;
    }
    if (s == "resolved") {
        return BreakPhase::RESOLVED;
    }
    return std::nullopt;
}

// ─────────────────────────────────────
std::optional<SessionState> SessionStateFromString(const std::string &s) {
    if (s == "idle") {
        return SessionState::IDLE;
    }
    if (s == "active") {
        return SessionState::ACTIVE;
    }
    if (s == "paused") {
        return SessionState::PAUSED;
    }
    return std::nullopt;
}

// ─────────────────────────────────────
std::optional<TimerMode> TimerModeFromString(const std::string &s) {
    if (s == "active") {
        return TimerMode::ACTIVE_TIME;
    }
    if (s == "wall-clock") {
        return TimerMode::WALL_CLOCK;
    }
    return std::nullopt;
}

// ─────────────────────────────────────
std::optional<ScheduleAction> ScheduleActionFromString(const std::string &s) {
    if (s == "pause") {
        return ScheduleAction::PAUSE;
    }
    if (s == "resume") {
        return ScheduleAction::RESUME;
    }
    if (s == "reset") {
        return ScheduleAction::RESET;
    }
    if (s == "start_session") {
        return ScheduleAction::START_SESSION;
    }
    if (s == "end_session") {
        return ScheduleAction::END_SESSION;
    }
    return std::nullopt;
}

// ─────────────────────────────────────
const char *ThemeColor(BreakKind kind) {
    switch (kind) {
    case BreakKind::MICRO:
        return "#10B981";
    case BreakKind::MACRO:
        return "#F59E0B";
    case BreakKind::HYDRATION:
        return "#3B82F6";
    }
    return "#10B981";
}

// ─────────────────────────────────────
double NowUnix() {
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ─────────────────────────────────────
LocalTime ToLocalTime(double unixTime) {
    const std::time_t t = static_cast<std::time_t>(std::floor(unixTime));
    std::tm tm{};
    localtime_r(&t, &tm);

    LocalTime lt;
    lt.year = tm.tm_year + 1900;
    lt.month = tm.tm_mon + 1;
    lt.day = tm.tm_mday;
    lt.hour = tm.tm_hour;
    lt.minute = tm.tm_min;
    lt.second = tm.tm_sec;
    // tm_wday counts from sunday
    lt.weekday = (tm.tm_wday + 6) % 7;
    return lt;
}

// ─────────────────────────────────────
const char *WeekdayName(int weekday) {
    static const char *kNames[] = {"mon", "tue", "wed", "thu", "fri", "sat", "sun"};
    if (weekday < 0 || weekday > 6) {
        return "mon";
    }
    return kNames[weekday];
}

// ─────────────────────────────────────
double LocalDayStart(double unixTime) {
    const std::time_t t = static_cast<std::time_t>(std::floor(unixTime));
    std::tm tm{};
    localtime_r(&t, &tm);
    tm.tm_hour = 0;
    tm.tm_min = 0;
    tm.tm_sec = 0;
    tm.tm_isdst = -1;
    return static_cast<double>(std::mktime(&tm));
}

// ─────────────────────────────────────
double NextLocalDayStart(double unixTime) {
    const std::time_t t = static_cast<std::time_t>(std::floor(unixTime));
    std::tm tm{};
    localtime_r(&t, &tm);
    tm.tm_mday += 1;
    tm.tm_hour = 0;
    tm.tm_min = 0;
    tm.tm_sec = 0;
    tm.tm_isdst = -1;
    return static_cast<double>(std::mktime(&tm));
}

// ─────────────────────────────────────
std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
