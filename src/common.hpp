#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#ifndef AURA_VERSION
#define AURA_VERSION "0.0.0"
#endif

enum LogLevel { LOG_DEBUG, LOG_INFO, LOG_OFF };

enum class ActivityState { ACTIVE, IDLE, IMMERSIVE };

enum class BreakKind { MICRO, MACRO, HYDRATION };

// Priority order used when several timers are due in the same tick.
inline constexpr BreakKind kBreakKinds[] = {BreakKind::MACRO, BreakKind::MICRO,
                                            BreakKind::HYDRATION};

enum class BreakPhase { IDLE, FIRED_PENDING, RESOLVED };

enum class BreakResolution { COMPLETED, SKIPPED, SNOOZED };

enum class SessionState { IDLE, ACTIVE, PAUSED };

enum class TimerMode { ACTIVE_TIME, WALL_CLOCK };

enum class ScheduleAction { PAUSE, RESUME, RESET, START_SESSION, END_SESSION };

struct FocusedWindow {
    int window_id = -1;
    std::string title;
    std::string app_id;
    bool fullscreen = false;
    bool valid = false;
};

struct ActivitySnapshot {
    double mouse_velocity = 0.0;
    int keys_per_minute = 0;
    int clicks_per_minute = 0;
    int scrolls_per_minute = 0;
    int active_seconds = 0;
    int idle_seconds = 0;
    ActivityState state = ActivityState::ACTIVE;
    std::string foreground_app;
    bool is_fullscreen = false;
};

struct BreakLog {
    int64_t id = 0;
    double timestamp = 0.0;
    BreakKind kind = BreakKind::MICRO;
    int duration_seconds = 0;
    bool completed = false;
    bool skipped = false;
    bool snoozed = false;
};

struct HydrationLog {
    int64_t id = 0;
    double timestamp = 0.0;
    int amount_ml = 0;
};

struct ScheduleRule {
    int64_t id = 0;
    std::string title;
    std::string time; // "HH:MM"
    ScheduleAction action = ScheduleAction::PAUSE;
    std::vector<std::string> days; // "mon".."sun"
    bool enabled = true;
    double created_at = 0.0;
};

struct TimerCheckpoint {
    BreakKind kind = BreakKind::MICRO;
    double elapsed = 0.0;
    BreakPhase phase = BreakPhase::IDLE;
    int64_t record_id = 0;
};

// Broken-down local time. weekday: 0 = monday ... 6 = sunday.
struct LocalTime {
    int year = 1970;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int weekday = 0;
};

const char *ToString(ActivityState state);
const char *ToString(BreakKind kind);
const char *ToString(BreakPhase phase);
const char *ToString(SessionState state);
const char *ToString(TimerMode mode);
const char *ToString(ScheduleAction action);

std::optional<BreakKind> BreakKindFromString(const std::string &s);
std::optional<BreakPhase> BreakPhaseFromString(const std::string &s);
std::optional<SessionState> SessionStateFromString(const std::string &s);
std::optional<TimerMode> TimerModeFromString(const std::string &s);
std::optional<ScheduleAction> ScheduleActionFromString(const std::string &s);

const char *ThemeColor(BreakKind kind);

double NowUnix();
LocalTime ToLocalTime(double unixTime);
const char *WeekdayName(int weekday);

// Unix time of local midnight for the day containing unixTime, and of the following midnight.
double LocalDayStart(double unixTime);
double NextLocalDayStart(double unixTime);

std::string ToLower(std::string s);
