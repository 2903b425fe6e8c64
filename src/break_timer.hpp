#pragma once

#include <array>
#include <cstdint>
#include <optional>

#include <nlohmann/json.hpp>

#include "common.hpp"

class BreakTimer {
  public:
    BreakTimer(BreakKind kind, int interval_seconds, int duration_seconds);

    BreakKind Kind() const;
    int Interval() const;
    int Duration() const;
    double Elapsed() const;
    double Remaining() const;
    double Progress() const;
    BreakPhase Phase() const;
    int64_t RecordId() const;
    int FiredDuration() const;

    void Advance(double delta_seconds);
    bool IsDue() const;
    bool IsPending() const;
    // Zeroes elapsed. A timer that is not pending also drops its snoozed log row and goes idle.
    void Reset();

    // New interval/duration take effect for the next occurrence; elapsed is kept.
    void Reload(int interval_seconds, int duration_seconds);
    void ReloadAndReset(int interval_seconds, int duration_seconds);

    void Fire(int64_t record_id);
    void Snooze(int minutes);
    void Resolve();

    // Holds elapsed at zero (hydration auto-silence).
    void Hold();

    TimerCheckpoint Checkpoint() const;
    void Restore(const TimerCheckpoint &cp);

  private:
    BreakKind m_Kind;
    int m_Interval;
    int m_Duration;
    int m_FiredDuration = 0;
    double m_Elapsed = 0.0;
    BreakPhase m_Phase = BreakPhase::IDLE;
    int64_t m_RecordId = 0;
};

struct PendingBreak {
    BreakKind kind = BreakKind::MICRO;
    int duration_seconds = 0;
    int64_t record_id = 0;
};

// The micro, macro and hydration timers. At most one break is pending at a time and
// every timer is frozen while it is.
class BreakTimerSet {
  public:
    BreakTimerSet();

    BreakTimer &Get(BreakKind kind);
    const BreakTimer &Get(BreakKind kind) const;

    void SetMode(TimerMode mode);
    TimerMode Mode() const;

    void SetHydrationSilenced(bool silenced);
    bool HydrationSilenced() const;

    void Reload(BreakKind kind, int interval_seconds, int duration_seconds);
    void ReloadAndReset(BreakKind kind, int interval_seconds, int duration_seconds);

    // Advances the timers allowed to run and returns the highest-priority timer that is due.
    std::optional<BreakKind> Advance(double delta_seconds, SessionState session,
                                     bool reminders_paused, ActivityState activity);

    std::optional<PendingBreak> Pending() const;
    void Fire(BreakKind kind, int64_t record_id);

    // Each returns the break it resolved, or nullopt when nothing is pending.
    std::optional<PendingBreak> Complete();
    std::optional<PendingBreak> Snooze(int minutes);
    std::optional<PendingBreak> Skip();

    // Zeroes every timer. A pending break survives unless clear_pending is set.
    void ResetAll(bool clear_pending);

    std::array<TimerCheckpoint, 3> Checkpoints() const;
    void Restore(const TimerCheckpoint &cp);

    nlohmann::json StatusJson() const;
    nlohmann::json NextBreakJson() const;

  private:
    static std::size_t Index(BreakKind kind);
    nlohmann::json TimerJson(const BreakTimer &timer) const;

    std::array<BreakTimer, 3> m_Timers;
    TimerMode m_Mode = TimerMode::WALL_CLOCK;
    bool m_HydrationSilenced = false;
};
