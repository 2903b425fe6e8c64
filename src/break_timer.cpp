#include "break_timer.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
BreakTimer::BreakTimer(BreakKind kind, int interval_seconds, int duration_seconds)
    : m_Kind(kind), m_Interval(interval_seconds), m_Duration(duration_seconds) {}

// ─────────────────────────────────────
BreakKind BreakTimer::Kind() const {
    return m_Kind;
}

// ─────────────────────────────────────
int BreakTimer::Interval() const {
    return m_Interval;
}

// ─────────────────────────────────────
int BreakTimer::Duration() const {
    return m_Duration;
}

// ─────────────────────────────────────
double BreakTimer::Elapsed() const {
    return m_Elapsed;
}

// ─────────────────────────────────────
double BreakTimer::Remaining() const {
    return std::max(0.0, static_cast<double>(m_Interval) - m_Elapsed);
}

// ─────────────────────────────────────
double BreakTimer::Progress() const {
    if (m_Interval <= 0) {
        return 1.0;
    }
    return std::clamp(m_Elapsed / static_cast<double>(m_Interval), 0.0, 1.0);
}

// ─────────────────────────────────────
BreakPhase BreakTimer::Phase() const {
    return m_Phase;
}

// ─────────────────────────────────────
int64_t BreakTimer::RecordId() const {
    return m_RecordId;
}

// ─────────────────────────────────────
int BreakTimer::FiredDuration() const {
    return m_FiredDuration;
}

// ─────────────────────────────────────
void BreakTimer::Advance(double delta_seconds) {
    if (m_Phase == BreakPhase::FIRED_PENDING || delta_seconds <= 0.0) {
        return;
    }
    m_Elapsed += delta_seconds;
}

// ─────────────────────────────────────
bool BreakTimer::IsDue() const {
    return m_Phase != BreakPhase::FIRED_PENDING && m_Elapsed >= static_cast<double>(m_Interval);
}

// ─────────────────────────────────────
bool BreakTimer::IsPending() const {
    return m_Phase == BreakPhase::FIRED_PENDING;
}

// ─────────────────────────────────────
void BreakTimer::Reset() {
    m_Elapsed = 0.0;
    if (m_Phase != BreakPhase::FIRED_PENDING) {
        m_Phase = BreakPhase::IDLE;
        m_RecordId = 0;
    }
}

// ─────────────────────────────────────
void BreakTimer::Reload(int interval_seconds, int duration_seconds) {
    m_Interval = interval_seconds;
    m_Duration = duration_seconds;
}

// ─────────────────────────────────────
void BreakTimer::ReloadAndReset(int interval_seconds, int duration_seconds) {
    Reload(interval_seconds, duration_seconds);
    Reset();
}

// ─────────────────────────────────────
void BreakTimer::Fire(int64_t record_id) {
    m_Phase = BreakPhase::FIRED_PENDING;
    m_RecordId = record_id;
    m_FiredDuration = m_Duration;
}

// ─────────────────────────────────────
void BreakTimer::Snooze(int minutes) {
    // The log row stays open so the next fire reuses it.
    m_Elapsed = std::max(0.0, static_cast<double>(m_Interval) - minutes * 60.0);
    m_Phase = BreakPhase::RESOLVED;
}

// ─────────────────────────────────────
void BreakTimer::Resolve() {
    m_Elapsed = 0.0;
    m_Phase = BreakPhase::RESOLVED;
    m_RecordId = 0;
}

// ─────────────────────────────────────
void BreakTimer::Hold() {
    if (m_Phase != BreakPhase::FIRED_PENDING) {
        Reset();
    }
}

// ─────────────────────────────────────
TimerCheckpoint BreakTimer::Checkpoint() const {
    TimerCheckpoint cp;
    cp.kind = m_Kind;
    cp.elapsed = m_Elapsed;
    cp.phase = m_Phase;
    cp.record_id = m_RecordId;
    return cp;
}

// ─────────────────────────────────────
void BreakTimer::Restore(const TimerCheckpoint &cp) {
    m_Elapsed = std::max(0.0, cp.elapsed);
    m_Phase = cp.phase;
    m_RecordId = cp.record_id;
    if (m_Phase == BreakPhase::FIRED_PENDING) {
        m_FiredDuration = m_Duration;
    }
}

// ─────────────────────────────────────
BreakTimerSet::BreakTimerSet()
    : m_Timers{BreakTimer(BreakKind::MICRO, 1200, 20), BreakTimer(BreakKind::MACRO, 2700, 180),
               BreakTimer(BreakKind::HYDRATION, 1800, 0)} {}

// ─────────────────────────────────────
std::size_t BreakTimerSet::Index(BreakKind kind) {
    switch (kind) {
    case BreakKind::MICRO:
        return 0;
    case BreakKind::MACRO:
        return 1;
    case BreakKind::HYDRATION:
        return 2;
    }
    return 0;
}

// ─────────────────────────────────────
BreakTimer &BreakTimerSet::Get(BreakKind kind) {
    return m_Timers[Index(kind)];
}

// ─────────────────────────────────────
const BreakTimer &BreakTimerSet::Get(BreakKind kind) const {
    return m_Timers[Index(kind)];
}

// ─────────────────────────────────────
void BreakTimerSet::SetMode(TimerMode mode) {
    m_Mode = mode;
}

// ─────────────────────────────────────
TimerMode BreakTimerSet::Mode() const {
    return m_Mode;
}

// ─────────────────────────────────────
void BreakTimerSet::SetHydrationSilenced(bool silenced) {
    if (silenced != m_HydrationSilenced) {
        spdlog::info("Hydration reminders {}", silenced ? "silenced (daily goal reached)"
                                                        : "active again");
    }
    m_HydrationSilenced = silenced;
    if (silenced) {
        Get(BreakKind::HYDRATION).Hold();
    }
}

// ─────────────────────────────────────
bool BreakTimerSet::HydrationSilenced() const {
    return m_HydrationSilenced;
}

// ─────────────────────────────────────
void BreakTimerSet::Reload(BreakKind kind, int interval_seconds, int duration_seconds) {
    Get(kind).Reload(interval_seconds, duration_seconds);
}

// ─────────────────────────────────────
void BreakTimerSet::ReloadAndReset(BreakKind kind, int interval_seconds, int duration_seconds) {
    Get(kind).ReloadAndReset(interval_seconds, duration_seconds);
}

// ─────────────────────────────────────
std::optional<BreakKind> BreakTimerSet::Advance(double delta_seconds, SessionState session,
                                                bool reminders_paused, ActivityState activity) {
    if (Pending()) {
        return std::nullopt;
    }
    if (session != SessionState::ACTIVE || reminders_paused) {
        return std::nullopt;
    }

    bool run = true;
    if (m_Mode == TimerMode::ACTIVE_TIME && activity != ActivityState::ACTIVE) {
        run = false;
    }

    for (auto &timer : m_Timers) {
        if (timer.Kind() == BreakKind::HYDRATION && m_HydrationSilenced) {
            timer.Hold();
            continue;
        }
        if (run) {
            timer.Advance(delta_seconds);
        }
    }

    if (m_Mode == TimerMode::ACTIVE_TIME && activity == ActivityState::IMMERSIVE) {
        return std::nullopt;
    }

    for (BreakKind kind : kBreakKinds) {
        if (kind == BreakKind::HYDRATION && m_HydrationSilenced) {
            continue;
        }
        if (Get(kind).IsDue()) {
            return kind;
        }
    }
    return std::nullopt;
}

// ─────────────────────────────────────
std::optional<PendingBreak> BreakTimerSet::Pending() const {
    for (const auto &timer : m_Timers) {
        if (timer.IsPending()) {
            PendingBreak p;
            p.kind = timer.Kind();
            p.duration_seconds = timer.FiredDuration();
            p.record_id = timer.RecordId();
            return p;
        }
    }
    return std::nullopt;
}

// ─────────────────────────────────────
void BreakTimerSet::Fire(BreakKind kind, int64_t record_id) {
    if (Pending()) {
        spdlog::warn("Refusing to fire {} break: another break is pending", ToString(kind));
        return;
    }
    Get(kind).Fire(record_id);
}

// ─────────────────────────────────────
std::optional<PendingBreak> BreakTimerSet::Complete() {
    auto pending = Pending();
    if (!pending) {
        return std::nullopt;
    }
    Get(pending->kind).Resolve();
    if (pending->kind == BreakKind::MACRO) {
        Get(BreakKind::MICRO).Reset();
    }
    return pending;
}

// ─────────────────────────────────────
std::optional<PendingBreak> BreakTimerSet::Snooze(int minutes) {
    auto pending = Pending();
    if (!pending) {
        return std::nullopt;
    }
    Get(pending->kind).Snooze(minutes);
    return pending;
}

// ─────────────────────────────────────
std::optional<PendingBreak> BreakTimerSet::Skip() {
    auto pending = Pending();
    if (!pending) {
        return std::nullopt;
    }
    Get(pending->kind).Resolve();
    return pending;
}

// ─────────────────────────────────────
void BreakTimerSet::ResetAll(bool clear_pending) {
    for (auto &timer : m_Timers) {
        if (timer.IsPending()) {
            if (!clear_pending) {
                continue;
            }
            TimerCheckpoint cp = timer.Checkpoint();
            cp.phase = BreakPhase::IDLE;
            cp.elapsed = 0.0;
            cp.record_id = 0;
            timer.Restore(cp);
            continue;
        }
        timer.Reset();
    }
}

// ─────────────────────────────────────
std::array<TimerCheckpoint, 3> BreakTimerSet::Checkpoints() const {
    return {m_Timers[0].Checkpoint(), m_Timers[1].Checkpoint(), m_Timers[2].Checkpoint()};
}

// ─────────────────────────────────────
void BreakTimerSet::Restore(const TimerCheckpoint &cp) {
    if (cp.phase == BreakPhase::FIRED_PENDING) {
        auto pending = Pending();
        if (pending && pending->kind != cp.kind) {
            spdlog::warn("Checkpoint has a second pending break ({}); dropping it",
                         ToString(cp.kind));
            TimerCheckpoint fixed = cp;
            fixed.phase = BreakPhase::IDLE;
            Get(cp.kind).Restore(fixed);
            return;
        }
    }
    Get(cp.kind).Restore(cp);
}

// ─────────────────────────────────────
nlohmann::json BreakTimerSet::TimerJson(const BreakTimer &timer) const {
    nlohmann::json j;
    j["interval_seconds"] = timer.Interval();
    j["duration_seconds"] = timer.Duration();
    j["elapsed_seconds"] = timer.Elapsed();
    j["remaining_seconds"] = static_cast<int>(std::floor(timer.Remaining()));
    j["progress"] = timer.Progress();
    j["theme_color"] = ThemeColor(timer.Kind());
    j["timer_mode"] = ToString(m_Mode);
    j["phase"] = ToString(timer.Phase());
    j["is_due"] = timer.IsDue() && !(timer.Kind() == BreakKind::HYDRATION && m_HydrationSilenced);
    if (timer.Kind() == BreakKind::HYDRATION) {
        j["silenced"] = m_HydrationSilenced;
    }
    return j;
}

// ─────────────────────────────────────
nlohmann::json BreakTimerSet::StatusJson() const {
    nlohmann::json j;
    j["timer_mode"] = ToString(m_Mode);
    nlohmann::json timers = nlohmann::json::object();
    for (const auto &timer : m_Timers) {
        timers[ToString(timer.Kind())] = TimerJson(timer);
    }
    j["timers"] = timers;

    auto pending = Pending();
    if (pending) {
        j["pending_break"] = {{"break_type", ToString(pending->kind)},
                              {"duration_seconds", pending->duration_seconds},
                              {"theme_color", ThemeColor(pending->kind)},
                              {"record_id", pending->record_id}};
    } else {
        j["pending_break"] = nullptr;
    }
    return j;
}

// ─────────────────────────────────────
nlohmann::json BreakTimerSet::NextBreakJson() const {
    const BreakTimer *next = nullptr;
    for (BreakKind kind : kBreakKinds) {
        if (kind == BreakKind::HYDRATION && m_HydrationSilenced) {
            continue;
        }
        const BreakTimer &timer = Get(kind);
        if (next == nullptr || timer.Remaining() < next->Remaining()) {
            next = &timer;
        }
    }
    if (next == nullptr) {
        return nullptr;
    }

    nlohmann::json j;
    j["type"] = ToString(next->Kind());
    j["remaining_seconds"] = static_cast<int>(std::floor(next->Remaining()));
    j["duration_seconds"] = next->Duration();
    j["theme_color"] = ThemeColor(next->Kind());
    j["timer_mode"] = ToString(m_Mode);
    return j;
}
