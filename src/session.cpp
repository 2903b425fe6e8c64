#include "session.hpp"

#include <cstdlib>

#include <spdlog/spdlog.h>

static constexpr const char *kSessionKey = "session_state";
static constexpr const char *kPauseKey = "pause_until";
static constexpr const char *kIndefinite = "indefinite";

// ─────────────────────────────────────
SessionMachine::SessionMachine(SQLite &db) : m_Db(db) {}

// ─────────────────────────────────────
void SessionMachine::Load(double now) {
    std::lock_guard<std::mutex> lock(m_Mutex);

    auto state = m_Db.GetEngineValue(kSessionKey);
    if (state) {
        auto parsed = SessionStateFromString(*state);
        if (parsed) {
            m_State = *parsed;
        } else {
            spdlog::warn("Ignoring unknown stored session state '{}'", *state);
        }
    }

    auto pause = m_Db.GetEngineValue(kPauseKey);
    if (pause && !pause->empty()) {
        if (*pause == kIndefinite) {
            m_PauseIndefinite = true;
        } else {
            char *end = nullptr;
            const double until = std::strtod(pause->c_str(), &end);
            if (end != pause->c_str() && until > now) {
                m_PauseUntil = until;
            }
        }
    }

    spdlog::info("Session restored: {} (reminders {})", ToString(m_State),
                 (m_PauseIndefinite || m_PauseUntil) ? "paused" : "running");
}

// ─────────────────────────────────────
TransitionResult SessionMachine::Transition(SessionState to, std::string &error) {
    if (!m_Db.SetEngineValue(kSessionKey, ToString(to), error)) {
        spdlog::error("Failed to persist session state {}: {}", ToString(to), error);
        return TransitionResult::FAILED;
    }
    spdlog::info("Session {} -> {}", ToString(m_State), ToString(to));
    m_State = to;
    return TransitionResult::APPLIED;
}

// ─────────────────────────────────────
TransitionResult SessionMachine::Start(std::string &error) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (m_State == SessionState::ACTIVE) {
        spdlog::warn("start_session ignored: session already active");
        return TransitionResult::INVALID;
    }
    return Transition(SessionState::ACTIVE, error);
}

// ─────────────────────────────────────
TransitionResult SessionMachine::Pause(std::string &error) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (m_State != SessionState::ACTIVE) {
        spdlog::warn("pause_session ignored: session is {}", ToString(m_State));
        return TransitionResult::INVALID;
    }
    return Transition(SessionState::PAUSED, error);
}

// ─────────────────────────────────────
TransitionResult SessionMachine::Resume(std::string &error) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (m_State != SessionState::PAUSED) {
        spdlog::warn("resume_session ignored: session is {}", ToString(m_State));
        return TransitionResult::INVALID;
    }
    return Transition(SessionState::ACTIVE, error);
}

// ─────────────────────────────────────
TransitionResult SessionMachine::End(std::string &error) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (m_State == SessionState::IDLE) {
        spdlog::warn("end_session ignored: no session running");
        return TransitionResult::INVALID;
    }
    return Transition(SessionState::IDLE, error);
}

// ─────────────────────────────────────
bool SessionMachine::PersistPause(bool indefinite, std::optional<double> until,
                                  std::string &error) {
    std::string value;
    if (indefinite) {
        value = kIndefinite;
    } else if (until) {
        value = std::to_string(*until);
    }
    return m_Db.SetEngineValue(kPauseKey, value, error);
}

// ─────────────────────────────────────
bool SessionMachine::PauseReminders(std::optional<int> minutes, double now, std::string &error) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (minutes && *minutes <= 0) {
        error = "minutes must be positive";
        return false;
    }

    const bool indefinite = !minutes.has_value();
    std::optional<double> until;
    if (minutes) {
        until = now + *minutes * 60.0;
    }
    if (!PersistPause(indefinite, until, error)) {
        spdlog::error("Failed to persist reminder pause: {}", error);
        return false;
    }
    m_PauseIndefinite = indefinite;
    m_PauseUntil = until;
    if (indefinite) {
        spdlog::info("Reminders paused indefinitely");
    } else {
        spdlog::info("Reminders paused for {} minutes", *minutes);
    }
    return true;
}

// ─────────────────────────────────────
bool SessionMachine::ResumeReminders(std::string &error) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (!PersistPause(false, std::nullopt, error)) {
        spdlog::error("Failed to persist reminder resume: {}", error);
        return false;
    }
    m_PauseIndefinite = false;
    m_PauseUntil.reset();
    spdlog::info("Reminders resumed");
    return true;
}

// ─────────────────────────────────────
bool SessionMachine::ExpireReminderPause(double now) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (!m_PauseUntil || now < *m_PauseUntil) {
        return false;
    }

    std::string error;
    if (!PersistPause(false, std::nullopt, error)) {
        // Memory still clears; the stale row is ignored on the next load because it is past.
        spdlog::warn("Failed to clear expired reminder pause: {}", error);
    }
    m_PauseUntil.reset();
    spdlog::info("Reminder pause expired");
    return true;
}

// ─────────────────────────────────────
SessionState SessionMachine::State() const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return m_State;
}

// ─────────────────────────────────────
bool SessionMachine::RemindersPaused(double now) const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (m_PauseIndefinite) {
        return true;
    }
    return m_PauseUntil && now < *m_PauseUntil;
}

// ─────────────────────────────────────
bool SessionMachine::PauseIndefinite() const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return m_PauseIndefinite;
}

// ─────────────────────────────────────
std::optional<double> SessionMachine::PauseUntil() const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return m_PauseUntil;
}

// ─────────────────────────────────────
nlohmann::json SessionMachine::ToJson(double now) const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    nlohmann::json j;
    j["state"] = ToString(m_State);
    j["reminders_paused"] = m_PauseIndefinite || (m_PauseUntil && now < *m_PauseUntil);
    if (m_PauseIndefinite) {
        j["pause_until"] = kIndefinite;
    } else if (m_PauseUntil) {
        j["pause_until"] = *m_PauseUntil;
    } else {
        j["pause_until"] = nullptr;
    }
    return j;
}
