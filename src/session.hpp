#pragma once

#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common.hpp"
#include "sqlite.hpp"

enum class TransitionResult { APPLIED, INVALID, FAILED };

// Session lifecycle (idle -> active <-> paused -> idle) plus the orthogonal reminder pause.
// Every change is written to the engine_state table before it is applied in memory.
class SessionMachine {
  public:
    explicit SessionMachine(SQLite &db);

    void Load(double now);

    TransitionResult Start(std::string &error);
    TransitionResult Pause(std::string &error);
    TransitionResult Resume(std::string &error);
    TransitionResult End(std::string &error);

    // minutes absent = indefinite.
    bool PauseReminders(std::optional<int> minutes, double now, std::string &error);
    bool ResumeReminders(std::string &error);

    // Clears an expired timed pause. Returns true when it did.
    bool ExpireReminderPause(double now);

    SessionState State() const;
    bool RemindersPaused(double now) const;
    bool PauseIndefinite() const;
    std::optional<double> PauseUntil() const;

    nlohmann::json ToJson(double now) const;

  private:
    TransitionResult Transition(SessionState to, std::string &error);
    bool PersistPause(bool indefinite, std::optional<double> until, std::string &error);

  private:
    SQLite &m_Db;
    mutable std::mutex m_Mutex;

    SessionState m_State = SessionState::IDLE;
    bool m_PauseIndefinite = false;
    std::optional<double> m_PauseUntil;
};
