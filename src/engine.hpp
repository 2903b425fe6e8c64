#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

// parts
#include "break_timer.hpp"
#include "gateway.hpp"
#include "metrics.hpp"
#include "schedule.hpp"
#include "session.hpp"
#include "settings.hpp"
#include "sqlite.hpp"

#include "common.hpp"

class Engine {
  public:
    using EventSink = std::function<void(const Event &)>;
    using ForegroundProvider = std::function<FocusedWindow()>;
    using ReplyHandler = std::function<void(std::vector<Event>)>;

    // Opens (or creates) the store and restores the last checkpoint. Throws std::runtime_error
    // when the database cannot be opened.
    Engine(const std::string &db_path, double now);
    ~Engine();

    Engine(const Engine &) = delete;
    Engine &operator=(const Engine &) = delete;

    void SetEventSink(EventSink sink);
    void SetForegroundProvider(ForegroundProvider provider);
    void SetTickInterval(std::chrono::milliseconds interval);

    // Thread-safe. The reply, if any, receives every event the command produced.
    void Post(Command cmd, ReplyHandler reply = {});

    void EmitReady();
    void Run();
    void RequestShutdown();
    bool IsRunning() const;
    bool ShutdownRequested() const;

    // One loop iteration with injected wall time and elapsed seconds.
    void Tick(double now, double delta_seconds);
    void DrainCommands(double now);
    // Writes every timer's state. On failure error holds the first message.
    bool SaveCheckpoint(std::string &error);

    InputQueue &Input();
    SQLite &Store();
    Settings &GetSettings();
    const BreakTimerSet &Timers() const;
    SessionState GetSessionState() const;
    bool RemindersPaused(double now) const;
    const ActivitySnapshot &LastSnapshot() const;

    nlohmann::json StatusJson(double now);
    nlohmann::json MetricsJson() const;
    nlohmann::json HydrationJson(double now);

  private:
    struct PendingCommand {
        Command cmd;
        ReplyHandler reply;
    };

    void Emit(EventType type, nlohmann::json data = nlohmann::json::object());
    void EmitStatus(double now);
    void EmitError(const std::string &message);
    void WakeScheduler();

    void ApplySettings();
    void RestoreCheckpoint();
    void UpdateHydrationSilence(double now);
    void FireBreak(BreakKind kind, double now);
    void ExecuteScheduleAction(const ScheduleFiring &firing, double now);

    TransitionResult ApplySessionTransition(CommandType type, std::string &error);

    void Handle(const Command &cmd, double now);
    void HandleSessionTransition(CommandType type, double now);
    void HandleResolveBreak(BreakResolution resolution, const nlohmann::json &payload, double now);
    void HandleLogHydration(const nlohmann::json &payload, double now);
    void HandleUpdateSetting(const nlohmann::json &payload, double now);
    void HandleScheduleCommand(const Command &cmd, double now);
    void HandleExport(const nlohmann::json &payload);
    void HandleBreaksToday(double now);

  private:
    // Parts
    std::unique_ptr<SQLite> m_SQLite;
    std::unique_ptr<Settings> m_Settings;
    std::unique_ptr<SessionMachine> m_Session;
    std::unique_ptr<ScheduleEngine> m_Schedule;
    InputQueue m_Input;
    std::unique_ptr<MetricsSampler> m_Sampler;
    BreakTimerSet m_Timers;

    EventSink m_Sink;
    ForegroundProvider m_Foreground;
    ActivitySnapshot m_Snapshot;
    JsonParse m_JsonParse;

    // Events produced while the current command runs, for reply handlers.
    bool m_Collecting = false;
    std::vector<Event> m_Collected;

    int m_WaterGoal = 2000;
    double m_LastCheckpoint = 0.0;

    // Command queue
    std::mutex m_QueueMutex;
    std::deque<PendingCommand> m_Queue;

    // Scheduler: wait-until-next-deadline with wakeups on posted commands
    std::mutex m_SchedulerMutex;
    std::condition_variable m_SchedulerCv;
    std::atomic<std::uint64_t> m_WakeupSeq{0};
    std::atomic<bool> m_ShutdownRequested{false};
    std::atomic<bool> m_Running{false};
    std::chrono::milliseconds m_TickInterval{1000};

    static constexpr double kCheckpointEvery = 15.0; // seconds
    static constexpr int kDefaultSnoozeMinutes = 5;
    static constexpr int kDefaultHydrationMl = 250;
};
