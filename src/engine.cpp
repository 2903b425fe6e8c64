#include "engine.hpp"

#include <algorithm>
#include <cmath>

// ─────────────────────────────────────
Engine::Engine(const std::string &db_path, double now) {
    // SQlite
    m_SQLite = std::make_unique<SQLite>(db_path);
    spdlog::info("SQLite database initialized at {}", m_SQLite->Path());

    // Settings
    m_Settings = std::make_unique<Settings>(*m_SQLite);
    std::string error;
    if (!m_Settings->EnsureDefaults(error)) {
        spdlog::error("Failed to seed default settings: {}", error);
    }

    // Session
    m_Session = std::make_unique<SessionMachine>(*m_SQLite);
    m_Session->Load(now);

    // Schedule rules
    m_Schedule = std::make_unique<ScheduleEngine>(*m_SQLite);

    // Metrics
    m_Sampler = std::make_unique<MetricsSampler>(m_Input, now);

    ApplySettings();
    RestoreCheckpoint();
    UpdateHydrationSilence(now);
    m_LastCheckpoint = now;
}

// ─────────────────────────────────────
Engine::~Engine() = default;

// ─────────────────────────────────────
void Engine::SetEventSink(EventSink sink) {
    m_Sink = std::move(sink);
}

// ─────────────────────────────────────
void Engine::SetForegroundProvider(ForegroundProvider provider) {
    m_Foreground = std::move(provider);
}

// ─────────────────────────────────────
void Engine::SetTickInterval(std::chrono::milliseconds interval) {
    if (interval.count() <= 0) {
        spdlog::warn("Ignoring non-positive tick interval {} ms", interval.count());
        return;
    }
    m_TickInterval = interval;
}

// ─────────────────────────────────────
InputQueue &Engine::Input() {
    return m_Input;
}

// ─────────────────────────────────────
SQLite &Engine::Store() {
    return *m_SQLite;
}

// ─────────────────────────────────────
Settings &Engine::GetSettings() {
    return *m_Settings;
}

// ─────────────────────────────────────
const BreakTimerSet &Engine::Timers() const {
    return m_Timers;
}

// ─────────────────────────────────────
SessionState Engine::GetSessionState() const {
    return m_Session->State();
}

// ─────────────────────────────────────
bool Engine::RemindersPaused(double now) const {
    return m_Session->RemindersPaused(now);
}

// ─────────────────────────────────────
const ActivitySnapshot &Engine::LastSnapshot() const {
    return m_Snapshot;
}

// ─────────────────────────────────────
void Engine::ApplySettings() {
    auto mode = TimerModeFromString(m_Settings->GetString("timer_mode"));
    m_Timers.SetMode(mode.value_or(TimerMode::WALL_CLOCK));

    m_Timers.Reload(BreakKind::MICRO, m_Settings->GetInt("micro_break_interval"),
                    m_Settings->GetInt("micro_break_duration"));
    m_Timers.Reload(BreakKind::MACRO, m_Settings->GetInt("macro_break_interval"),
                    m_Settings->GetInt("macro_break_duration"));
    // Hydration is a reminder, not a timed break.
    m_Timers.Reload(BreakKind::HYDRATION, m_Settings->GetInt("hydration_interval"), 0);

    m_Sampler->SetIdleThreshold(m_Settings->GetInt("idle_threshold"));
    m_Sampler->SetIdleZeroThreshold(m_Settings->GetDouble("idle_zero_threshold"));
    m_Sampler->SetAutoDetectFullscreen(m_Settings->GetBool("auto_detect_fullscreen"));
    m_Sampler->SetBlocklist(m_Settings->GetList("blocklist_processes"));

    m_WaterGoal = m_Settings->GetInt("water_goal");
}

// ─────────────────────────────────────
void Engine::RestoreCheckpoint() {
    const auto checkpoints = m_SQLite->LoadTimerStates();
    for (const auto &cp : checkpoints) {
        m_Timers.Restore(cp);
    }
    if (!checkpoints.empty()) {
        spdlog::info("Restored {} timer checkpoints", checkpoints.size());
    }
    auto pending = m_Timers.Pending();
    if (pending) {
        spdlog::info("Break {} (record {}) is still pending from the last run",
                     ToString(pending->kind), pending->record_id);
    }
}

// ─────────────────────────────────────
bool Engine::SaveCheckpoint(std::string &error) {
    bool ok = true;
    for (const auto &cp : m_Timers.Checkpoints()) {
        std::string timerError;
        if (!m_SQLite->SaveTimerState(cp, timerError)) {
            spdlog::error("Failed to checkpoint {} timer: {}", ToString(cp.kind), timerError);
            if (ok) {
                error = "Failed to save timer state: " + timerError;
            }
            ok = false;
        }
    }
    return ok;
}

// ─────────────────────────────────────
void Engine::Emit(EventType type, nlohmann::json data) {
    Event ev;
    ev.type = type;
    ev.data = std::move(data);
    if (m_Collecting) {
        m_Collected.push_back(ev);
    }
    if (m_Sink) {
        m_Sink(ev);
    }
}

// ─────────────────────────────────────
void Engine::EmitError(const std::string &message) {
    spdlog::warn("Command failed: {}", message);
    Emit(EventType::ERROR, {{"message", message}});
}

// ─────────────────────────────────────
void Engine::EmitStatus(double now) {
    Emit(EventType::STATUS, StatusJson(now));
}

// ─────────────────────────────────────
void Engine::EmitReady() {
    Emit(EventType::READY, {{"version", AURA_VERSION}, {"db_path", m_SQLite->Path()}});
}

// ─────────────────────────────────────
nlohmann::json Engine::MetricsJson() const {
    nlohmann::json j;
    j["mouse_velocity"] = m_Snapshot.mouse_velocity;
    j["keys_per_min"] = m_Snapshot.keys_per_minute;
    j["clicks_per_min"] = m_Snapshot.clicks_per_minute;
    j["scrolls_per_min"] = m_Snapshot.scrolls_per_minute;
    j["active_time_seconds"] = m_Snapshot.active_seconds;
    j["idle_time_seconds"] = m_Snapshot.idle_seconds;
    j["state"] = ToString(m_Snapshot.state);
    j["active_process"] = m_Snapshot.foreground_app;
    j["is_fullscreen"] = m_Snapshot.is_fullscreen;
    return j;
}

// ─────────────────────────────────────
nlohmann::json Engine::HydrationJson(double now) {
    const int total = m_SQLite->GetHydrationTotal(LocalDayStart(now), NextLocalDayStart(now));
    double progress = 1.0;
    if (m_WaterGoal > 0) {
        progress = std::min(1.0, static_cast<double>(total) / static_cast<double>(m_WaterGoal));
    }
    return {{"total_today_ml", total}, {"goal_ml", m_WaterGoal}, {"progress", progress}};
}

// ─────────────────────────────────────
nlohmann::json Engine::StatusJson(double now) {
    nlohmann::json scheduler = m_Timers.StatusJson();
    scheduler["session"] = m_Session->ToJson(now);

    nlohmann::json j;
    j["metrics"] = MetricsJson();
    j["scheduler"] = scheduler;
    j["next_break"] = m_Timers.NextBreakJson();
    j["hydration"] = HydrationJson(now);
    return j;
}

// ─────────────────────────────────────
void Engine::UpdateHydrationSilence(double now) {
    if (m_WaterGoal <= 0) {
        m_Timers.SetHydrationSilenced(false);
        return;
    }
    const int total = m_SQLite->GetHydrationTotal(LocalDayStart(now), NextLocalDayStart(now));
    m_Timers.SetHydrationSilenced(total >= m_WaterGoal);
}

// ─────────────────────────────────────
void Engine::FireBreak(BreakKind kind, double now) {
    const BreakTimer &timer = m_Timers.Get(kind);

    // A snoozed break comes back on the row it opened the first time.
    int64_t recordId = timer.RecordId();
    std::string error;
    if (recordId == 0) {
        if (!m_SQLite->InsertBreakLog(kind, timer.Duration(), now, recordId, error)) {
            // Not fired; the timer stays due and the next tick retries.
            spdlog::error("Failed to log {} break: {}", ToString(kind), error);
            EmitError("Failed to log break: " + error);
            return;
        }
    }

    m_Timers.Fire(kind, recordId);
    if (!SaveCheckpoint(error)) {
        EmitError(error);
    }

    spdlog::info("Break due: {} ({} s, record {})", ToString(kind), timer.FiredDuration(),
                 recordId);
    Emit(EventType::BREAK_DUE, {{"break_type", ToString(kind)},
                                {"duration_seconds", timer.FiredDuration()},
                                {"theme_color", ThemeColor(kind)},
                                {"record_id", recordId}});
}

// ─────────────────────────────────────
TransitionResult Engine::ApplySessionTransition(CommandType type, std::string &error) {
    const SessionState before = m_Session->State();
    TransitionResult result = TransitionResult::INVALID;

    switch (type) {
    case CommandType::START_SESSION:
        result = m_Session->Start(error);
        if (result == TransitionResult::APPLIED && before == SessionState::IDLE) {
            m_Timers.ResetAll(true);
            if (!SaveCheckpoint(error)) {
                result = TransitionResult::FAILED;
            }
        }
        break;
    case CommandType::PAUSE_SESSION:
        result = m_Session->Pause(error);
        break;
    case CommandType::RESUME_SESSION:
        result = m_Session->Resume(error);
        break;
    case CommandType::END_SESSION:
        result = m_Session->End(error);
        if (result == TransitionResult::APPLIED) {
            m_Timers.ResetAll(true);
            if (!SaveCheckpoint(error)) {
                result = TransitionResult::FAILED;
            }
        }
        break;
    default:
        spdlog::warn("{} is not a session transition", ToString(type));
        break;
    }
    return result;
}

// ─────────────────────────────────────
void Engine::HandleSessionTransition(CommandType type, double now) {
    std::string error;
    const TransitionResult result = ApplySessionTransition(type, error);

    if (result == TransitionResult::FAILED) {
        EmitError(error);
        return;
    }
    if (result == TransitionResult::APPLIED) {
        EventType ev = EventType::SESSION_STARTED;
        switch (type) {
        case CommandType::PAUSE_SESSION:
            ev = EventType::SESSION_PAUSED;
            break;
        case CommandType::RESUME_SESSION:
            ev = EventType::SESSION_RESUMED;
            break;
        case CommandType::END_SESSION:
            ev = EventType::SESSION_ENDED;
            break;
        default:
            break;
        }
        Emit(ev, {{"state", ToString(m_Session->State())}});
    }
    EmitStatus(now);
}

// ─────────────────────────────────────
void Engine::ExecuteScheduleAction(const ScheduleFiring &firing, double now) {
    const ScheduleRule &rule = firing.rule;

    switch (rule.action) {
    case ScheduleAction::PAUSE:
    case ScheduleAction::RESUME:
    case ScheduleAction::START_SESSION:
    case ScheduleAction::END_SESSION: {
        CommandType type = CommandType::PAUSE_SESSION;
        if (rule.action == ScheduleAction::RESUME) {
            type = CommandType::RESUME_SESSION;
        } else if (rule.action == ScheduleAction::START_SESSION) {
            type = CommandType::START_SESSION;
        } else if (rule.action == ScheduleAction::END_SESSION) {
            type = CommandType::END_SESSION;
        }
        std::string error;
        if (ApplySessionTransition(type, error) == TransitionResult::FAILED) {
            EmitError(error);
            return;
        }
        break;
    }
    case ScheduleAction::RESET: {
        m_Timers.ResetAll(false);
        std::string error;
        if (!SaveCheckpoint(error)) {
            EmitError(error);
            return;
        }
        break;
    }
    }

    Emit(EventType::SCHEDULE_ACTION_EXECUTED,
         {{"action", ToString(rule.action)}, {"time", rule.time}, {"title", rule.title}});
    EmitStatus(now);
}

// ─────────────────────────────────────
void Engine::HandleResolveBreak(BreakResolution resolution, const nlohmann::json &payload,
                                double now) {
    const char *name = resolution == BreakResolution::COMPLETED ? "complete_break"
                       : resolution == BreakResolution::SNOOZED ? "snooze_break"
                                                                : "skip_break";
    auto pending = m_Timers.Pending();
    if (!pending) {
        spdlog::warn("{} ignored: no break is pending", name);
        EmitStatus(now);
        return;
    }

    int minutes = kDefaultSnoozeMinutes;
    if (resolution == BreakResolution::SNOOZED && payload.contains("minutes") &&
        !payload["minutes"].is_null()) {
        auto m = m_JsonParse.GetOptionalInt(payload, "minutes");
        if (!m || *m <= 0) {
            EmitError("minutes must be a positive number");
            return;
        }
        minutes = *m;
    }

    if (pending->record_id != 0) {
        std::string error;
        if (!m_SQLite->ResolveBreakLog(pending->record_id, resolution, error)) {
            EmitError(error);
            return;
        }
    }

    nlohmann::json data = {{"break_type", ToString(pending->kind)},
                           {"record_id", pending->record_id}};
    EventType ev = EventType::BREAK_COMPLETED;
    switch (resolution) {
    case BreakResolution::COMPLETED:
        m_Timers.Complete();
        break;
    case BreakResolution::SNOOZED:
        m_Timers.Snooze(minutes);
        data["minutes"] = minutes;
        ev = EventType::BREAK_SNOOZED;
        break;
    case BreakResolution::SKIPPED:
        m_Timers.Skip();
        ev = EventType::BREAK_SKIPPED;
        break;
    }
    std::string error;
    if (!SaveCheckpoint(error)) {
        EmitError(error);
        return;
    }

    spdlog::info("{} break {} (record {})", ToString(pending->kind), ToString(ev),
                 pending->record_id);
    Emit(ev, data);
    EmitStatus(now);
}

// ─────────────────────────────────────
void Engine::HandleLogHydration(const nlohmann::json &payload, double now) {
    int amount = kDefaultHydrationMl;
    if (payload.contains("amount_ml") && !payload["amount_ml"].is_null()) {
        auto a = m_JsonParse.GetOptionalInt(payload, "amount_ml");
        if (!a) {
            EmitError("amount_ml must be a number in range");
            return;
        }
        amount = *a;
    }
    if (amount <= 0) {
        EmitError("amount_ml must be positive");
        return;
    }

    int64_t id = 0;
    std::string error;
    if (!m_SQLite->InsertHydrationLog(amount, now, id, error)) {
        EmitError(error);
        return;
    }
    UpdateHydrationSilence(now);

    nlohmann::json data = HydrationJson(now);
    data["amount_ml"] = amount;
    spdlog::info("Hydration logged: {} ml ({} / {} ml today)", amount,
                 data["total_today_ml"].get<int>(), m_WaterGoal);
    Emit(EventType::HYDRATION_LOGGED, data);
}

// ─────────────────────────────────────
static std::optional<BreakKind> TimerKeyKind(const std::string &key) {
    if (key == "micro_break_interval" || key == "micro_break_duration") {
        return BreakKind::MICRO;
    }
    if (key == "macro_break_interval" || key == "macro_break_duration") {
        return BreakKind::MACRO;
    }
    if (key == "hydration_interval") {
        return BreakKind::HYDRATION;
    }
    return std::nullopt;
}

// ─────────────────────────────────────
void Engine::HandleUpdateSetting(const nlohmann::json &payload, double now) {
    const std::string key = m_JsonParse.GetString(payload, "key", "");
    if (key.empty()) {
        EmitError("Missing field: key");
        return;
    }
    if (!payload.contains("value")) {
        EmitError("Missing field: value");
        return;
    }
    const std::string value = m_JsonParse.Stringify(payload["value"]);

    std::string error;
    if (!m_Settings->Update(key, value, error)) {
        EmitError(error);
        return;
    }

    ApplySettings();

    auto kind = TimerKeyKind(key);
    if (kind) {
        const BreakTimer &timer = m_Timers.Get(*kind);
        m_Timers.ReloadAndReset(*kind, timer.Interval(), timer.Duration());
        if (!SaveCheckpoint(error)) {
            EmitError(error);
            return;
        }
    }
    if (key == "water_goal") {
        UpdateHydrationSilence(now);
    }

    spdlog::info("Setting updated: {} = {}", key, value);
    Emit(EventType::SETTING_UPDATED, {{"key", key}, {"value", value}});
    if (kind || key == "timer_mode" || key == "water_goal") {
        EmitStatus(now);
    }
}

// ─────────────────────────────────────
void Engine::HandleScheduleCommand(const Command &cmd, double now) {
    std::string error;
    const nlohmann::json &payload = cmd.payload;

    switch (cmd.type) {
    case CommandType::ADD_SCHEDULE_RULE: {
        ScheduleRule rule;
        if (!RuleFromJson(payload, rule, false, error)) {
            EmitError(error);
            return;
        }
        int64_t id = 0;
        if (!m_Schedule->Add(rule, now, id, error)) {
            EmitError(error);
            return;
        }
        Emit(EventType::SCHEDULE_RULE_ADDED, {{"id", id}, {"rules", m_Schedule->RulesJson()}});
        return;
    }
    case CommandType::UPDATE_SCHEDULE_RULE: {
        const int64_t id = m_JsonParse.GetInt64(payload, "id", 0);
        if (id <= 0) {
            EmitError("Missing field: id");
            return;
        }
        if (!m_Schedule->Update(id, payload, error)) {
            EmitError(error);
            return;
        }
        Emit(EventType::SCHEDULE_RULE_UPDATED, {{"id", id}, {"rules", m_Schedule->RulesJson()}});
        return;
    }
    case CommandType::DELETE_SCHEDULE_RULE: {
        const int64_t id = m_JsonParse.GetInt64(payload, "id", 0);
        if (id <= 0) {
            EmitError("Missing field: id");
            return;
        }
        if (!m_Schedule->Delete(id, error)) {
            EmitError(error);
            return;
        }
        Emit(EventType::SCHEDULE_RULE_DELETED, {{"id", id}, {"rules", m_Schedule->RulesJson()}});
        return;
    }
    case CommandType::GET_SCHEDULE_RULES:
        Emit(EventType::SCHEDULE_RULES, {{"rules", m_Schedule->RulesJson()}});
        return;
    default:
        return;
    }
}

// ─────────────────────────────────────
void Engine::HandleExport(const nlohmann::json &payload) {
    const std::string path = m_JsonParse.GetString(payload, "path", "");
    if (path.empty()) {
        EmitError("Missing field: path");
        return;
    }
    int records = 0;
    std::string error;
    if (!m_SQLite->ExportData(path, records, error)) {
        EmitError(error);
        return;
    }
    spdlog::info("Exported {} records to {}", records, path);
    Emit(EventType::DATA_EXPORTED, {{"path", path}, {"records", records}});
}

// ─────────────────────────────────────
void Engine::HandleBreaksToday(double now) {
    nlohmann::json breaks = nlohmann::json::array();
    for (const auto &log : m_SQLite->FetchBreakLogs(LocalDayStart(now), NextLocalDayStart(now))) {
        breaks.push_back({{"id", log.id},
                          {"timestamp", log.timestamp},
                          {"break_type", ToString(log.kind)},
                          {"duration_seconds", log.duration_seconds},
                          {"completed", log.completed},
                          {"skipped", log.skipped},
                          {"snoozed", log.snoozed}});
    }
    Emit(EventType::BREAKS_TODAY, {{"breaks", breaks}});
}

// ─────────────────────────────────────
void Engine::Handle(const Command &cmd, double now) {
    const nlohmann::json &payload = cmd.payload;
    std::string error;

    switch (cmd.type) {
    case CommandType::START_SESSION:
    case CommandType::PAUSE_SESSION:
    case CommandType::RESUME_SESSION:
    case CommandType::END_SESSION:
        HandleSessionTransition(cmd.type, now);
        return;

    case CommandType::PAUSE_REMINDERS: {
        std::optional<int> minutes;
        if (payload.contains("minutes") && !payload["minutes"].is_null()) {
            minutes = m_JsonParse.GetOptionalInt(payload, "minutes");
            if (!minutes) {
                EmitError("minutes must be a number in range");
                return;
            }
        }
        if (!m_Session->PauseReminders(minutes, now, error)) {
            EmitError(error);
            return;
        }
        const auto session = m_Session->ToJson(now);
        Emit(EventType::REMINDERS_PAUSED,
             {{"minutes", minutes ? nlohmann::json(*minutes) : nlohmann::json(nullptr)},
              {"pause_until", session["pause_until"]}});
        return;
    }
    case CommandType::RESUME_REMINDERS:
        if (!m_Session->ResumeReminders(error)) {
            EmitError(error);
            return;
        }
        Emit(EventType::REMINDERS_RESUMED);
        return;

    case CommandType::COMPLETE_BREAK:
        HandleResolveBreak(BreakResolution::COMPLETED, payload, now);
        return;
    case CommandType::SNOOZE_BREAK:
        HandleResolveBreak(BreakResolution::SNOOZED, payload, now);
        return;
    case CommandType::SKIP_BREAK:
        HandleResolveBreak(BreakResolution::SKIPPED, payload, now);
        return;

    case CommandType::LOG_HYDRATION:
        HandleLogHydration(payload, now);
        return;

    case CommandType::GET_STATUS:
        EmitStatus(now);
        return;

    case CommandType::UPDATE_SETTING:
        HandleUpdateSetting(payload, now);
        return;
    case CommandType::GET_SETTINGS: {
        nlohmann::json map = nlohmann::json::object();
        for (const auto &[key, value] : m_Settings->All()) {
            map[key] = value;
        }
        Emit(EventType::SETTINGS, map);
        return;
    }

    case CommandType::ADD_SCHEDULE_RULE:
    case CommandType::UPDATE_SCHEDULE_RULE:
    case CommandType::DELETE_SCHEDULE_RULE:
    case CommandType::GET_SCHEDULE_RULES:
        HandleScheduleCommand(cmd, now);
        return;

    case CommandType::RESET_ALL_TIMERS:
        m_Timers.ResetAll(false);
        if (!SaveCheckpoint(error)) {
            EmitError(error);
            return;
        }
        spdlog::info("All timers reset");
        Emit(EventType::TIMERS_RESET);
        EmitStatus(now);
        return;

    case CommandType::EXPORT_DATA:
        HandleExport(payload);
        return;

    case CommandType::GET_METRICS: {
        nlohmann::json metrics = MetricsJson();
        metrics["next_break"] = m_Timers.NextBreakJson();
        Emit(EventType::METRICS, metrics);
        return;
    }
    case CommandType::GET_HYDRATION:
        Emit(EventType::HYDRATION_STATUS, HydrationJson(now));
        return;
    case CommandType::GET_SESSION_STATE:
        Emit(EventType::SESSION_STATE, m_Session->ToJson(now));
        return;
    case CommandType::GET_BREAKS_TODAY:
        HandleBreaksToday(now);
        return;

    case CommandType::SHUTDOWN:
        Emit(EventType::SHUTDOWN_ACK);
        RequestShutdown();
        return;
    }
}

// ─────────────────────────────────────
void Engine::Post(Command cmd, ReplyHandler reply) {
    {
        std::lock_guard<std::mutex> lock(m_QueueMutex);
        m_Queue.push_back(PendingCommand{std::move(cmd), std::move(reply)});
    }
    WakeScheduler();
}

// ─────────────────────────────────────
void Engine::DrainCommands(double now) {
    std::deque<PendingCommand> batch;
    {
        std::lock_guard<std::mutex> lock(m_QueueMutex);
        batch.swap(m_Queue);
    }

    for (auto &pc : batch) {
        m_Collecting = static_cast<bool>(pc.reply);
        m_Collected.clear();

        try {
            Handle(pc.cmd, now);
        } catch (const nlohmann::json::exception &e) {
            EmitError(std::string("Invalid command payload: ") + e.what());
        }

        m_Collecting = false;
        if (pc.reply) {
            pc.reply(std::move(m_Collected));
        }
        m_Collected.clear();
    }
}

// ─────────────────────────────────────
void Engine::Tick(double now, double delta_seconds) {
    // 1. commands
    DrainCommands(now);

    // 2. metrics
    const FocusedWindow fw = m_Foreground ? m_Foreground() : FocusedWindow{};
    m_Snapshot = m_Sampler->Sample(now, fw);

    // 3. timers
    if (m_Session->ExpireReminderPause(now)) {
        Emit(EventType::REMINDERS_RESUMED, {{"expired", true}});
    }
    UpdateHydrationSilence(now);
    auto due = m_Timers.Advance(delta_seconds, m_Session->State(), m_Session->RemindersPaused(now),
                                m_Snapshot.state);
    if (due) {
        FireBreak(*due, now);
    }

    // 4. schedule rules
    for (const auto &firing : m_Schedule->Evaluate(now)) {
        if (firing.kind == ScheduleFiring::ACTION) {
            ExecuteScheduleAction(firing, now);
        } else {
            Emit(EventType::SCHEDULE_WARNING, {{"title", firing.title},
                                               {"action", ToString(firing.rule.action)},
                                               {"time", firing.rule.time},
                                               {"seconds_remaining", firing.seconds_remaining}});
        }
    }

    // 5. checkpoint
    if (now - m_LastCheckpoint >= kCheckpointEvery) {
        std::string error;
        if (SaveCheckpoint(error)) {
            m_LastCheckpoint = now;
        }
    }

    // 6. broadcast
    nlohmann::json metrics = MetricsJson();
    metrics["next_break"] = m_Timers.NextBreakJson();
    Emit(EventType::METRICS, metrics);
}

// ─────────────────────────────────────
void Engine::WakeScheduler() {
    m_WakeupSeq.fetch_add(1, std::memory_order_relaxed);
    m_SchedulerCv.notify_one();
}

// ─────────────────────────────────────
void Engine::RequestShutdown() {
    m_ShutdownRequested.store(true);
    WakeScheduler();
}

// ─────────────────────────────────────
bool Engine::IsRunning() const {
    return m_Running.load();
}

// ─────────────────────────────────────
bool Engine::ShutdownRequested() const {
    return m_ShutdownRequested.load();
}

// ─────────────────────────────────────
void Engine::Run() {
    m_Running.store(true);
    spdlog::info("Engine loop started (tick {} ms)", m_TickInterval.count());

    auto last = std::chrono::steady_clock::now();
    auto nextTick = last;

    while (!m_ShutdownRequested.load()) {
        const auto seq = m_WakeupSeq.load(std::memory_order_relaxed);
        const auto nowSteady = std::chrono::steady_clock::now();

        if (nowSteady >= nextTick) {
            const double delta = std::chrono::duration<double>(nowSteady - last).count();
            last = nowSteady;
            Tick(NowUnix(), delta);

            nextTick += m_TickInterval;
            if (nextTick <= nowSteady) {
                nextTick = nowSteady + m_TickInterval;
            }
        } else {
            // Woken by a posted command between ticks.
            DrainCommands(NowUnix());
        }

        if (m_ShutdownRequested.load()) {
            break;
        }

        std::unique_lock<std::mutex> lk(m_SchedulerMutex);
        m_SchedulerCv.wait_until(lk, nextTick, [&] {
            if (m_ShutdownRequested.load()) {
                return true;
            }
            return m_WakeupSeq.load(std::memory_order_relaxed) != seq;
        });
    }

    std::string error;
    if (!SaveCheckpoint(error)) {
        spdlog::error("Final checkpoint not written: {}", error);
    }

    // Answer anything still queued so HTTP callers are not left waiting.
    std::deque<PendingCommand> leftover;
    {
        std::lock_guard<std::mutex> lock(m_QueueMutex);
        leftover.swap(m_Queue);
    }
    for (auto &pc : leftover) {
        if (pc.reply) {
            pc.reply({ErrorEvent("Engine stopped")});
        }
    }

    m_Running.store(false);
    spdlog::info("Engine loop stopped");
}
