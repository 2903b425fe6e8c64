#include <doctest/doctest.h>

#include <algorithm>
#include <memory>
#include <thread>
#include <vector>

#include <sqlite3.h>

#include "engine.hpp"
#include "test_support.hpp"

namespace {

// An engine on a scratch database with every emitted event recorded.
class EngineHarness {
    // Declared first so the database closes before the directory goes.
    ScratchDir m_Dir;

  public:
    EngineHarness(const std::string &tag, double now) : m_Dir(tag) {
        Open(now);
    }

    void Open(double now) {
        engine.reset();
        engine = std::make_unique<Engine>(DbPath(), now);
        engine->SetEventSink([this](const Event &ev) { events.push_back(ev); });
    }

    void Close() {
        engine.reset();
    }

    std::string DbPath() const {
        return m_Dir.File("aura.sqlite");
    }

    void Send(CommandType type, double now,
              nlohmann::json payload = nlohmann::json::object()) {
        engine->Post(Command{type, std::move(payload)});
        engine->DrainCommands(now);
    }

    void Set(const std::string &key, nlohmann::json value, double now) {
        Send(CommandType::UPDATE_SETTING, now, {{"key", key}, {"value", std::move(value)}});
    }

    long Count(EventType type) const {
        return std::count_if(events.begin(), events.end(),
                             [type](const Event &ev) { return ev.type == type; });
    }

    const Event *Last(EventType type) const {
        for (auto it = events.rbegin(); it != events.rend(); ++it) {
            if (it->type == type) {
                return &*it;
            }
        }
        return nullptr;
    }

    std::vector<Event> events;
    std::unique_ptr<Engine> engine;
};

const double kMonday10am = LocalUnix(2024, 1, 1, 10, 0, 0);

// Drops a table behind the engine's back through a second connection.
void DropTable(const std::string &path, const std::string &table) {
    sqlite3 *db = nullptr;
    REQUIRE(sqlite3_open(path.c_str(), &db) == SQLITE_OK);
    sqlite3_busy_timeout(db, 2000);
    const std::string sql = "DROP TABLE " + table + ";";
    char *err = nullptr;
    const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    if (err) {
        MESSAGE(err);
        sqlite3_free(err);
    }
    sqlite3_close(db);
    REQUIRE(rc == SQLITE_OK);
}

} // namespace

TEST_CASE("Engine: ready event and first status") {
    EngineHarness h("engine_ready", kMonday10am);
    h.engine->EmitReady();
    REQUIRE(h.Last(EventType::READY) != nullptr);
    CHECK(h.Last(EventType::READY)->data["db_path"] == h.DbPath());

    h.Send(CommandType::GET_STATUS, kMonday10am);
    const Event *status = h.Last(EventType::STATUS);
    REQUIRE(status != nullptr);
    CHECK(status->data["scheduler"]["session"]["state"] == "idle");
    CHECK(status->data["scheduler"]["timers"]["micro"]["interval_seconds"] == 1200);
    CHECK(status->data["hydration"]["goal_ml"] == 2000);
    CHECK(status->data["hydration"]["total_today_ml"] == 0);
    CHECK(status->data["next_break"]["type"] == "micro");
    CHECK(status->data["metrics"].contains("keys_per_min"));
}

TEST_CASE("Engine: timers stay still until a session starts") {
    EngineHarness h("engine_idle", kMonday10am);
    h.engine->Tick(kMonday10am + 5000.0, 5000.0);
    CHECK(h.Count(EventType::BREAK_DUE) == 0);
    CHECK(h.engine->Timers().Get(BreakKind::MICRO).Elapsed() == doctest::Approx(0.0));
    CHECK(h.Count(EventType::METRICS) == 1);
}

TEST_CASE("Engine: a micro break fires once and opens a log row") {
    EngineHarness h("engine_micro", kMonday10am);
    double now = kMonday10am;
    h.Set("micro_break_interval", 600, now);
    h.Send(CommandType::START_SESSION, now);
    CHECK(h.Count(EventType::SESSION_STARTED) == 1);
    CHECK(h.engine->GetSessionState() == SessionState::ACTIVE);

    now += 599.0;
    h.engine->Tick(now, 599.0);
    CHECK(h.Count(EventType::BREAK_DUE) == 0);

    now += 1.0;
    h.engine->Tick(now, 1.0);
    REQUIRE(h.Count(EventType::BREAK_DUE) == 1);
    const Event *due = h.Last(EventType::BREAK_DUE);
    CHECK(due->data["break_type"] == "micro");
    CHECK(due->data["duration_seconds"] == 20);
    CHECK(due->data["theme_color"] == ThemeColor(BreakKind::MICRO));
    const int64_t recordId = due->data["record_id"].get<int64_t>();
    CHECK(recordId > 0);

    // Frozen while pending.
    for (int i = 0; i < 5; ++i) {
        now += 600.0;
        h.engine->Tick(now, 600.0);
    }
    CHECK(h.Count(EventType::BREAK_DUE) == 1);

    auto log = h.engine->Store().GetBreakLog(recordId);
    REQUIRE(log.has_value());
    CHECK(log->kind == BreakKind::MICRO);
    CHECK(log->duration_seconds == 20);
    CHECK_FALSE(log->completed);
    CHECK_FALSE(log->skipped);
    CHECK_FALSE(log->snoozed);

    h.Send(CommandType::COMPLETE_BREAK, now);
    CHECK(h.Count(EventType::BREAK_COMPLETED) == 1);
    CHECK(h.engine->Store().GetBreakLog(recordId)->completed);
    CHECK_FALSE(h.engine->Timers().Pending().has_value());
}

TEST_CASE("Engine: a snoozed break returns on the same record") {
    EngineHarness h("engine_snooze", kMonday10am);
    double now = kMonday10am;
    h.Set("micro_break_interval", 600, now);
    h.Send(CommandType::START_SESSION, now);

    now += 600.0;
    h.engine->Tick(now, 600.0);
    REQUIRE(h.Count(EventType::BREAK_DUE) == 1);
    const int64_t recordId = h.Last(EventType::BREAK_DUE)->data["record_id"].get<int64_t>();

    h.Send(CommandType::SNOOZE_BREAK, now, {{"minutes", 0}});
    CHECK(h.Last(EventType::ERROR) != nullptr);
    CHECK(h.engine->Timers().Pending().has_value());

    h.Send(CommandType::SNOOZE_BREAK, now, {{"minutes", 2}});
    REQUIRE(h.Count(EventType::BREAK_SNOOZED) == 1);
    CHECK(h.Last(EventType::BREAK_SNOOZED)->data["minutes"] == 2);
    CHECK(h.engine->Store().GetBreakLog(recordId)->snoozed);

    now += 119.0;
    h.engine->Tick(now, 119.0);
    CHECK(h.Count(EventType::BREAK_DUE) == 1);
    now += 1.0;
    h.engine->Tick(now, 1.0);
    REQUIRE(h.Count(EventType::BREAK_DUE) == 2);
    CHECK(h.Last(EventType::BREAK_DUE)->data["record_id"] == recordId);

    h.Send(CommandType::SKIP_BREAK, now);
    const auto log = h.engine->Store().GetBreakLog(recordId);
    REQUIRE(log.has_value());
    CHECK(log->skipped);
    CHECK_FALSE(log->completed);
    CHECK_FALSE(log->snoozed);
    CHECK(h.engine->Store().FetchBreakLogs(0.0, now + 1.0).size() == 1);
}

TEST_CASE("Engine: a new interval after a snooze opens a fresh record") {
    EngineHarness h("engine_snooze_reload", kMonday10am);
    double now = kMonday10am;
    h.Set("micro_break_interval", 600, now);
    h.Send(CommandType::START_SESSION, now);

    now += 600.0;
    h.engine->Tick(now, 600.0);
    REQUIRE(h.Count(EventType::BREAK_DUE) == 1);
    const int64_t snoozedId = h.Last(EventType::BREAK_DUE)->data["record_id"].get<int64_t>();
    h.Send(CommandType::SNOOZE_BREAK, now, {{"minutes", 2}});
    REQUIRE(h.Count(EventType::BREAK_SNOOZED) == 1);

    h.Set("micro_break_interval", 900, now);
    CHECK(h.engine->Timers().Get(BreakKind::MICRO).RecordId() == 0);

    now += 900.0;
    h.engine->Tick(now, 900.0);
    REQUIRE(h.Count(EventType::BREAK_DUE) == 2);
    const int64_t freshId = h.Last(EventType::BREAK_DUE)->data["record_id"].get<int64_t>();
    CHECK(freshId > 0);
    CHECK(freshId != snoozedId);

    h.Send(CommandType::GET_BREAKS_TODAY, now);
    const Event *today = h.Last(EventType::BREAKS_TODAY);
    REQUIRE(today != nullptr);
    CHECK(today->data["breaks"].size() == 2);
}

TEST_CASE("Engine: out-of-range numbers are rejected") {
    EngineHarness h("engine_range", kMonday10am);
    double now = kMonday10am;
    h.Set("micro_break_interval", 600, now);
    h.Send(CommandType::START_SESSION, now);
    now += 600.0;
    h.engine->Tick(now, 600.0);
    REQUIRE(h.engine->Timers().Pending().has_value());

    const auto huge = nlohmann::json::parse("1e12");
    h.Send(CommandType::SNOOZE_BREAK, now, {{"minutes", huge}});
    CHECK(h.Count(EventType::BREAK_SNOOZED) == 0);
    CHECK(h.engine->Timers().Pending().has_value());

    h.Send(CommandType::LOG_HYDRATION, now, {{"amount_ml", huge}});
    CHECK(h.Count(EventType::HYDRATION_LOGGED) == 0);
    CHECK(h.engine->HydrationJson(now)["total_today_ml"] == 0);

    h.Send(CommandType::PAUSE_REMINDERS, now, {{"minutes", huge}});
    CHECK(h.Count(EventType::REMINDERS_PAUSED) == 0);
    CHECK(h.Count(EventType::ERROR) == 3);
}

TEST_CASE("Engine: resolving with nothing pending only reports status") {
    EngineHarness h("engine_nothing_pending", kMonday10am);
    h.Send(CommandType::COMPLETE_BREAK, kMonday10am);
    CHECK(h.Count(EventType::BREAK_COMPLETED) == 0);
    CHECK(h.Count(EventType::ERROR) == 0);
    CHECK(h.Count(EventType::STATUS) == 1);
}

TEST_CASE("Engine: reminder pause holds breaks and expires on its own") {
    EngineHarness h("engine_reminder_pause", kMonday10am);
    double now = kMonday10am;
    h.Set("micro_break_interval", 600, now);
    h.Send(CommandType::START_SESSION, now);
    h.Send(CommandType::PAUSE_REMINDERS, now, {{"minutes", 15}});
    REQUIRE(h.Last(EventType::REMINDERS_PAUSED) != nullptr);
    CHECK(h.Last(EventType::REMINDERS_PAUSED)->data["minutes"] == 15);

    now += 600.0;
    h.engine->Tick(now, 600.0);
    CHECK(h.Count(EventType::BREAK_DUE) == 0);
    CHECK(h.engine->Timers().Get(BreakKind::MICRO).Elapsed() == doctest::Approx(0.0));

    now += 300.0;
    h.engine->Tick(now, 300.0);
    REQUIRE(h.Last(EventType::REMINDERS_RESUMED) != nullptr);
    CHECK(h.Last(EventType::REMINDERS_RESUMED)->data["expired"] == true);
    CHECK_FALSE(h.engine->RemindersPaused(now));

    now += 600.0;
    h.engine->Tick(now, 600.0);
    CHECK(h.Count(EventType::BREAK_DUE) == 1);
}

TEST_CASE("Engine: reaching the water goal silences hydration until the next day") {
    EngineHarness h("engine_hydration", kMonday10am);
    double now = kMonday10am;
    h.Set("micro_break_interval", 100000, now);
    h.Set("macro_break_interval", 100000, now);
    h.Set("hydration_interval", 60, now);
    h.Set("water_goal", 500, now);
    h.Send(CommandType::START_SESSION, now);

    h.Send(CommandType::LOG_HYDRATION, now, {{"amount_ml", 300}});
    h.Send(CommandType::LOG_HYDRATION, now);
    const Event *logged = h.Last(EventType::HYDRATION_LOGGED);
    REQUIRE(logged != nullptr);
    CHECK(logged->data["amount_ml"] == 250);
    CHECK(logged->data["total_today_ml"] == 550);
    CHECK(logged->data["progress"].get<double>() == doctest::Approx(1.0));
    CHECK(h.engine->Timers().HydrationSilenced());

    for (int i = 0; i < 10; ++i) {
        now += 60.0;
        h.engine->Tick(now, 60.0);
    }
    CHECK(h.Count(EventType::BREAK_DUE) == 0);

    // Next calendar day: the total starts over.
    const double tomorrow = LocalUnix(2024, 1, 2, 10, 0, 0);
    h.engine->Tick(tomorrow, 60.0);
    CHECK_FALSE(h.engine->Timers().HydrationSilenced());
    REQUIRE(h.Count(EventType::BREAK_DUE) == 1);
    CHECK(h.Last(EventType::BREAK_DUE)->data["break_type"] == "hydration");
    CHECK(h.Last(EventType::BREAK_DUE)->data["duration_seconds"] == 0);
}

TEST_CASE("Engine: invalid hydration amounts are rejected") {
    EngineHarness h("engine_hydration_invalid", kMonday10am);
    h.Send(CommandType::LOG_HYDRATION, kMonday10am, {{"amount_ml", -5}});
    CHECK(h.Last(EventType::ERROR)->data["message"] == "amount_ml must be positive");
    h.Send(CommandType::LOG_HYDRATION, kMonday10am, {{"amount_ml", "lots"}});
    CHECK(h.Count(EventType::ERROR) == 2);
    CHECK(h.Count(EventType::HYDRATION_LOGGED) == 0);
}

TEST_CASE("Engine: schedule rule warns a minute ahead and then pauses the session") {
    const double start = LocalUnix(2024, 1, 1, 11, 58, 30);
    EngineHarness h("engine_schedule", start);
    h.Send(CommandType::START_SESSION, start);
    h.Send(CommandType::ADD_SCHEDULE_RULE, start,
           {{"time", "12:00"}, {"action", "pause"}, {"days", {"mon"}}});
    REQUIRE(h.Last(EventType::SCHEDULE_RULE_ADDED) != nullptr);
    CHECK(h.Last(EventType::SCHEDULE_RULE_ADDED)->data["rules"].size() == 1);

    h.engine->Tick(start, 0.0);
    CHECK(h.Count(EventType::SCHEDULE_WARNING) == 0);

    h.engine->Tick(LocalUnix(2024, 1, 1, 11, 59, 0), 30.0);
    REQUIRE(h.Count(EventType::SCHEDULE_WARNING) == 1);
    const Event *warning = h.Last(EventType::SCHEDULE_WARNING);
    CHECK(warning->data["seconds_remaining"] == 60);
    CHECK(warning->data["title"] == "Pause at 12:00");
    CHECK(warning->data["action"] == "pause");

    h.engine->Tick(LocalUnix(2024, 1, 1, 11, 59, 30), 30.0);
    CHECK(h.Count(EventType::SCHEDULE_WARNING) == 1);

    h.engine->Tick(LocalUnix(2024, 1, 1, 12, 0, 0), 30.0);
    REQUIRE(h.Count(EventType::SCHEDULE_ACTION_EXECUTED) == 1);
    CHECK(h.Last(EventType::SCHEDULE_ACTION_EXECUTED)->data["action"] == "pause");
    CHECK(h.engine->GetSessionState() == SessionState::PAUSED);

    h.engine->Tick(LocalUnix(2024, 1, 1, 12, 0, 30), 30.0);
    CHECK(h.Count(EventType::SCHEDULE_ACTION_EXECUTED) == 1);
}

TEST_CASE("Engine: schedule commands report errors") {
    EngineHarness h("engine_schedule_errors", kMonday10am);
    h.Send(CommandType::ADD_SCHEDULE_RULE, kMonday10am, {{"time", "7am"}, {"action", "pause"},
                                                         {"days", {"mon"}}});
    CHECK(h.Last(EventType::ERROR)->data["message"] == "Invalid time '7am', expected HH:MM");

    h.Send(CommandType::DELETE_SCHEDULE_RULE, kMonday10am, {{"id", 99}});
    CHECK(h.Last(EventType::ERROR)->data["message"] == "schedule rule not found: 99");

    h.Send(CommandType::UPDATE_SCHEDULE_RULE, kMonday10am, {{"title", "x"}});
    CHECK(h.Last(EventType::ERROR)->data["message"] == "Missing field: id");

    h.Send(CommandType::GET_SCHEDULE_RULES, kMonday10am);
    CHECK(h.Last(EventType::SCHEDULE_RULES)->data["rules"].empty());
}

TEST_CASE("Engine: settings and timers survive a restart") {
    EngineHarness h("engine_restart", kMonday10am);
    double now = kMonday10am;
    h.Set("macro_break_interval", 1800, now);
    h.Set("timer_mode", "active", now);
    REQUIRE(h.Last(EventType::SETTING_UPDATED) != nullptr);
    CHECK(h.Last(EventType::SETTING_UPDATED)->data["value"] == "active");

    h.Set("micro_break_interval", 0, now);
    CHECK(h.Count(EventType::ERROR) == 1);

    h.Send(CommandType::START_SESSION, now);
    h.engine->Tick(now + 1.0, 1.0);
    std::string error;
    REQUIRE(h.engine->SaveCheckpoint(error));
    const double microElapsed = h.engine->Timers().Get(BreakKind::MICRO).Elapsed();
    h.Close();

    h.Open(now + 10.0);
    CHECK(h.engine->GetSettings().GetInt("macro_break_interval") == 1800);
    CHECK(h.engine->Timers().Get(BreakKind::MACRO).Interval() == 1800);
    CHECK(h.engine->Timers().Mode() == TimerMode::ACTIVE_TIME);
    CHECK(h.engine->GetSessionState() == SessionState::ACTIVE);
    CHECK(h.engine->Timers().Get(BreakKind::MICRO).Elapsed() == doctest::Approx(microElapsed));

    h.Send(CommandType::GET_SETTINGS, now + 10.0);
    CHECK(h.Last(EventType::SETTINGS)->data["macro_break_interval"] == "1800");
}

TEST_CASE("Engine: a pending break is restored after a restart") {
    EngineHarness h("engine_restore_pending", kMonday10am);
    double now = kMonday10am;
    h.Set("micro_break_interval", 60, now);
    h.Send(CommandType::START_SESSION, now);
    now += 60.0;
    h.engine->Tick(now, 60.0);
    REQUIRE(h.Count(EventType::BREAK_DUE) == 1);
    const int64_t recordId = h.Last(EventType::BREAK_DUE)->data["record_id"].get<int64_t>();
    h.Close();

    h.Open(now + 30.0);
    auto pending = h.engine->Timers().Pending();
    REQUIRE(pending.has_value());
    CHECK(pending->kind == BreakKind::MICRO);
    CHECK(pending->record_id == recordId);

    h.Send(CommandType::COMPLETE_BREAK, now + 30.0);
    CHECK(h.engine->Store().GetBreakLog(recordId)->completed);
}

TEST_CASE("Engine: changing an interval restarts that timer only") {
    EngineHarness h("engine_reload", kMonday10am);
    double now = kMonday10am;
    h.Send(CommandType::START_SESSION, now);
    now += 100.0;
    h.engine->Tick(now, 100.0);

    h.Set("micro_break_interval", 900, now);
    CHECK(h.engine->Timers().Get(BreakKind::MICRO).Elapsed() == doctest::Approx(0.0));
    CHECK(h.engine->Timers().Get(BreakKind::MACRO).Elapsed() == doctest::Approx(100.0));
    CHECK(h.Last(EventType::STATUS)->data["scheduler"]["timers"]["micro"]["interval_seconds"] ==
          900);
}

TEST_CASE("Engine: ending a session clears the timers and the pending break") {
    EngineHarness h("engine_end", kMonday10am);
    double now = kMonday10am;
    h.Set("micro_break_interval", 60, now);
    h.Send(CommandType::START_SESSION, now);
    now += 60.0;
    h.engine->Tick(now, 60.0);
    REQUIRE(h.engine->Timers().Pending().has_value());

    h.Send(CommandType::END_SESSION, now);
    CHECK(h.Count(EventType::SESSION_ENDED) == 1);
    CHECK_FALSE(h.engine->Timers().Pending().has_value());
    CHECK(h.engine->Timers().Get(BreakKind::MACRO).Elapsed() == doctest::Approx(0.0));

    // Invalid transition: status only.
    const long statuses = h.Count(EventType::STATUS);
    h.Send(CommandType::PAUSE_SESSION, now);
    CHECK(h.Count(EventType::SESSION_PAUSED) == 0);
    CHECK(h.Count(EventType::STATUS) == statuses + 1);
}

TEST_CASE("Engine: breaks today and export") {
    EngineHarness h("engine_export", kMonday10am);
    double now = kMonday10am;
    h.Set("micro_break_interval", 60, now);
    h.Send(CommandType::START_SESSION, now);
    now += 60.0;
    h.engine->Tick(now, 60.0);
    h.Send(CommandType::SKIP_BREAK, now);

    h.Send(CommandType::GET_BREAKS_TODAY, now);
    const Event *today = h.Last(EventType::BREAKS_TODAY);
    REQUIRE(today != nullptr);
    REQUIRE(today->data["breaks"].size() == 1);
    CHECK(today->data["breaks"][0]["skipped"] == true);

    h.Send(CommandType::EXPORT_DATA, now);
    CHECK(h.Last(EventType::ERROR)->data["message"] == "Missing field: path");

    const std::string out = h.DbPath() + ".export.json";
    h.Send(CommandType::EXPORT_DATA, now, {{"path", out}});
    REQUIRE(h.Last(EventType::DATA_EXPORTED) != nullptr);
    CHECK(h.Last(EventType::DATA_EXPORTED)->data["records"] == 1);
}

TEST_CASE("Engine: replies carry the events a command produced") {
    EngineHarness h("engine_reply", kMonday10am);
    std::vector<Event> reply;
    h.engine->Post(Command{CommandType::GET_SESSION_STATE, nlohmann::json::object()},
                   [&reply](std::vector<Event> events) { reply = std::move(events); });
    h.engine->DrainCommands(kMonday10am);
    REQUIRE(reply.size() == 1);
    CHECK(reply[0].type == EventType::SESSION_STATE);
    CHECK(reply[0].data["state"] == "idle");
}

TEST_CASE("Engine: the run loop ticks until shutdown") {
    EngineHarness h("engine_run", NowUnix());
    h.engine->SetTickInterval(std::chrono::milliseconds(10));

    std::thread loop([&h]() { h.engine->Run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    h.engine->Post(Command{CommandType::SHUTDOWN, nlohmann::json::object()});
    loop.join();

    CHECK_FALSE(h.engine->IsRunning());
    CHECK(h.engine->ShutdownRequested());
    CHECK(h.Count(EventType::SHUTDOWN_ACK) == 1);
    CHECK(h.Count(EventType::METRICS) >= 1);
}

TEST_CASE("Engine: a command is not acknowledged when its timer state cannot be saved") {
    EngineHarness h("engine_checkpoint_fail", kMonday10am);
    double now = kMonday10am;
    h.Send(CommandType::START_SESSION, now);
    now += 100.0;
    h.engine->Tick(now, 100.0);

    DropTable(h.DbPath(), "timer_state");
    const std::size_t before = h.events.size();
    h.Send(CommandType::RESET_ALL_TIMERS, now);

    CHECK(h.Count(EventType::TIMERS_RESET) == 0);
    REQUIRE(h.events.size() > before);
    CHECK(h.events.back().type == EventType::ERROR);
    CHECK(h.events.back().data["message"].get<std::string>().find("timer state") !=
          std::string::npos);

    std::string error;
    CHECK_FALSE(h.engine->SaveCheckpoint(error));
    CHECK_FALSE(error.empty());
}

TEST_CASE("Engine: a break is not fired when its log row cannot be written") {
    EngineHarness h("engine_breaklog_fail", kMonday10am);
    double now = kMonday10am;
    h.Set("micro_break_interval", 600, now);
    h.Send(CommandType::START_SESSION, now);

    DropTable(h.DbPath(), "break_logs");
    now += 600.0;
    h.engine->Tick(now, 600.0);

    CHECK(h.Count(EventType::BREAK_DUE) == 0);
    CHECK(h.Last(EventType::ERROR) != nullptr);
    CHECK_FALSE(h.engine->Timers().Pending().has_value());
    CHECK(h.engine->Timers().Get(BreakKind::MICRO).IsDue());
}
