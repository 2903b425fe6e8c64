#include <doctest/doctest.h>

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "settings.hpp"
#include "sqlite.hpp"
#include "test_support.hpp"

TEST_CASE("SQLite: opening an unusable path throws") {
    CHECK_THROWS_AS(SQLite("/nonexistent-dir/aura/aura.sqlite"), std::runtime_error);
}

TEST_CASE("SQLite: break logs start open and take one resolution") {
    ScratchDir dir("store_breaks");
    SQLite db(dir.File("aura.sqlite"));
    std::string error;

    int64_t id = 0;
    REQUIRE(db.InsertBreakLog(BreakKind::MACRO, 180, 1000.0, id, error));
    CHECK(id > 0);

    auto log = db.GetBreakLog(id);
    REQUIRE(log.has_value());
    CHECK(log->kind == BreakKind::MACRO);
    CHECK(log->duration_seconds == 180);
    CHECK(log->timestamp == doctest::Approx(1000.0));
    CHECK_FALSE(log->completed);
    CHECK_FALSE(log->skipped);
    CHECK_FALSE(log->snoozed);

    REQUIRE(db.ResolveBreakLog(id, BreakResolution::SNOOZED, error));
    REQUIRE(db.ResolveBreakLog(id, BreakResolution::COMPLETED, error));
    log = db.GetBreakLog(id);
    REQUIRE(log.has_value());
    CHECK(log->completed);
    CHECK_FALSE(log->skipped);
    CHECK_FALSE(log->snoozed);

    CHECK_FALSE(db.ResolveBreakLog(id + 100, BreakResolution::SKIPPED, error));
    CHECK(error == "break log not found: " + std::to_string(id + 100));

    int64_t other = 0;
    REQUIRE(db.InsertBreakLog(BreakKind::MICRO, 20, 5000.0, other, error));
    CHECK(db.FetchBreakLogs(0.0, 2000.0).size() == 1);
    CHECK(db.FetchBreakLogs(0.0, 6000.0).size() == 2);
}

TEST_CASE("SQLite: hydration totals by range") {
    ScratchDir dir("store_hydration");
    SQLite db(dir.File("aura.sqlite"));
    std::string error;
    int64_t id = 0;

    REQUIRE(db.InsertHydrationLog(250, 100.0, id, error));
    REQUIRE(db.InsertHydrationLog(500, 200.0, id, error));
    REQUIRE(db.InsertHydrationLog(300, 400.0, id, error));

    CHECK(db.GetHydrationTotal(0.0, 300.0) == 750);
    CHECK(db.GetHydrationTotal(300.0, 500.0) == 300);
    CHECK(db.GetHydrationTotal(1000.0, 2000.0) == 0);
    CHECK(db.FetchHydrationLogs(0.0, 1000.0).size() == 3);
}

TEST_CASE("SQLite: schedule rules round-trip in id order") {
    ScratchDir dir("store_rules");
    SQLite db(dir.File("aura.sqlite"));
    std::string error;

    ScheduleRule a;
    a.time = "09:00";
    a.action = ScheduleAction::START_SESSION;
    a.days = {"mon", "tue"};
    int64_t idA = 0;
    REQUIRE(db.AddScheduleRule(a, idA, error));

    ScheduleRule b;
    b.title = "Lunch";
    b.time = "12:30";
    b.action = ScheduleAction::PAUSE;
    b.days = {"fri"};
    b.enabled = false;
    int64_t idB = 0;
    REQUIRE(db.AddScheduleRule(b, idB, error));

    std::vector<ScheduleRule> rules;
    REQUIRE(db.FetchScheduleRules(rules, error));
    REQUIRE(rules.size() == 2);
    CHECK(rules[0].id == idA);
    CHECK(rules[0].action == ScheduleAction::START_SESSION);
    CHECK(rules[0].days == std::vector<std::string>{"mon", "tue"});
    CHECK(rules[1].title == "Lunch");
    CHECK_FALSE(rules[1].enabled);

    b.id = idB;
    b.enabled = true;
    REQUIRE(db.UpdateScheduleRule(b, error));
    CHECK(db.GetScheduleRule(idB)->enabled);

    REQUIRE(db.DeleteScheduleRule(idA, error));
    CHECK_FALSE(db.DeleteScheduleRule(idA, error));
    CHECK_FALSE(db.GetScheduleRule(idA).has_value());
}

TEST_CASE("SQLite: timer checkpoints overwrite per kind") {
    ScratchDir dir("store_timers");
    SQLite db(dir.File("aura.sqlite"));
    std::string error;

    TimerCheckpoint cp;
    cp.kind = BreakKind::MICRO;
    cp.elapsed = 120.0;
    REQUIRE(db.SaveTimerState(cp, error));
    cp.elapsed = 240.0;
    cp.phase = BreakPhase::FIRED_PENDING;
    cp.record_id = 3;
    REQUIRE(db.SaveTimerState(cp, error));

    const auto states = db.LoadTimerStates();
    REQUIRE(states.size() == 1);
    CHECK(states[0].kind == BreakKind::MICRO);
    CHECK(states[0].elapsed == doctest::Approx(240.0));
    CHECK(states[0].phase == BreakPhase::FIRED_PENDING);
    CHECK(states[0].record_id == 3);
}

TEST_CASE("SQLite: export writes every table") {
    ScratchDir dir("store_export");
    SQLite db(dir.File("aura.sqlite"));
    std::string error;
    int64_t id = 0;

    Settings settings(db);
    REQUIRE(settings.EnsureDefaults(error));
    REQUIRE(db.InsertBreakLog(BreakKind::MICRO, 20, 10.0, id, error));
    REQUIRE(db.InsertHydrationLog(250, 20.0, id, error));

    int records = 0;
    const std::string out = dir.File("export.json");
    REQUIRE(db.ExportData(out, records, error));
    CHECK(records >= 2);

    std::ifstream in(out);
    const nlohmann::json doc = nlohmann::json::parse(in);
    CHECK(doc["break_logs"].size() == 1);
    CHECK(doc["hydration_logs"].size() == 1);
    CHECK(doc["settings"]["water_goal"] == "2000");
    CHECK(doc["schedule_rules"].is_array());

    CHECK_FALSE(db.ExportData(dir.File("missing/dir/export.json"), records, error));
    CHECK_FALSE(error.empty());
}

TEST_CASE("Settings: defaults are seeded once and never overwrite user values") {
    ScratchDir dir("settings_seed");
    const std::string path = dir.File("aura.sqlite");
    std::string error;
    {
        SQLite db(path);
        Settings settings(db);
        REQUIRE(settings.EnsureDefaults(error));
        CHECK(settings.GetInt("micro_break_interval") == 1200);
        CHECK(settings.GetString("timer_mode") == "wall-clock");
        CHECK(settings.All().size() == Settings::Defaults().size());
        REQUIRE(settings.Update("micro_break_interval", "600", error));
    }
    SQLite db(path);
    Settings settings(db);
    REQUIRE(settings.EnsureDefaults(error));
    CHECK(settings.GetInt("micro_break_interval") == 600);
}

TEST_CASE("Settings: typed access") {
    ScratchDir dir("settings_typed");
    SQLite db(dir.File("aura.sqlite"));
    Settings settings(db);
    std::string error;
    REQUIRE(settings.EnsureDefaults(error));

    CHECK(settings.GetBool("auto_detect_fullscreen"));
    CHECK_FALSE(settings.GetBool("immersive_mode_enabled"));
    CHECK(settings.GetDouble("idle_zero_threshold") == doctest::Approx(1.0));
    const auto blocklist = settings.GetList("blocklist_processes");
    CHECK(blocklist.size() == 5);
    CHECK(blocklist[0] == "league_of_legends.exe");
}

TEST_CASE("Settings: validation") {
    ScratchDir dir("settings_validate");
    SQLite db(dir.File("aura.sqlite"));
    Settings settings(db);
    std::string error;
    REQUIRE(settings.EnsureDefaults(error));

    CHECK_FALSE(settings.Update("no_such_key", "1", error));
    CHECK(error == "Unknown setting: no_such_key");
    CHECK_FALSE(settings.Update("micro_break_interval", "0", error));
    CHECK_FALSE(settings.Update("micro_break_interval", "ten", error));
    CHECK_FALSE(settings.Update("water_goal", "-1", error));
    CHECK_FALSE(settings.Update("timer_mode", "sometimes", error));
    CHECK_FALSE(settings.Update("auto_detect_fullscreen", "yes", error));
    CHECK_FALSE(settings.Update("blocklist_processes", "{\"a\":1}", error));
    CHECK_FALSE(settings.Update("blocklist_processes", "[1,2]", error));
    CHECK(settings.GetInt("micro_break_interval") == 1200);

    CHECK(settings.Update("water_goal", "0", error));
    CHECK(settings.Update("timer_mode", "active", error));
    CHECK(settings.Update("blocklist_processes", "[\"mpv\"]", error));
    CHECK(settings.GetList("blocklist_processes") == std::vector<std::string>{"mpv"});
}
