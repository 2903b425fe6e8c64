#include <doctest/doctest.h>

#include "break_timer.hpp"

static BreakTimerSet MicroOnly(int micro_interval) {
    BreakTimerSet timers;
    timers.Reload(BreakKind::MICRO, micro_interval, 20);
    timers.Reload(BreakKind::MACRO, 100000, 180);
    timers.Reload(BreakKind::HYDRATION, 100000, 0);
    return timers;
}

TEST_CASE("BreakTimer: due once elapsed reaches the interval") {
    BreakTimer timer(BreakKind::MICRO, 60, 20);
    timer.Advance(59.0);
    CHECK_FALSE(timer.IsDue());
    CHECK(timer.Remaining() == doctest::Approx(1.0));
    timer.Advance(1.0);
    CHECK(timer.IsDue());
    CHECK(timer.Progress() == doctest::Approx(1.0));

    timer.Advance(-5.0);
    CHECK(timer.Elapsed() == doctest::Approx(60.0));
}

TEST_CASE("BreakTimer: a fired timer is frozen until resolved") {
    BreakTimer timer(BreakKind::MACRO, 60, 180);
    timer.Advance(60.0);
    timer.Fire(7);
    CHECK(timer.IsPending());
    CHECK_FALSE(timer.IsDue());
    CHECK(timer.RecordId() == 7);
    CHECK(timer.FiredDuration() == 180);

    timer.Advance(30.0);
    CHECK(timer.Elapsed() == doctest::Approx(60.0));

    // A reset while pending keeps the break open.
    timer.Reset();
    CHECK(timer.IsPending());
    CHECK(timer.RecordId() == 7);

    timer.Resolve();
    CHECK(timer.Phase() == BreakPhase::RESOLVED);
    CHECK(timer.Elapsed() == doctest::Approx(0.0));
    CHECK(timer.RecordId() == 0);
}

TEST_CASE("BreakTimer: reload keeps elapsed, reload-and-reset clears it") {
    BreakTimer timer(BreakKind::MICRO, 600, 20);
    timer.Advance(300.0);

    timer.Reload(900, 30);
    CHECK(timer.Interval() == 900);
    CHECK(timer.Duration() == 30);
    CHECK(timer.Elapsed() == doctest::Approx(300.0));

    timer.ReloadAndReset(1200, 30);
    CHECK(timer.Interval() == 1200);
    CHECK(timer.Elapsed() == doctest::Approx(0.0));
}

TEST_CASE("BreakTimer: duration changes after firing do not alter the pending break") {
    BreakTimer timer(BreakKind::MICRO, 60, 20);
    timer.Advance(60.0);
    timer.Fire(1);
    timer.Reload(60, 45);
    CHECK(timer.FiredDuration() == 20);
    CHECK(timer.Duration() == 45);
}

TEST_CASE("BreakTimerSet: defaults") {
    BreakTimerSet timers;
    CHECK(timers.Get(BreakKind::MICRO).Interval() == 1200);
    CHECK(timers.Get(BreakKind::MICRO).Duration() == 20);
    CHECK(timers.Get(BreakKind::MACRO).Interval() == 2700);
    CHECK(timers.Get(BreakKind::MACRO).Duration() == 180);
    CHECK(timers.Get(BreakKind::HYDRATION).Interval() == 1800);
    CHECK(timers.Mode() == TimerMode::WALL_CLOCK);
    CHECK_FALSE(timers.Pending().has_value());
}

TEST_CASE("BreakTimerSet: nothing runs outside an active session or while reminders pause") {
    BreakTimerSet timers = MicroOnly(60);

    CHECK_FALSE(timers.Advance(120.0, SessionState::IDLE, false, ActivityState::ACTIVE));
    CHECK_FALSE(timers.Advance(120.0, SessionState::PAUSED, false, ActivityState::ACTIVE));
    CHECK_FALSE(timers.Advance(120.0, SessionState::ACTIVE, true, ActivityState::ACTIVE));
    CHECK(timers.Get(BreakKind::MICRO).Elapsed() == doctest::Approx(0.0));

    auto due = timers.Advance(60.0, SessionState::ACTIVE, false, ActivityState::ACTIVE);
    REQUIRE(due.has_value());
    CHECK(*due == BreakKind::MICRO);
}

TEST_CASE("BreakTimerSet: wall-clock mode runs through idle time") {
    BreakTimerSet timers = MicroOnly(60);
    timers.SetMode(TimerMode::WALL_CLOCK);

    auto due = timers.Advance(60.0, SessionState::ACTIVE, false, ActivityState::IDLE);
    REQUIRE(due.has_value());
    CHECK(*due == BreakKind::MICRO);
}

TEST_CASE("BreakTimerSet: active-time mode only counts active seconds") {
    BreakTimerSet timers = MicroOnly(60);
    timers.SetMode(TimerMode::ACTIVE_TIME);

    CHECK_FALSE(timers.Advance(30.0, SessionState::ACTIVE, false, ActivityState::IDLE));
    CHECK_FALSE(timers.Advance(30.0, SessionState::ACTIVE, false, ActivityState::IMMERSIVE));
    CHECK(timers.Get(BreakKind::MICRO).Elapsed() == doctest::Approx(0.0));

    CHECK_FALSE(timers.Advance(59.0, SessionState::ACTIVE, false, ActivityState::ACTIVE));
    auto due = timers.Advance(1.0, SessionState::ACTIVE, false, ActivityState::ACTIVE);
    REQUIRE(due.has_value());
    CHECK(*due == BreakKind::MICRO);
}

TEST_CASE("BreakTimerSet: immersive activity holds a due break in active-time mode") {
    BreakTimerSet timers = MicroOnly(60);
    timers.SetMode(TimerMode::ACTIVE_TIME);
    timers.Get(BreakKind::MICRO).Advance(60.0);

    CHECK_FALSE(timers.Advance(1.0, SessionState::ACTIVE, false, ActivityState::IMMERSIVE));
    auto due = timers.Advance(1.0, SessionState::ACTIVE, false, ActivityState::ACTIVE);
    REQUIRE(due.has_value());
    CHECK(*due == BreakKind::MICRO);
}

TEST_CASE("BreakTimerSet: macro wins over micro when both are due") {
    BreakTimerSet timers;
    timers.Reload(BreakKind::MICRO, 60, 20);
    timers.Reload(BreakKind::MACRO, 60, 180);
    timers.Reload(BreakKind::HYDRATION, 60, 0);

    auto due = timers.Advance(60.0, SessionState::ACTIVE, false, ActivityState::ACTIVE);
    REQUIRE(due.has_value());
    CHECK(*due == BreakKind::MACRO);
}

TEST_CASE("BreakTimerSet: a pending break freezes every timer") {
    BreakTimerSet timers = MicroOnly(60);
    auto due = timers.Advance(60.0, SessionState::ACTIVE, false, ActivityState::ACTIVE);
    REQUIRE(due.has_value());
    timers.Fire(*due, 11);

    const double macroBefore = timers.Get(BreakKind::MACRO).Elapsed();
    CHECK_FALSE(timers.Advance(500.0, SessionState::ACTIVE, false, ActivityState::ACTIVE));
    CHECK(timers.Get(BreakKind::MACRO).Elapsed() == doctest::Approx(macroBefore));

    // A second fire is refused.
    timers.Fire(BreakKind::MACRO, 12);
    auto pending = timers.Pending();
    REQUIRE(pending.has_value());
    CHECK(pending->kind == BreakKind::MICRO);
    CHECK(pending->record_id == 11);
    CHECK(pending->duration_seconds == 20);
}

TEST_CASE("BreakTimerSet: snooze re-arms the same record") {
    BreakTimerSet timers = MicroOnly(600);
    timers.Advance(600.0, SessionState::ACTIVE, false, ActivityState::ACTIVE);
    timers.Fire(BreakKind::MICRO, 5);

    auto snoozed = timers.Snooze(5);
    REQUIRE(snoozed.has_value());
    CHECK(snoozed->record_id == 5);
    CHECK_FALSE(timers.Pending().has_value());
    CHECK(timers.Get(BreakKind::MICRO).Elapsed() == doctest::Approx(300.0));
    CHECK(timers.Get(BreakKind::MICRO).RecordId() == 5);

    CHECK_FALSE(timers.Advance(299.0, SessionState::ACTIVE, false, ActivityState::ACTIVE));
    auto due = timers.Advance(1.0, SessionState::ACTIVE, false, ActivityState::ACTIVE);
    REQUIRE(due.has_value());
    CHECK(*due == BreakKind::MICRO);
}

TEST_CASE("BreakTimerSet: snoozing longer than the interval restarts from zero") {
    BreakTimerSet timers = MicroOnly(60);
    timers.Advance(60.0, SessionState::ACTIVE, false, ActivityState::ACTIVE);
    timers.Fire(BreakKind::MICRO, 1);
    timers.Snooze(10);
    CHECK(timers.Get(BreakKind::MICRO).Elapsed() == doctest::Approx(0.0));
}

TEST_CASE("BreakTimerSet: a new interval drops the snoozed record") {
    BreakTimerSet timers = MicroOnly(600);
    timers.Advance(600.0, SessionState::ACTIVE, false, ActivityState::ACTIVE);
    timers.Fire(BreakKind::MICRO, 42);
    timers.Snooze(5);
    REQUIRE(timers.Get(BreakKind::MICRO).RecordId() == 42);

    timers.ReloadAndReset(BreakKind::MICRO, 900, 20);
    const BreakTimer &micro = timers.Get(BreakKind::MICRO);
    CHECK(micro.Elapsed() == doctest::Approx(0.0));
    CHECK(micro.RecordId() == 0);
    CHECK(micro.Phase() == BreakPhase::IDLE);

    // A pending break keeps its record through a reload.
    timers.Advance(900.0, SessionState::ACTIVE, false, ActivityState::ACTIVE);
    timers.Fire(BreakKind::MICRO, 43);
    timers.ReloadAndReset(BreakKind::MICRO, 600, 20);
    CHECK(micro.IsPending());
    CHECK(micro.RecordId() == 43);
}

TEST_CASE("BreakTimerSet: silencing hydration drops its snoozed record") {
    BreakTimerSet timers;
    timers.Reload(BreakKind::MICRO, 100000, 20);
    timers.Reload(BreakKind::MACRO, 100000, 180);
    timers.Reload(BreakKind::HYDRATION, 60, 0);
    timers.Advance(60.0, SessionState::ACTIVE, false, ActivityState::ACTIVE);
    timers.Fire(BreakKind::HYDRATION, 9);
    timers.Snooze(1);
    REQUIRE(timers.Get(BreakKind::HYDRATION).RecordId() == 9);

    timers.SetHydrationSilenced(true);
    CHECK(timers.Get(BreakKind::HYDRATION).RecordId() == 0);
    CHECK(timers.Get(BreakKind::HYDRATION).Phase() == BreakPhase::IDLE);
}

TEST_CASE("BreakTimerSet: completing a macro break also resets the micro timer") {
    BreakTimerSet timers;
    timers.Reload(BreakKind::MICRO, 1000, 20);
    timers.Reload(BreakKind::MACRO, 100, 180);
    timers.Reload(BreakKind::HYDRATION, 100000, 0);

    auto due = timers.Advance(100.0, SessionState::ACTIVE, false, ActivityState::ACTIVE);
    REQUIRE(due.has_value());
    REQUIRE(*due == BreakKind::MACRO);
    timers.Fire(BreakKind::MACRO, 3);
    CHECK(timers.Get(BreakKind::MICRO).Elapsed() == doctest::Approx(100.0));

    auto done = timers.Complete();
    REQUIRE(done.has_value());
    CHECK(done->kind == BreakKind::MACRO);
    CHECK(timers.Get(BreakKind::MICRO).Elapsed() == doctest::Approx(0.0));
    CHECK(timers.Get(BreakKind::MACRO).Elapsed() == doctest::Approx(0.0));
}

TEST_CASE("BreakTimerSet: skipping a micro break leaves the macro timer alone") {
    BreakTimerSet timers = MicroOnly(60);
    timers.Advance(60.0, SessionState::ACTIVE, false, ActivityState::ACTIVE);
    timers.Fire(BreakKind::MICRO, 2);

    auto skipped = timers.Skip();
    REQUIRE(skipped.has_value());
    CHECK(skipped->kind == BreakKind::MICRO);
    CHECK(timers.Get(BreakKind::MACRO).Elapsed() == doctest::Approx(60.0));
    CHECK_FALSE(timers.Skip().has_value());
    CHECK_FALSE(timers.Complete().has_value());
    CHECK_FALSE(timers.Snooze(5).has_value());
}

TEST_CASE("BreakTimerSet: silenced hydration is held at zero and never fires") {
    BreakTimerSet timers;
    timers.Reload(BreakKind::MICRO, 100000, 20);
    timers.Reload(BreakKind::MACRO, 100000, 180);
    timers.Reload(BreakKind::HYDRATION, 60, 0);
    timers.Get(BreakKind::HYDRATION).Advance(30.0);

    timers.SetHydrationSilenced(true);
    CHECK(timers.Get(BreakKind::HYDRATION).Elapsed() == doctest::Approx(0.0));
    CHECK_FALSE(timers.Advance(120.0, SessionState::ACTIVE, false, ActivityState::ACTIVE));
    CHECK(timers.Get(BreakKind::HYDRATION).Elapsed() == doctest::Approx(0.0));

    const auto status = timers.StatusJson();
    CHECK(status["timers"]["hydration"]["silenced"].get<bool>());
    CHECK_FALSE(status["timers"]["hydration"]["is_due"].get<bool>());
    CHECK(timers.NextBreakJson()["type"] != "hydration");

    timers.SetHydrationSilenced(false);
    auto due = timers.Advance(60.0, SessionState::ACTIVE, false, ActivityState::ACTIVE);
    REQUIRE(due.has_value());
    CHECK(*due == BreakKind::HYDRATION);
}

TEST_CASE("BreakTimerSet: reset all keeps or clears the pending break") {
    BreakTimerSet timers = MicroOnly(60);
    timers.Advance(60.0, SessionState::ACTIVE, false, ActivityState::ACTIVE);
    timers.Fire(BreakKind::MICRO, 9);

    timers.ResetAll(false);
    CHECK(timers.Pending().has_value());
    CHECK(timers.Get(BreakKind::MACRO).Elapsed() == doctest::Approx(0.0));

    timers.ResetAll(true);
    CHECK_FALSE(timers.Pending().has_value());
    CHECK(timers.Get(BreakKind::MICRO).Phase() == BreakPhase::IDLE);
    CHECK(timers.Get(BreakKind::MICRO).Elapsed() == doctest::Approx(0.0));
}

TEST_CASE("BreakTimerSet: checkpoints restore and a second pending break is dropped") {
    BreakTimerSet timers = MicroOnly(60);
    timers.Advance(60.0, SessionState::ACTIVE, false, ActivityState::ACTIVE);
    timers.Fire(BreakKind::MICRO, 4);
    const auto checkpoints = timers.Checkpoints();

    BreakTimerSet restored = MicroOnly(60);
    for (const auto &cp : checkpoints) {
        restored.Restore(cp);
    }
    auto pending = restored.Pending();
    REQUIRE(pending.has_value());
    CHECK(pending->kind == BreakKind::MICRO);
    CHECK(pending->record_id == 4);

    TimerCheckpoint extra;
    extra.kind = BreakKind::MACRO;
    extra.elapsed = 10.0;
    extra.phase = BreakPhase::FIRED_PENDING;
    extra.record_id = 8;
    restored.Restore(extra);
    CHECK(restored.Get(BreakKind::MACRO).Phase() == BreakPhase::IDLE);
    CHECK(restored.Pending()->kind == BreakKind::MICRO);
}

TEST_CASE("BreakTimerSet: status reports the pending break") {
    BreakTimerSet timers = MicroOnly(60);
    CHECK(timers.StatusJson()["pending_break"].is_null());

    timers.Advance(60.0, SessionState::ACTIVE, false, ActivityState::ACTIVE);
    timers.Fire(BreakKind::MICRO, 21);
    const auto status = timers.StatusJson();
    CHECK(status["timer_mode"] == "wall-clock");
    CHECK(status["pending_break"]["break_type"] == "micro");
    CHECK(status["pending_break"]["record_id"] == 21);
    CHECK(status["pending_break"]["theme_color"] == ThemeColor(BreakKind::MICRO));
    CHECK(status["timers"]["micro"]["phase"] == "fired_pending");
}

TEST_CASE("BreakTimerSet: next break is the soonest timer") {
    BreakTimerSet timers;
    timers.Reload(BreakKind::MICRO, 600, 20);
    timers.Reload(BreakKind::MACRO, 300, 180);
    timers.Reload(BreakKind::HYDRATION, 900, 0);

    const auto next = timers.NextBreakJson();
    CHECK(next["type"] == "macro");
    CHECK(next["remaining_seconds"] == 300);
    CHECK(next["duration_seconds"] == 180);
}
