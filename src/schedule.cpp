#include "schedule.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <initializer_list>

#include <spdlog/spdlog.h>

#include "json.hpp"

static constexpr const char *kLastFiredKey = "schedule_last_fired";

static const char *kDayNames[] = {"mon", "tue", "wed", "thu", "fri", "sat", "sun"};

// ─────────────────────────────────────
bool ParseRuleTime(const std::string &time, int &hour, int &minute) {
    if (time.size() != 5 || time[2] != ':') {
        return false;
    }
    for (std::size_t i : {0u, 1u, 3u, 4u}) {
        if (!std::isdigit(static_cast<unsigned char>(time[i]))) {
            return false;
        }
    }
    hour = (time[0] - '0') * 10 + (time[1] - '0');
    minute = (time[3] - '0') * 10 + (time[4] - '0');
    return hour <= 23 && minute <= 59;
}

// ─────────────────────────────────────
bool ValidateScheduleRule(const ScheduleRule &rule, std::string &error) {
    int hour = 0;
    int minute = 0;
    if (!ParseRuleTime(rule.time, hour, minute)) {
        error = "Invalid time '" + rule.time + "', expected HH:MM";
        return false;
    }
    if (rule.days.empty()) {
        error = "Schedule rule needs at least one day";
        return false;
    }
    for (const auto &day : rule.days) {
        if (std::find(std::begin(kDayNames), std::end(kDayNames), day) == std::end(kDayNames)) {
            error = "Invalid day '" + day + "', expected mon..sun";
            return false;
        }
    }
    return true;
}

// ─────────────────────────────────────
static const char *ActionLabel(ScheduleAction action) {
    switch (action) {
    case ScheduleAction::PAUSE:
        return "Pause";
    case ScheduleAction::RESUME:
        return "Resume";
    case ScheduleAction::RESET:
        return "Reset";
    case ScheduleAction::START_SESSION:
        return "Start session";
    case ScheduleAction::END_SESSION:
        return "End session";
    }
    return "Pause";
}

// ─────────────────────────────────────
std::string RuleDisplayTitle(const ScheduleRule &rule) {
    if (!rule.title.empty()) {
        return rule.title;
    }
    return std::string(ActionLabel(rule.action)) + " at " + rule.time;
}

// ─────────────────────────────────────
nlohmann::json RuleToJson(const ScheduleRule &rule) {
    return {{"id", rule.id},           {"title", rule.title},
            {"time", rule.time},       {"action", ToString(rule.action)},
            {"days", rule.days},       {"enabled", rule.enabled},
            {"created_at", rule.created_at}};
}

// ─────────────────────────────────────
bool RuleFromJson(const nlohmann::json &j, ScheduleRule &rule, bool merge, std::string &error) {
    if (!j.is_object()) {
        error = "Schedule rule must be an object";
        return false;
    }
    JsonParse parse;

    if (j.contains("time")) {
        if (!j["time"].is_string()) {
            error = "time must be a string";
            return false;
        }
        rule.time = j["time"].get<std::string>();
    } else if (!merge) {
        error = "Missing field: time";
        return false;
    }

    if (j.contains("action")) {
        const std::string action = parse.GetString(j, "action", "");
        auto parsed = ScheduleActionFromString(action);
        if (!parsed) {
            error = "Invalid action '" + action + "'";
            return false;
        }
        rule.action = *parsed;
    } else if (!merge) {
        error = "Missing field: action";
        return false;
    }

    if (j.contains("days")) {
        if (!j["days"].is_array()) {
            error = "days must be an array";
            return false;
        }
        rule.days.clear();
        for (const auto &d : j["days"]) {
            if (!d.is_string()) {
                error = "days must contain strings";
                return false;
            }
            rule.days.push_back(ToLower(d.get<std::string>()));
        }
    } else if (!merge) {
        error = "Missing field: days";
        return false;
    }

    if (j.contains("title")) {
        if (j["title"].is_string()) {
            rule.title = j["title"].get<std::string>();
        } else if (j["title"].is_null()) {
            rule.title.clear();
        } else {
            error = "title must be a string";
            return false;
        }
    }

    if (j.contains("enabled")) {
        rule.enabled = parse.GetBool(j, "enabled", rule.enabled);
    }

    return ValidateScheduleRule(rule, error);
}

// ─────────────────────────────────────
ScheduleEngine::ScheduleEngine(SQLite &db) : m_Db(db) {
    LoadFiredMinutes();
}

// ─────────────────────────────────────
void ScheduleEngine::LoadFiredMinutes() {
    auto stored = m_Db.GetEngineValue(kLastFiredKey);
    if (!stored || stored->empty()) {
        return;
    }
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(*stored);
    } catch (const nlohmann::json::exception &e) {
        spdlog::warn("Ignoring unreadable {}: {}", kLastFiredKey, e.what());
        return;
    }
    if (!j.is_object()) {
        spdlog::warn("Ignoring {}: not an object", kLastFiredKey);
        return;
    }

    JsonParse parse;
    for (auto it = j.begin(); it != j.end(); ++it) {
        char *end = nullptr;
        const long long id = std::strtoll(it.key().c_str(), &end, 10);
        if (end == it.key().c_str() || *end != '\0') {
            continue;
        }
        const int64_t minute = parse.GetInt64(j, it.key(), -1);
        if (minute >= 0) {
            m_LastFired[id] = minute;
        }
    }
}

// ─────────────────────────────────────
void ScheduleEngine::SaveFiredMinutes() {
    nlohmann::json j = nlohmann::json::object();
    for (const auto &[id, minute] : m_LastFired) {
        j[std::to_string(id)] = minute;
    }
    std::string error;
    if (!m_Db.SetEngineValue(kLastFiredKey, j.dump(), error)) {
        spdlog::error("Failed to save schedule fire times: {}", error);
    }
}

// ─────────────────────────────────────
void ScheduleEngine::RefreshIfDirty() {
    if (!m_Dirty) {
        return;
    }
    std::vector<ScheduleRule> rules;
    std::string error;
    if (!m_Db.FetchScheduleRules(rules, error)) {
        spdlog::error("Failed to reload schedule rules, keeping {} cached: {}", m_Rules.size(),
                      error);
        return;
    }
    m_Rules = std::move(rules);
    m_Dirty = false;
    spdlog::debug("Loaded {} schedule rules", m_Rules.size());
}

// ─────────────────────────────────────
const std::vector<ScheduleRule> &ScheduleEngine::Rules() {
    RefreshIfDirty();
    return m_Rules;
}

// ─────────────────────────────────────
nlohmann::json ScheduleEngine::RulesJson() {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto &rule : Rules()) {
        arr.push_back(RuleToJson(rule));
    }
    return arr;
}

// ─────────────────────────────────────
bool ScheduleEngine::Add(ScheduleRule rule, double now, int64_t &id, std::string &error) {
    if (!ValidateScheduleRule(rule, error)) {
        return false;
    }
    rule.created_at = now;
    if (!m_Db.AddScheduleRule(rule, id, error)) {
        return false;
    }
    m_Dirty = true;
    spdlog::info("Schedule rule {} added: {} at {}", id, ToString(rule.action), rule.time);
    return true;
}

// ─────────────────────────────────────
bool ScheduleEngine::Update(int64_t id, const nlohmann::json &fields, std::string &error) {
    auto existing = m_Db.GetScheduleRule(id);
    if (!existing) {
        error = "schedule rule not found: " + std::to_string(id);
        return false;
    }
    ScheduleRule rule = *existing;
    if (!RuleFromJson(fields, rule, true, error)) {
        return false;
    }
    if (!m_Db.UpdateScheduleRule(rule, error)) {
        return false;
    }
    m_Dirty = true;
    // Let an edited rule fire again in the current minute.
    if (m_LastFired.erase(id) > 0) {
        SaveFiredMinutes();
    }
    m_LastWarned.erase(id);
    spdlog::info("Schedule rule {} updated", id);
    return true;
}

// ─────────────────────────────────────
bool ScheduleEngine::Delete(int64_t id, std::string &error) {
    if (!m_Db.DeleteScheduleRule(id, error)) {
        return false;
    }
    m_Dirty = true;
    if (m_LastFired.erase(id) > 0) {
        SaveFiredMinutes();
    }
    m_LastWarned.erase(id);
    spdlog::info("Schedule rule {} deleted", id);
    return true;
}

// ─────────────────────────────────────
static std::string FormatHHMM(const LocalTime &lt) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", lt.hour, lt.minute);
    return buf;
}

// ─────────────────────────────────────
static bool RuleMatches(const ScheduleRule &rule, const std::string &hhmm, const char *weekday) {
    if (!rule.enabled || rule.time != hhmm) {
        return false;
    }
    return std::find(rule.days.begin(), rule.days.end(), weekday) != rule.days.end();
}

// ─────────────────────────────────────
std::vector<ScheduleFiring> ScheduleEngine::Evaluate(double now) {
    std::vector<ScheduleFiring> out;

    const int64_t minuteKey = static_cast<int64_t>(std::floor(now / 60.0));
    if (m_HasEvaluated && minuteKey == m_LastMinute) {
        return out;
    }
    m_HasEvaluated = true;
    m_LastMinute = minuteKey;

    RefreshIfDirty();

    // Only the current minute matters for deduplication.
    bool firedChanged = false;
    for (auto it = m_LastFired.begin(); it != m_LastFired.end();) {
        if (it->second != minuteKey) {
            it = m_LastFired.erase(it);
            firedChanged = true;
        } else {
            ++it;
        }
    }

    const LocalTime lt = ToLocalTime(now);
    const std::string hhmm = FormatHHMM(lt);
    const char *weekday = WeekdayName(lt.weekday);

    // m_Rules is ordered by id.
    for (const auto &rule : m_Rules) {
        if (!RuleMatches(rule, hhmm, weekday)) {
            continue;
        }
        auto it = m_LastFired.find(rule.id);
        if (it != m_LastFired.end() && it->second == minuteKey) {
            continue;
        }
        m_LastFired[rule.id] = minuteKey;
        firedChanged = true;

        ScheduleFiring firing;
        firing.kind = ScheduleFiring::ACTION;
        firing.rule = rule;
        firing.title = RuleDisplayTitle(rule);
        out.push_back(firing);
        spdlog::info("Schedule rule {} fired: {} at {}", rule.id, ToString(rule.action), hhmm);
    }

    if (firedChanged) {
        SaveFiredMinutes();
    }

    const int64_t nextMinute = minuteKey + 1;
    const double nextStart = static_cast<double>(nextMinute) * 60.0;
    const LocalTime nlt = ToLocalTime(nextStart);
    const std::string nextHHMM = FormatHHMM(nlt);
    const char *nextWeekday = WeekdayName(nlt.weekday);
    const int secondsRemaining = static_cast<int>(std::ceil(nextStart - now));

    for (const auto &rule : m_Rules) {
        if (!RuleMatches(rule, nextHHMM, nextWeekday)) {
            continue;
        }
        auto it = m_LastWarned.find(rule.id);
        if (it != m_LastWarned.end() && it->second == nextMinute) {
            continue;
        }
        m_LastWarned[rule.id] = nextMinute;

        ScheduleFiring firing;
        firing.kind = ScheduleFiring::WARNING;
        firing.rule = rule;
        firing.title = RuleDisplayTitle(rule);
        firing.seconds_remaining = secondsRemaining;
        out.push_back(firing);
        spdlog::debug("Schedule rule {} warning: {}s remaining", rule.id, secondsRemaining);
    }

    return out;
}
