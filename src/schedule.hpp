#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common.hpp"
#include "sqlite.hpp"

struct ScheduleFiring {
    enum Kind { ACTION, WARNING };

    Kind kind = ACTION;
    ScheduleRule rule;
    std::string title;         // display title
    int seconds_remaining = 0; // WARNING only
};

bool ParseRuleTime(const std::string &time, int &hour, int &minute);
bool ValidateScheduleRule(const ScheduleRule &rule, std::string &error);
std::string RuleDisplayTitle(const ScheduleRule &rule);
nlohmann::json RuleToJson(const ScheduleRule &rule);

// Fills rule from a command payload. With merge set, absent fields keep the rule's values;
// otherwise time, action and days are required.
bool RuleFromJson(const nlohmann::json &j, ScheduleRule &rule, bool merge, std::string &error);

class ScheduleEngine {
  public:
    explicit ScheduleEngine(SQLite &db);

    // Runs at most once per wall-clock minute; later calls in the same minute return nothing.
    std::vector<ScheduleFiring> Evaluate(double now);

    bool Add(ScheduleRule rule, double now, int64_t &id, std::string &error);
    bool Update(int64_t id, const nlohmann::json &fields, std::string &error);
    bool Delete(int64_t id, std::string &error);

    const std::vector<ScheduleRule> &Rules();
    nlohmann::json RulesJson();

  private:
    void RefreshIfDirty();

    // The minute each rule last fired, kept in engine_state so a restart inside that minute
    // does not fire the rule again.
    void LoadFiredMinutes();
    void SaveFiredMinutes();

  private:
    SQLite &m_Db;
    std::vector<ScheduleRule> m_Rules;
    bool m_Dirty = true;

    bool m_HasEvaluated = false;
    int64_t m_LastMinute = 0;
    std::map<int64_t, int64_t> m_LastFired;  // rule id -> unix minute
    std::map<int64_t, int64_t> m_LastWarned; // rule id -> target unix minute
};
