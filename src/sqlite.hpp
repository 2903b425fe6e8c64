#pragma once

#include <sqlite3.h>
#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "json.hpp"
#include "common.hpp"

class SQLite {
  public:
    SQLite(const std::string &db_path);
    ~SQLite();

    SQLite(const SQLite &) = delete;
    SQLite &operator=(const SQLite &) = delete;

    const std::string &Path() const;

    // Settings
    bool SeedSettings(const std::vector<std::pair<std::string, std::string>> &defaults,
                      std::string &error);
    std::optional<std::string> GetSetting(const std::string &key);
    bool SetSetting(const std::string &key, const std::string &value, std::string &error);
    std::map<std::string, std::string> GetAllSettings();

    // Engine checkpoint
    std::optional<std::string> GetEngineValue(const std::string &key);
    bool SetEngineValue(const std::string &key, const std::string &value, std::string &error);
    bool SaveTimerState(const TimerCheckpoint &cp, std::string &error);
    std::vector<TimerCheckpoint> LoadTimerStates();

    // Break logs
    bool InsertBreakLog(BreakKind kind, int duration_seconds, double timestamp, int64_t &id,
                        std::string &error);
    bool ResolveBreakLog(int64_t id, BreakResolution resolution, std::string &error);
    std::optional<BreakLog> GetBreakLog(int64_t id);
    std::vector<BreakLog> FetchBreakLogs(double from, double to);

    // Hydration
    bool InsertHydrationLog(int amount_ml, double timestamp, int64_t &id, std::string &error);
    int GetHydrationTotal(double from, double to);
    std::vector<HydrationLog> FetchHydrationLogs(double from, double to);

    // Schedule rules
    bool AddScheduleRule(const ScheduleRule &rule, int64_t &id, std::string &error);
    bool UpdateScheduleRule(const ScheduleRule &rule, std::string &error);
    bool DeleteScheduleRule(int64_t id, std::string &error);
    std::optional<ScheduleRule> GetScheduleRule(int64_t id);
    bool FetchScheduleRules(std::vector<ScheduleRule> &out, std::string &error);

    bool ExportData(const std::string &path, int &records, std::string &error);

  private:
    void Init();
    void Close();
    void PrepareStatements();
    void ExecIgnoringErrors(const std::string &sql);
    bool ReadScheduleRule(sqlite3_stmt *stmt, ScheduleRule &rule);

  private:
    sqlite3 *m_Db;
    std::string m_DbPath;
    JsonParse m_JsonParse;

    sqlite3_stmt *m_SaveTimerStmt = nullptr;
    sqlite3_stmt *m_HydrationTotalStmt = nullptr;

    // Small deterministic lookaside buffer to reduce heap churn.
    static constexpr int kLookasideSlotSize = 128;
    static constexpr int kLookasideSlotCount = 256; // 32 KiB
    std::array<unsigned char, kLookasideSlotSize * kLookasideSlotCount> m_Lookaside{};
};
