#include "sqlite.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>

// ─────────────────────────────────────
SQLite::SQLite(const std::string &db_path) : m_Db(nullptr), m_DbPath(db_path) {
    if (sqlite3_open(m_DbPath.c_str(), &m_Db) != SQLITE_OK) {
        spdlog::error("unable to open database: {} ({})", m_DbPath,
                      m_Db ? sqlite3_errmsg(m_Db) : "out of memory");
        if (m_Db) {
            sqlite3_close(m_Db);
            m_Db = nullptr;
        }
        throw std::runtime_error("unable to open database: " + m_DbPath);
    }

    spdlog::debug("SQLite database opened: {}", m_DbPath);

    sqlite3_db_config(m_Db, SQLITE_DBCONFIG_LOOKASIDE, m_Lookaside.data(), kLookasideSlotSize,
                      kLookasideSlotCount);

    sqlite3_busy_timeout(m_Db, 2000);
    ExecIgnoringErrors("PRAGMA journal_mode=WAL");
    ExecIgnoringErrors("PRAGMA wal_autocheckpoint=1000");
    ExecIgnoringErrors("PRAGMA journal_size_limit=10485760");
    ExecIgnoringErrors("PRAGMA synchronous=NORMAL");
    ExecIgnoringErrors("PRAGMA temp_store=FILE");
    ExecIgnoringErrors("PRAGMA cache_size = -1000;");

    Init();
    PrepareStatements();

    // A file that is not a database only fails on first real access.
    sqlite3_stmt *countStmt = nullptr;
    if (sqlite3_prepare_v2(m_Db, "SELECT COUNT(*) FROM settings", -1, &countStmt, nullptr) !=
        SQLITE_OK) {
        const std::string msg = sqlite3_errmsg(m_Db);
        sqlite3_finalize(countStmt);
        spdlog::error("database is not usable: {} ({})", m_DbPath, msg);
        Close();
        throw std::runtime_error("database is not usable: " + msg);
    }
    sqlite3_finalize(countStmt);
}

// ─────────────────────────────────────
SQLite::~SQLite() {
    Close();
}

// ─────────────────────────────────────
void SQLite::Close() {
    if (m_SaveTimerStmt) {
        sqlite3_finalize(m_SaveTimerStmt);
        m_SaveTimerStmt = nullptr;
    }
    if (m_HydrationTotalStmt) {
        sqlite3_finalize(m_HydrationTotalStmt);
        m_HydrationTotalStmt = nullptr;
    }
    if (m_Db) {
        sqlite3_close(m_Db);
        m_Db = nullptr;
    }
}

// ─────────────────────────────────────
const std::string &SQLite::Path() const {
    return m_DbPath;
}

// ─────────────────────────────────────
void SQLite::Init() {
    spdlog::debug("Initializing SQLite database tables");

    ExecIgnoringErrors("CREATE TABLE IF NOT EXISTS settings ("
                       "id INTEGER PRIMARY KEY AUTOINCREMENT,"
                       "key TEXT NOT NULL UNIQUE,"
                       "value TEXT NOT NULL,"
                       "updated_at REAL NOT NULL"
                       ")");

    ExecIgnoringErrors("CREATE TABLE IF NOT EXISTS break_logs ("
                       "id INTEGER PRIMARY KEY AUTOINCREMENT,"
                       "timestamp REAL NOT NULL,"
                       "break_type TEXT NOT NULL,"
                       "duration_seconds INTEGER NOT NULL,"
                       "completed INTEGER NOT NULL DEFAULT 0,"
                       "skipped INTEGER NOT NULL DEFAULT 0,"
                       "snoozed INTEGER NOT NULL DEFAULT 0,"
                       "created_at REAL NOT NULL"
                       ")");
    ExecIgnoringErrors(
        "CREATE INDEX IF NOT EXISTS idx_break_logs_timestamp ON break_logs(timestamp)");

    ExecIgnoringErrors("CREATE TABLE IF NOT EXISTS hydration_logs ("
                       "id INTEGER PRIMARY KEY AUTOINCREMENT,"
                       "timestamp REAL NOT NULL,"
                       "amount_ml INTEGER NOT NULL,"
                       "created_at REAL NOT NULL"
                       ")");
    ExecIgnoringErrors(
        "CREATE INDEX IF NOT EXISTS idx_hydration_logs_timestamp ON hydration_logs(timestamp)");

    ExecIgnoringErrors("CREATE TABLE IF NOT EXISTS schedule_rules ("
                       "id INTEGER PRIMARY KEY AUTOINCREMENT,"
                       "title TEXT NOT NULL DEFAULT '',"
                       "time TEXT NOT NULL,"
                       "action TEXT NOT NULL,"
                       "days TEXT NOT NULL,"
                       "enabled INTEGER NOT NULL DEFAULT 1,"
                       "created_at REAL NOT NULL"
                       ")");

    // Engine checkpoint: session state and reminder pause
    ExecIgnoringErrors("CREATE TABLE IF NOT EXISTS engine_state ("
                       "key TEXT PRIMARY KEY,"
                       "value TEXT NOT NULL,"
                       "updated_at REAL NOT NULL"
                       ")");

    // Engine checkpoint: one row per break timer
    ExecIgnoringErrors("CREATE TABLE IF NOT EXISTS timer_state ("
                       "kind TEXT PRIMARY KEY,"
                       "elapsed REAL NOT NULL,"
                       "phase TEXT NOT NULL,"
                       "record_id INTEGER NOT NULL DEFAULT 0,"
                       "updated_at REAL NOT NULL"
                       ")");

    spdlog::debug("SQLite database tables initialized");
}

// ─────────────────────────────────────
void SQLite::PrepareStatements() {
    {
        const char *sql = R"(
            INSERT INTO timer_state (kind, elapsed, phase, record_id, updated_at)
            VALUES (?, ?, ?, ?, ?)
            ON CONFLICT(kind) DO UPDATE SET
                elapsed = excluded.elapsed,
                phase = excluded.phase,
                record_id = excluded.record_id,
                updated_at = excluded.updated_at
        )";
        if (sqlite3_prepare_v2(m_Db, sql, -1, &m_SaveTimerStmt, nullptr) != SQLITE_OK) {
            spdlog::error("db prepare failed for SaveTimer stmt: {}", sqlite3_errmsg(m_Db));
            m_SaveTimerStmt = nullptr;
        }
    }

    {
        // Queried on every tick for hydration auto-silence.
        const char *sql = R"(
            SELECT COALESCE(SUM(amount_ml), 0) FROM hydration_logs
            WHERE timestamp >= ? AND timestamp < ?
        )";
        if (sqlite3_prepare_v2(m_Db, sql, -1, &m_HydrationTotalStmt, nullptr) != SQLITE_OK) {
            spdlog::error("db prepare failed for HydrationTotal stmt: {}", sqlite3_errmsg(m_Db));
            m_HydrationTotalStmt = nullptr;
        }
    }
}

// ─────────────────────────────────────
bool SQLite::SeedSettings(const std::vector<std::pair<std::string, std::string>> &defaults,
                          std::string &error) {
    error.clear();
    sqlite3_stmt *stmt = nullptr;
    const char *sql =
        "INSERT OR IGNORE INTO settings (key, value, updated_at) VALUES (?, ?, ?)";

    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        error = std::string("db prepare failed: ") + sqlite3_errmsg(m_Db);
        spdlog::error("db prepare failed in SeedSettings: {}", sqlite3_errmsg(m_Db));
        return false;
    }

    const double now = NowUnix();
    bool ok = true;
    for (const auto &[key, value] : defaults) {
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_double(stmt, 3, now);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            error = std::string("db write failed: ") + sqlite3_errmsg(m_Db);
            spdlog::error("SeedSettings failed for '{}': {}", key, sqlite3_errmsg(m_Db));
            ok = false;
            break;
        }
    }

    sqlite3_finalize(stmt);
    return ok;
}

// ─────────────────────────────────────
std::optional<std::string> SQLite::GetSetting(const std::string &key) {
    sqlite3_stmt *stmt = nullptr;
    const char *sql = "SELECT value FROM settings WHERE key = ?";

    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed in GetSetting: {}", sqlite3_errmsg(m_Db));
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<std::string> out;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const unsigned char *txt = sqlite3_column_text(stmt, 0);
        out = txt ? reinterpret_cast<const char *>(txt) : "";
    }
    sqlite3_finalize(stmt);
    return out;
}

// ─────────────────────────────────────
bool SQLite::SetSetting(const std::string &key, const std::string &value, std::string &error) {
    error.clear();
    sqlite3_stmt *stmt = nullptr;
    const char *sql = "INSERT INTO settings (key, value, updated_at) VALUES (?, ?, ?) "
                      "ON CONFLICT(key) DO UPDATE SET "
                      "value=excluded.value, "
                      "updated_at=excluded.updated_at";

    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        error = std::string("db prepare failed: ") + sqlite3_errmsg(m_Db);
        spdlog::error("db prepare failed in SetSetting: {}", sqlite3_errmsg(m_Db));
        return false;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 3, NowUnix());

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        error = std::string("db write failed: ") + sqlite3_errmsg(m_Db);
        spdlog::error("SetSetting failed: {}", sqlite3_errmsg(m_Db));
        return false;
    }
    return true;
}

// ─────────────────────────────────────
std::map<std::string, std::string> SQLite::GetAllSettings() {
    std::map<std::string, std::string> out;
    sqlite3_stmt *stmt = nullptr;
    const char *sql = "SELECT key, value FROM settings ORDER BY key";

    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed in GetAllSettings: {}", sqlite3_errmsg(m_Db));
        return out;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const unsigned char *k = sqlite3_column_text(stmt, 0);
        const unsigned char *v = sqlite3_column_text(stmt, 1);
        if (!k) {
            continue;
        }
        out[reinterpret_cast<const char *>(k)] = v ? reinterpret_cast<const char *>(v) : "";
    }
    sqlite3_finalize(stmt);
    return out;
}

// ─────────────────────────────────────
std::optional<std::string> SQLite::GetEngineValue(const std::string &key) {
    sqlite3_stmt *stmt = nullptr;
    const char *sql = "SELECT value FROM engine_state WHERE key = ?";

    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed in GetEngineValue: {}", sqlite3_errmsg(m_Db));
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<std::string> out;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const unsigned char *txt = sqlite3_column_text(stmt, 0);
        out = txt ? reinterpret_cast<const char *>(txt) : "";
    }
    sqlite3_finalize(stmt);
    return out;
}

// ─────────────────────────────────────
bool SQLite::SetEngineValue(const std::string &key, const std::string &value,
                            std::string &error) {
    error.clear();
    sqlite3_stmt *stmt = nullptr;
    const char *sql = "INSERT INTO engine_state (key, value, updated_at) VALUES (?, ?, ?) "
                      "ON CONFLICT(key) DO UPDATE SET "
                      "value=excluded.value, "
                      "updated_at=excluded.updated_at";

    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        error = std::string("db prepare failed: ") + sqlite3_errmsg(m_Db);
        spdlog::error("db prepare failed in SetEngineValue: {}", sqlite3_errmsg(m_Db));
        return false;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 3, NowUnix());

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        error = std::string("db write failed: ") + sqlite3_errmsg(m_Db);
        spdlog::error("SetEngineValue failed for '{}': {}", key, sqlite3_errmsg(m_Db));
        return false;
    }
    return true;
}

// ─────────────────────────────────────
bool SQLite::SaveTimerState(const TimerCheckpoint &cp, std::string &error) {
    error.clear();
    if (!m_SaveTimerStmt) {
        error = "timer checkpoint statement not prepared";
        return false;
    }

    sqlite3_reset(m_SaveTimerStmt);
    sqlite3_clear_bindings(m_SaveTimerStmt);
    sqlite3_bind_text(m_SaveTimerStmt, 1, ToString(cp.kind), -1, SQLITE_STATIC);
    sqlite3_bind_double(m_SaveTimerStmt, 2, cp.elapsed);
    sqlite3_bind_text(m_SaveTimerStmt, 3, ToString(cp.phase), -1, SQLITE_STATIC);
    sqlite3_bind_int64(m_SaveTimerStmt, 4, cp.record_id);
    sqlite3_bind_double(m_SaveTimerStmt, 5, NowUnix());

    const int rc = sqlite3_step(m_SaveTimerStmt);
    if (rc != SQLITE_DONE) {
        error = std::string("db write failed: ") + sqlite3_errmsg(m_Db);
        spdlog::error("SaveTimerState failed: {}", sqlite3_errmsg(m_Db));
        sqlite3_reset(m_SaveTimerStmt);
        return false;
    }
    sqlite3_reset(m_SaveTimerStmt);
    return true;
}

// ─────────────────────────────────────
std::vector<TimerCheckpoint> SQLite::LoadTimerStates() {
    std::vector<TimerCheckpoint> out;
    sqlite3_stmt *stmt = nullptr;
    const char *sql = "SELECT kind, elapsed, phase, record_id FROM timer_state";

    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed in LoadTimerStates: {}", sqlite3_errmsg(m_Db));
        return out;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const unsigned char *kindTxt = sqlite3_column_text(stmt, 0);
        const unsigned char *phaseTxt = sqlite3_column_text(stmt, 2);
        if (!kindTxt || !phaseTxt) {
            continue;
        }
        auto kind = BreakKindFromString(reinterpret_cast<const char *>(kindTxt));
        auto phase = BreakPhaseFromString(reinterpret_cast<const char *>(phaseTxt));
        if (!kind || !phase) {
            spdlog::warn("Ignoring unknown timer checkpoint row");
            continue;
        }
        TimerCheckpoint cp;
        cp.kind = *kind;
        cp.elapsed = sqlite3_column_double(stmt, 1);
        cp.phase = *phase;
        cp.record_id = sqlite3_column_int64(stmt, 3);
        out.push_back(cp);
    }
    sqlite3_finalize(stmt);
    return out;
}

// ─────────────────────────────────────
bool SQLite::InsertBreakLog(BreakKind kind, int duration_seconds, double timestamp, int64_t &id,
                            std::string &error) {
    error.clear();
    id = 0;
    sqlite3_stmt *stmt = nullptr;
    const char *sql = "INSERT INTO break_logs "
                      "(timestamp, break_type, duration_seconds, completed, skipped, snoozed, "
                      "created_at) VALUES (?, ?, ?, 0, 0, 0, ?)";

    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        error = std::string("db prepare failed: ") + sqlite3_errmsg(m_Db);
        spdlog::error("db prepare failed in InsertBreakLog: {}", sqlite3_errmsg(m_Db));
        return false;
    }

    sqlite3_bind_double(stmt, 1, timestamp);
    sqlite3_bind_text(stmt, 2, ToString(kind), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 3, duration_seconds);
    sqlite3_bind_double(stmt, 4, NowUnix());

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        error = std::string("db write failed: ") + sqlite3_errmsg(m_Db);
        spdlog::error("InsertBreakLog failed: {}", sqlite3_errmsg(m_Db));
        return false;
    }

    id = sqlite3_last_insert_rowid(m_Db);
    return true;
}

// ─────────────────────────────────────
bool SQLite::ResolveBreakLog(int64_t id, BreakResolution resolution, std::string &error) {
    error.clear();
    sqlite3_stmt *stmt = nullptr;
    const char *sql =
        "UPDATE break_logs SET completed = ?, skipped = ?, snoozed = ? WHERE id = ?";

    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        error = std::string("db prepare failed: ") + sqlite3_errmsg(m_Db);
        spdlog::error("db prepare failed in ResolveBreakLog: {}", sqlite3_errmsg(m_Db));
        return false;
    }

    sqlite3_bind_int(stmt, 1, resolution == BreakResolution::COMPLETED ? 1 : 0);
    sqlite3_bind_int(stmt, 2, resolution == BreakResolution::SKIPPED ? 1 : 0);
    sqlite3_bind_int(stmt, 3, resolution == BreakResolution::SNOOZED ? 1 : 0);
    sqlite3_bind_int64(stmt, 4, id);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        error = std::string("db write failed: ") + sqlite3_errmsg(m_Db);
        spdlog::error("ResolveBreakLog failed: {}", sqlite3_errmsg(m_Db));
        return false;
    }
    if (sqlite3_changes(m_Db) == 0) {
        error = "break log not found: " + std::to_string(id);
        return false;
    }
    return true;
}

// ─────────────────────────────────────
static BreakLog ReadBreakLog(sqlite3_stmt *stmt) {
    BreakLog log;
    log.id = sqlite3_column_int64(stmt, 0);
    log.timestamp = sqlite3_column_double(stmt, 1);
    const unsigned char *type = sqlite3_column_text(stmt, 2);
    if (type) {
        log.kind = BreakKindFromString(reinterpret_cast<const char *>(type))
                       .value_or(BreakKind::MICRO);
    }
    log.duration_seconds = sqlite3_column_int(stmt, 3);
    log.completed = sqlite3_column_int(stmt, 4) != 0;
    log.skipped = sqlite3_column_int(stmt, 5) != 0;
    log.snoozed = sqlite3_column_int(stmt, 6) != 0;
    return log;
}

// ─────────────────────────────────────
std::optional<BreakLog> SQLite::GetBreakLog(int64_t id) {
    sqlite3_stmt *stmt = nullptr;
    const char *sql = "SELECT id, timestamp, break_type, duration_seconds, completed, skipped, "
                      "snoozed FROM break_logs WHERE id = ?";

    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed in GetBreakLog: {}", sqlite3_errmsg(m_Db));
        return std::nullopt;
    }

    sqlite3_bind_int64(stmt, 1, id);

    std::optional<BreakLog> out;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        out = ReadBreakLog(stmt);
    }
    sqlite3_finalize(stmt);
    return out;
}

// ─────────────────────────────────────
std::vector<BreakLog> SQLite::FetchBreakLogs(double from, double to) {
    std::vector<BreakLog> out;
    sqlite3_stmt *stmt = nullptr;
    const char *sql = "SELECT id, timestamp, break_type, duration_seconds, completed, skipped, "
                      "snoozed FROM break_logs WHERE timestamp >= ? AND timestamp < ? "
                      "ORDER BY timestamp, id";

    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed in FetchBreakLogs: {}", sqlite3_errmsg(m_Db));
        return out;
    }

    sqlite3_bind_double(stmt, 1, from);
    sqlite3_bind_double(stmt, 2, to);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        out.push_back(ReadBreakLog(stmt));
    }
    sqlite3_finalize(stmt);
    return out;
}

// ─────────────────────────────────────
bool SQLite::InsertHydrationLog(int amount_ml, double timestamp, int64_t &id,
                                std::string &error) {
    error.clear();
    id = 0;
    sqlite3_stmt *stmt = nullptr;
    const char *sql =
        "INSERT INTO hydration_logs (timestamp, amount_ml, created_at) VALUES (?, ?, ?)";

    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        error = std::string("db prepare failed: ") + sqlite3_errmsg(m_Db);
        spdlog::error("db prepare failed in InsertHydrationLog: {}", sqlite3_errmsg(m_Db));
        return false;
    }

    sqlite3_bind_double(stmt, 1, timestamp);
    sqlite3_bind_int(stmt, 2, amount_ml);
    sqlite3_bind_double(stmt, 3, NowUnix());

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        error = std::string("db write failed: ") + sqlite3_errmsg(m_Db);
        spdlog::error("InsertHydrationLog failed: {}", sqlite3_errmsg(m_Db));
        return false;
    }

    id = sqlite3_last_insert_rowid(m_Db);
    return true;
}

// ─────────────────────────────────────
int SQLite::GetHydrationTotal(double from, double to) {
    if (!m_HydrationTotalStmt) {
        return 0;
    }

    sqlite3_reset(m_HydrationTotalStmt);
    sqlite3_clear_bindings(m_HydrationTotalStmt);
    sqlite3_bind_double(m_HydrationTotalStmt, 1, from);
    sqlite3_bind_double(m_HydrationTotalStmt, 2, to);

    int total = 0;
    const int rc = sqlite3_step(m_HydrationTotalStmt);
    if (rc == SQLITE_ROW) {
        total = sqlite3_column_int(m_HydrationTotalStmt, 0);
    } else {
        spdlog::error("GetHydrationTotal failed: {}", sqlite3_errmsg(m_Db));
    }
    sqlite3_reset(m_HydrationTotalStmt);
    return total;
}

// ─────────────────────────────────────
std::vector<HydrationLog> SQLite::FetchHydrationLogs(double from, double to) {
    std::vector<HydrationLog> out;
    sqlite3_stmt *stmt = nullptr;
    const char *sql = "SELECT id, timestamp, amount_ml FROM hydration_logs "
                      "WHERE timestamp >= ? AND timestamp < ? ORDER BY timestamp, id";

    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed in FetchHydrationLogs: {}", sqlite3_errmsg(m_Db));
        return out;
    }

    sqlite3_bind_double(stmt, 1, from);
    sqlite3_bind_double(stmt, 2, to);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        HydrationLog log;
        log.id = sqlite3_column_int64(stmt, 0);
        log.timestamp = sqlite3_column_double(stmt, 1);
        log.amount_ml = sqlite3_column_int(stmt, 2);
        out.push_back(log);
    }
    sqlite3_finalize(stmt);
    return out;
}

// ─────────────────────────────────────
bool SQLite::AddScheduleRule(const ScheduleRule &rule, int64_t &id, std::string &error) {
    error.clear();
    id = 0;
    sqlite3_stmt *stmt = nullptr;
    const char *sql = "INSERT INTO schedule_rules (title, time, action, days, enabled, created_at) "
                      "VALUES (?, ?, ?, ?, ?, ?)";

    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        error = std::string("db prepare failed: ") + sqlite3_errmsg(m_Db);
        spdlog::error("db prepare failed in AddScheduleRule: {}", sqlite3_errmsg(m_Db));
        return false;
    }

    const std::string days = nlohmann::json(rule.days).dump();
    sqlite3_bind_text(stmt, 1, rule.title.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, rule.time.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, ToString(rule.action), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 4, days.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 5, rule.enabled ? 1 : 0);
    sqlite3_bind_double(stmt, 6, rule.created_at > 0.0 ? rule.created_at : NowUnix());

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        error = std::string("db write failed: ") + sqlite3_errmsg(m_Db);
        spdlog::error("AddScheduleRule failed: {}", sqlite3_errmsg(m_Db));
        return false;
    }

    id = sqlite3_last_insert_rowid(m_Db);
    return true;
}

// ─────────────────────────────────────
bool SQLite::UpdateScheduleRule(const ScheduleRule &rule, std::string &error) {
    error.clear();
    sqlite3_stmt *stmt = nullptr;
    const char *sql = "UPDATE schedule_rules SET title = ?, time = ?, action = ?, days = ?, "
                      "enabled = ? WHERE id = ?";

    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        error = std::string("db prepare failed: ") + sqlite3_errmsg(m_Db);
        spdlog::error("db prepare failed in UpdateScheduleRule: {}", sqlite3_errmsg(m_Db));
        return false;
    }

    const std::string days = nlohmann::json(rule.days).dump();
    sqlite3_bind_text(stmt, 1, rule.title.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, rule.time.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, ToString(rule.action), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 4, days.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 5, rule.enabled ? 1 : 0);
    sqlite3_bind_int64(stmt, 6, rule.id);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        error = std::string("db write failed: ") + sqlite3_errmsg(m_Db);
        spdlog::error("UpdateScheduleRule failed: {}", sqlite3_errmsg(m_Db));
        return false;
    }
    if (sqlite3_changes(m_Db) == 0) {
        error = "schedule rule not found: " + std::to_string(rule.id);
        return false;
    }
    return true;
}

// ─────────────────────────────────────
bool SQLite::DeleteScheduleRule(int64_t id, std::string &error) {
    error.clear();
    sqlite3_stmt *stmt = nullptr;
    const char *sql = "DELETE FROM schedule_rules WHERE id = ?";

    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        error = std::string("db prepare failed: ") + sqlite3_errmsg(m_Db);
        spdlog::error("db prepare failed in DeleteScheduleRule: {}", sqlite3_errmsg(m_Db));
        return false;
    }

    sqlite3_bind_int64(stmt, 1, id);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        error = std::string("db write failed: ") + sqlite3_errmsg(m_Db);
        spdlog::error("DeleteScheduleRule failed: {}", sqlite3_errmsg(m_Db));
        return false;
    }
    if (sqlite3_changes(m_Db) == 0) {
        error = "schedule rule not found: " + std::to_string(id);
        return false;
    }
    return true;
}

// ─────────────────────────────────────
bool SQLite::ReadScheduleRule(sqlite3_stmt *stmt, ScheduleRule &rule) {
    rule.id = sqlite3_column_int64(stmt, 0);
    const unsigned char *title = sqlite3_column_text(stmt, 1);
    const unsigned char *time = sqlite3_column_text(stmt, 2);
    const unsigned char *action = sqlite3_column_text(stmt, 3);
    const unsigned char *days = sqlite3_column_text(stmt, 4);
    rule.title = title ? reinterpret_cast<const char *>(title) : "";
    rule.time = time ? reinterpret_cast<const char *>(time) : "";
    rule.enabled = sqlite3_column_int(stmt, 5) != 0;
    rule.created_at = sqlite3_column_double(stmt, 6);

    auto parsedAction =
        ScheduleActionFromString(action ? reinterpret_cast<const char *>(action) : "");
    if (!parsedAction) {
        spdlog::warn("Schedule rule {} has unknown action, skipping", rule.id);
        return false;
    }
    rule.action = *parsedAction;

    rule.days.clear();
    try {
        rule.days = m_JsonParse.JsonArray2String(
            nlohmann::json::parse(days ? reinterpret_cast<const char *>(days) : "[]"));
    } catch (const nlohmann::json::exception &e) {
        spdlog::warn("Schedule rule {} has malformed days: {}", rule.id, e.what());
    }
    return true;
}

// ─────────────────────────────────────
std::optional<ScheduleRule> SQLite::GetScheduleRule(int64_t id) {
    sqlite3_stmt *stmt = nullptr;
    const char *sql = "SELECT id, title, time, action, days, enabled, created_at "
                      "FROM schedule_rules WHERE id = ?";

    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed in GetScheduleRule: {}", sqlite3_errmsg(m_Db));
        return std::nullopt;
    }

    sqlite3_bind_int64(stmt, 1, id);

    std::optional<ScheduleRule> out;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        ScheduleRule rule;
        if (ReadScheduleRule(stmt, rule)) {
            out = rule;
        }
    }
    sqlite3_finalize(stmt);
    return out;
}

// ─────────────────────────────────────
bool SQLite::FetchScheduleRules(std::vector<ScheduleRule> &out, std::string &error) {
    error.clear();
    out.clear();
    sqlite3_stmt *stmt = nullptr;
    const char *sql = "SELECT id, title, time, action, days, enabled, created_at "
                      "FROM schedule_rules ORDER BY id";

    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        error = std::string("db prepare failed: ") + sqlite3_errmsg(m_Db);
        spdlog::error("db prepare failed in FetchScheduleRules: {}", sqlite3_errmsg(m_Db));
        return false;
    }

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        ScheduleRule rule;
        if (ReadScheduleRule(stmt, rule)) {
            out.push_back(rule);
        }
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        error = std::string("db read failed: ") + sqlite3_errmsg(m_Db);
        spdlog::error("FetchScheduleRules failed: {}", sqlite3_errmsg(m_Db));
        return false;
    }
    return true;
}

// ─────────────────────────────────────
bool SQLite::ExportData(const std::string &path, int &records, std::string &error) {
    error.clear();
    records = 0;

    nlohmann::json doc = nlohmann::json::object();
    doc["version"] = AURA_VERSION;
    doc["exported_at"] = NowUnix();

    nlohmann::json settings = nlohmann::json::object();
    for (const auto &[key, value] : GetAllSettings()) {
        settings[key] = value;
    }
    doc["settings"] = settings;

    std::vector<ScheduleRule> rules;
    if (!FetchScheduleRules(rules, error)) {
        return false;
    }
    nlohmann::json rulesJson = nlohmann::json::array();
    for (const auto &r : rules) {
        rulesJson.push_back({{"id", r.id},
                             {"title", r.title},
                             {"time", r.time},
                             {"action", ToString(r.action)},
                             {"days", r.days},
                             {"enabled", r.enabled},
                             {"created_at", r.created_at}});
    }
    doc["schedule_rules"] = rulesJson;

    nlohmann::json breaks = nlohmann::json::array();
    for (const auto &b : FetchBreakLogs(0.0, 1e18)) {
        breaks.push_back({{"id", b.id},
                          {"timestamp", b.timestamp},
                          {"break_type", ToString(b.kind)},
                          {"duration_seconds", b.duration_seconds},
                          {"completed", b.completed},
                          {"skipped", b.skipped},
                          {"snoozed", b.snoozed}});
    }
    doc["break_logs"] = breaks;

    nlohmann::json hydration = nlohmann::json::array();
    for (const auto &h : FetchHydrationLogs(0.0, 1e18)) {
        hydration.push_back(
            {{"id", h.id}, {"timestamp", h.timestamp}, {"amount_ml", h.amount_ml}});
    }
    doc["hydration_logs"] = hydration;

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        error = "unable to open export file: " + path;
        spdlog::error("ExportData: unable to open {}", path);
        return false;
    }
    file << doc.dump(2) << "\n";
    file.close();
    if (!file) {
        error = "unable to write export file: " + path;
        spdlog::error("ExportData: write failed for {}", path);
        return false;
    }

    records = static_cast<int>(breaks.size() + hydration.size());
    spdlog::info("Exported {} records to {}", records, path);
    return true;
}

// ─────────────────────────────────────
void SQLite::ExecIgnoringErrors(const std::string &sql) {
    char *errmsg = nullptr;
    sqlite3_exec(m_Db, sql.c_str(), nullptr, nullptr, &errmsg);
    if (errmsg) {
        spdlog::error("sqlite exec error: {}", errmsg);
        sqlite3_free(errmsg);
    }
}
