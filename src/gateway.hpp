#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

enum class CommandType {
    START_SESSION,
    PAUSE_SESSION,
    RESUME_SESSION,
    END_SESSION,
    PAUSE_REMINDERS,
    RESUME_REMINDERS,
    COMPLETE_BREAK,
    SNOOZE_BREAK,
    SKIP_BREAK,
    LOG_HYDRATION,
    GET_STATUS,
    UPDATE_SETTING,
    GET_SETTINGS,
    ADD_SCHEDULE_RULE,
    UPDATE_SCHEDULE_RULE,
    DELETE_SCHEDULE_RULE,
    GET_SCHEDULE_RULES,
    RESET_ALL_TIMERS,
    EXPORT_DATA,
    GET_METRICS,
    GET_HYDRATION,
    GET_SESSION_STATE,
    GET_BREAKS_TODAY,
    SHUTDOWN
};

enum class EventType {
    READY,
    METRICS,
    STATUS,
    BREAK_DUE,
    BREAK_COMPLETED,
    BREAK_SNOOZED,
    BREAK_SKIPPED,
    HYDRATION_LOGGED,
    HYDRATION_STATUS,
    SETTINGS,
    SETTING_UPDATED,
    SCHEDULE_RULES,
    SCHEDULE_RULE_ADDED,
    SCHEDULE_RULE_UPDATED,
    SCHEDULE_RULE_DELETED,
    SCHEDULE_WARNING,
    SCHEDULE_ACTION_EXECUTED,
    SESSION_STARTED,
    SESSION_PAUSED,
    SESSION_RESUMED,
    SESSION_ENDED,
    SESSION_STATE,
    REMINDERS_PAUSED,
    REMINDERS_RESUMED,
    TIMERS_RESET,
    DATA_EXPORTED,
    BREAKS_TODAY,
    SHUTDOWN_ACK,
    ERROR
};

struct Command {
    CommandType type = CommandType::GET_STATUS;
    nlohmann::json payload = nlohmann::json::object();
};

struct Event {
    EventType type = EventType::STATUS;
    nlohmann::json data = nlohmann::json::object();
};

const char *ToString(CommandType type);
const char *ToString(EventType type);
std::optional<CommandType> CommandTypeFromString(const std::string &name);

// {"cmd": name, ...fields} with fields optionally nested under "data".
bool ParseCommand(const nlohmann::json &j, Command &cmd, std::string &error);
bool ParseCommandLine(const std::string &line, Command &cmd, std::string &error);

nlohmann::json EventToJson(const Event &ev);
Event ErrorEvent(const std::string &message);

// JSON lines over stdin/stdout. Reads on its own thread; writes are serialized.
class StdioGateway {
  public:
    using CommandHandler = std::function<void(const Command &)>;
    using EofHandler = std::function<void()>;

    StdioGateway(std::ostream &out, int in_fd = 0);
    ~StdioGateway();

    StdioGateway(const StdioGateway &) = delete;
    StdioGateway &operator=(const StdioGateway &) = delete;

    bool Start(CommandHandler on_command, EofHandler on_eof);
    void Stop();

    void Write(const Event &ev);

    // Parses one input line and dispatches it; malformed lines answer with an error event.
    void HandleLine(const std::string &line);

  private:
    void Run();

  private:
    std::ostream &m_Out;
    int m_InFd;
    std::mutex m_WriteMutex;

    CommandHandler m_OnCommand;
    EofHandler m_OnEof;

    std::atomic<bool> m_Stop{false};
    std::thread m_Thread;
};
