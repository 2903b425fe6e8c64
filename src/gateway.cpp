#include "gateway.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <poll.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

static const std::pair<CommandType, const char *> kCommandNames[] = {
    {CommandType::START_SESSION, "start_session"},
    {CommandType::PAUSE_SESSION, "pause_session"},
    {CommandType::RESUME_SESSION, "resume_session"},
    {CommandType::END_SESSION, "end_session"},
    {CommandType::PAUSE_REMINDERS, "pause_reminders"},
    {CommandType::RESUME_REMINDERS, "resume_reminders"},
    {CommandType::COMPLETE_BREAK, "complete_break"},
    {CommandType::SNOOZE_BREAK, "snooze_break"},
    {CommandType::SKIP_BREAK, "skip_break"},
    {CommandType::LOG_HYDRATION, "log_hydration"},
    {CommandType::GET_STATUS, "get_status"},
    {CommandType::UPDATE_SETTING, "update_setting"},
    {CommandType::GET_SETTINGS, "get_settings"},
    {CommandType::ADD_SCHEDULE_RULE, "add_schedule_rule"},
    {CommandType::UPDATE_SCHEDULE_RULE, "update_schedule_rule"},
    {CommandType::DELETE_SCHEDULE_RULE, "delete_schedule_rule"},
    {CommandType::GET_SCHEDULE_RULES, "get_schedule_rules"},
    {CommandType::RESET_ALL_TIMERS, "reset_all_timers"},
    {CommandType::EXPORT_DATA, "export_data"},
    {CommandType::GET_METRICS, "get_metrics"},
    {CommandType::GET_HYDRATION, "get_hydration"},
    {CommandType::GET_SESSION_STATE, "get_session_state"},
    {CommandType::GET_BREAKS_TODAY, "get_breaks_today"},
    {CommandType::SHUTDOWN, "shutdown"},
};

static const std::pair<EventType, const char *> kEventNames[] = {
    {EventType::READY, "ready"},
    {EventType::METRICS, "metrics"},
    {EventType::STATUS, "status"},
    {EventType::BREAK_DUE, "break_due"},
    {EventType::BREAK_COMPLETED, "break_completed"},
    {EventType::BREAK_SNOOZED, "break_snoozed"},
    {EventType::BREAK_SKIPPED, "break_skipped"},
    {EventType::HYDRATION_LOGGED, "hydration_logged"},
    {EventType::HYDRATION_STATUS, "hydration_status"},
    {EventType::SETTINGS, "settings"},
    {EventType::SETTING_UPDATED, "setting_updated"},
    {EventType::SCHEDULE_RULES, "schedule_rules"},
    {EventType::SCHEDULE_RULE_ADDED, "schedule_rule_added"},
    {EventType::SCHEDULE_RULE_UPDATED, "schedule_rule_updated"},
    {EventType::SCHEDULE_RULE_DELETED, "schedule_rule_deleted"},
    {EventType::SCHEDULE_WARNING, "schedule_warning"},
    {EventType::SCHEDULE_ACTION_EXECUTED, "schedule_action_executed"},
    {EventType::SESSION_STARTED, "session_started"},
    {EventType::SESSION_PAUSED, "session_paused"},
    {EventType::SESSION_RESUMED, "session_resumed"},
    {EventType::SESSION_ENDED, "session_ended"},
    {EventType::SESSION_STATE, "session_state"},
    {EventType::REMINDERS_PAUSED, "reminders_paused"},
    {EventType::REMINDERS_RESUMED, "reminders_resumed"},
    {EventType::TIMERS_RESET, "timers_reset"},
    {EventType::DATA_EXPORTED, "data_exported"},
    {EventType::BREAKS_TODAY, "breaks_today"},
    {EventType::SHUTDOWN_ACK, "shutdown_ack"},
    {EventType::ERROR, "error"},
};

// ─────────────────────────────────────
const char *ToString(CommandType type) {
    for (const auto &[t, name] : kCommandNames) {
        if (t == type) {
            return name;
        }
    }
    return "unknown";
}

// ─────────────────────────────────────
const char *ToString(EventType type) {
    for (const auto &[t, name] : kEventNames) {
        if (t == type) {
            return name;
        }
    }
    return "error";
}

// ─────────────────────────────────────
std::optional<CommandType> CommandTypeFromString(const std::string &name) {
    // Short aliases kept from the first host protocol.
    if (name == "pause") {
        return CommandType::PAUSE_REMINDERS;
    }
    if (name == "resume") {
        return CommandType::RESUME_REMINDERS;
    }
    for (const auto &[t, n] : kCommandNames) {
        if (name == n) {
            return t;
        }
    }
    return std::nullopt;
}

// ─────────────────────────────────────
bool ParseCommand(const nlohmann::json &j, Command &cmd, std::string &error) {
    if (!j.is_object()) {
        error = "Command must be a JSON object";
        return false;
    }
    if (!j.contains("cmd") || !j["cmd"].is_string()) {
        error = "Missing command name";
        return false;
    }

    const std::string name = j["cmd"].get<std::string>();
    auto type = CommandTypeFromString(name);
    if (!type) {
        error = "Unknown command: " + name;
        return false;
    }

    cmd.type = *type;
    cmd.payload = nlohmann::json::object();
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.key() == "cmd" || it.key() == "data") {
            continue;
        }
        cmd.payload[it.key()] = it.value();
    }
    if (j.contains("data") && j["data"].is_object()) {
        for (auto it = j["data"].begin(); it != j["data"].end(); ++it) {
            cmd.payload[it.key()] = it.value();
        }
    }
    return true;
}

// ─────────────────────────────────────
bool ParseCommandLine(const std::string &line, Command &cmd, std::string &error) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(line);
    } catch (const nlohmann::json::exception &e) {
        error = std::string("Invalid JSON: ") + e.what();
        return false;
    }
    return ParseCommand(j, cmd, error);
}

// ─────────────────────────────────────
nlohmann::json EventToJson(const Event &ev) {
    return {{"type", ToString(ev.type)}, {"data", ev.data}};
}

// ─────────────────────────────────────
Event ErrorEvent(const std::string &message) {
    Event ev;
    ev.type = EventType::ERROR;
    ev.data = {{"message", message}};
    return ev;
}

// ─────────────────────────────────────
StdioGateway::StdioGateway(std::ostream &out, int in_fd) : m_Out(out), m_InFd(in_fd) {}

// ─────────────────────────────────────
StdioGateway::~StdioGateway() {
    Stop();
}

// ─────────────────────────────────────
bool StdioGateway::Start(CommandHandler on_command, EofHandler on_eof) {
    if (m_Thread.joinable()) {
        return true;
    }
    m_OnCommand = std::move(on_command);
    m_OnEof = std::move(on_eof);
    m_Stop.store(false);
    m_Thread = std::thread([this]() { Run(); });
    return true;
}

// ─────────────────────────────────────
void StdioGateway::Stop() {
    m_Stop.store(true);
    if (m_Thread.joinable()) {
        m_Thread.join();
    }
}

// ─────────────────────────────────────
void StdioGateway::Write(const Event &ev) {
    const std::string line = EventToJson(ev).dump();
    std::lock_guard<std::mutex> lock(m_WriteMutex);
    m_Out << line << '\n';
    m_Out.flush();
}

// ─────────────────────────────────────
void StdioGateway::HandleLine(const std::string &line) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
        return;
    }

    Command cmd;
    std::string error;
    if (!ParseCommandLine(line, cmd, error)) {
        spdlog::warn("Rejected command line: {}", error);
        Write(ErrorEvent(error));
        return;
    }
    spdlog::debug("Command received: {}", ToString(cmd.type));
    if (m_OnCommand) {
        m_OnCommand(cmd);
    }
}

// ─────────────────────────────────────
void StdioGateway::Run() {
    std::string buffer;
    char chunk[4096];

    while (!m_Stop.load()) {
        pollfd pfd;
        pfd.fd = m_InFd;
        pfd.events = POLLIN;
        pfd.revents = 0;

        const int rc = ::poll(&pfd, 1, 250);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("stdin poll failed: {}", std::strerror(errno));
            break;
        }
        if (rc == 0) {
            continue;
        }

        const ssize_t n = ::read(m_InFd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            spdlog::error("stdin read failed: {}", std::strerror(errno));
            break;
        }
        if (n == 0) {
            if (!buffer.empty()) {
                HandleLine(buffer);
                buffer.clear();
            }
            spdlog::info("stdin closed");
            if (m_OnEof) {
                m_OnEof();
            }
            return;
        }

        buffer.append(chunk, static_cast<std::size_t>(n));
        std::size_t pos;
        while ((pos = buffer.find('\n')) != std::string::npos) {
            std::string line = buffer.substr(0, pos);
            buffer.erase(0, pos + 1);
            HandleLine(line);
        }
    }
}
