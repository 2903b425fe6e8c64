#include "server.hpp"

#include <future>
#include <memory>

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
Server::Server(Engine &engine, const unsigned port) : m_Engine(engine), m_Port(port) {}

// ─────────────────────────────────────
Server::~Server() {
    Stop();
}

// ─────────────────────────────────────
void Server::Stop() {
    m_Server.stop();
    if (m_Thread.joinable()) {
        m_Thread.join();
    }
}

// ─────────────────────────────────────
nlohmann::json Server::EventsToJson(const std::vector<Event> &events) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto &ev : events) {
        arr.push_back(EventToJson(ev));
    }
    return arr;
}

// ─────────────────────────────────────
Server::DispatchResult Server::Dispatch(const Command &cmd, std::vector<Event> &events) {
    if (!m_Engine.IsRunning() || m_Engine.ShutdownRequested()) {
        return DISPATCH_STOPPED;
    }

    auto promise = std::make_shared<std::promise<std::vector<Event>>>();
    auto future = promise->get_future();
    m_Engine.Post(cmd, [promise](std::vector<Event> produced) {
        promise->set_value(std::move(produced));
    });

    if (future.wait_for(kReplyTimeout) != std::future_status::ready) {
        spdlog::warn("HTTP command {} timed out", ToString(cmd.type));
        return DISPATCH_TIMEOUT;
    }
    events = future.get();
    return DISPATCH_OK;
}

// ─────────────────────────────────────
bool Server::InitServer() {
    m_Server.set_keep_alive_max_count(1);
    m_Server.set_keep_alive_timeout(1);
    m_Server.set_payload_max_length(64 * 1024); // 64 KB

    m_Server.set_read_timeout(5, 0);
    m_Server.set_write_timeout(10, 0);
    m_Server.set_idle_interval(1, 0);

    // Version
    m_Server.Get("/api/v1/version", [](const httplib::Request &, httplib::Response &res) {
        nlohmann::json j = {{"version", AURA_VERSION}};
        res.status = 200;
        res.set_content(j.dump(), "application/json");
    });

    // Status
    m_Server.Get("/api/v1/status", [this](const httplib::Request &, httplib::Response &res) {
        Command cmd;
        cmd.type = CommandType::GET_STATUS;
        std::vector<Event> events;
        switch (Dispatch(cmd, events)) {
        case DISPATCH_STOPPED:
            res.status = 503;
            res.set_content(R"({"error":"engine stopped"})", "application/json");
            return;
        case DISPATCH_TIMEOUT:
            res.status = 504;
            res.set_content(R"({"error":"engine did not answer in time"})", "application/json");
            return;
        case DISPATCH_OK:
            break;
        }
        for (const auto &ev : events) {
            if (ev.type == EventType::STATUS) {
                res.status = 200;
                res.set_content(ev.data.dump(), "application/json");
                return;
            }
        }
        res.status = 500;
        res.set_content(R"({"error":"no status produced"})", "application/json");
    });

    // Commands
    m_Server.Post("/api/v1/command", [this](const httplib::Request &req, httplib::Response &res) {
        nlohmann::json body;
        try {
            body = nlohmann::json::parse(req.body);
        } catch (const nlohmann::json::exception &e) {
            spdlog::debug("Rejected HTTP command body: {}", e.what());
            res.status = 400;
            res.set_content(R"({"error":"Invalid JSON"})", "application/json");
            return;
        }

        Command cmd;
        std::string error;
        if (!ParseCommand(body, cmd, error)) {
            nlohmann::json j = {{"events", EventsToJson({ErrorEvent(error)})}};
            res.status = 400;
            res.set_content(j.dump(), "application/json");
            return;
        }

        std::vector<Event> events;
        switch (Dispatch(cmd, events)) {
        case DISPATCH_STOPPED:
            res.status = 503;
            res.set_content(R"({"error":"engine stopped"})", "application/json");
            return;
        case DISPATCH_TIMEOUT:
            res.status = 504;
            res.set_content(R"({"error":"engine did not answer in time"})", "application/json");
            return;
        case DISPATCH_OK:
            break;
        }

        nlohmann::json j = {{"events", EventsToJson(events)}};
        res.status = 200;
        res.set_content(j.dump(), "application/json");
    });

    const std::string host = "127.0.0.1";
    const int port = static_cast<int>(m_Port);
    if (!m_Server.bind_to_port(host, port)) {
        spdlog::error("HTTP server could not bind {}:{}", host, port);
        return false;
    }
    m_Thread = std::thread([this] { m_Server.listen_after_bind(); });
    spdlog::info("HTTP server listening on http://{}:{}", host, port);
    return true;
}
