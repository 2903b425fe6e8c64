#pragma once

#include <chrono>
#include <thread>
#include <vector>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "engine.hpp"
#include "gateway.hpp"

// Local HTTP transport for the command set. Every request is posted to the engine thread and
// answered with the events it produced.
class Server {
  public:
    Server(Engine &engine, const unsigned port);
    ~Server();

    Server(const Server &) = delete;
    Server &operator=(const Server &) = delete;

    bool InitServer();
    void Stop();

  private:
    enum DispatchResult { DISPATCH_OK, DISPATCH_STOPPED, DISPATCH_TIMEOUT };

    DispatchResult Dispatch(const Command &cmd, std::vector<Event> &events);
    static nlohmann::json EventsToJson(const std::vector<Event> &events);

  private:
    Engine &m_Engine;
    const unsigned m_Port;
    httplib::Server m_Server;
    std::thread m_Thread;

    static constexpr std::chrono::seconds kReplyTimeout{5};
};
