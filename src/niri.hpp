#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>

class NiriIPC {
  public:
    NiriIPC();
    ~NiriIPC();

    NiriIPC(const NiriIPC &) = delete;
    NiriIPC &operator=(const NiriIPC &) = delete;

    bool IsAvailable() const;

    // Send a serde-enum style request like "\"FocusedWindow\"\n" and parse one JSON line response.
    std::optional<nlohmann::json> SendEnumRequest(const std::string &enum_name,
                                                  std::chrono::milliseconds timeout =
                                                      std::chrono::milliseconds(500));

  private:
    static std::string GetEnvSocketPath();
    bool ConnectQuery();
    void DisconnectQuery();
    static void CloseFd(int &fd);
    static bool SendAll(int fd, const void *data, std::size_t size);
    static bool ReadLine(int fd, std::string &out_line, std::string &buffer,
                         std::chrono::milliseconds timeout);

  private:
    std::string m_SocketPath;
    int m_QueryFd = -1;
};
