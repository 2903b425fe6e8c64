#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

class HyprlandIPC {
  public:
    HyprlandIPC();

    HyprlandIPC(const HyprlandIPC &) = delete;
    HyprlandIPC &operator=(const HyprlandIPC &) = delete;

    bool IsAvailable() const;

    // Socket1 JSON request (hyprctl-like). Example: "activewindow".
    std::optional<nlohmann::json> SendJsonRequest(
        const std::string &rq,
        std::chrono::milliseconds timeout = std::chrono::milliseconds(500)) const;

  private:
    static std::string GetEnvInstanceSignature();
    static std::filesystem::path GetSocketFolderForInstance(const std::string &instanceSig);
    static bool SendAll(int fd, const void *data, std::size_t size);

  private:
    std::string m_InstanceSig;
    std::filesystem::path m_SocketFolder;
};
