#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include "metrics.hpp"

// Reads keyboard and pointer activity from /dev/input/event* and feeds the InputQueue.
// Needs read access to the devices (root or the "input" group); without it the engine
// still runs and simply never sees input.
class InputListener {
  public:
    explicit InputListener(InputQueue &queue,
                           std::filesystem::path dir = std::filesystem::path("/dev/input"));
    ~InputListener();

    InputListener(const InputListener &) = delete;
    InputListener &operator=(const InputListener &) = delete;

    bool Start();
    void Stop();
    bool IsRunning() const;
    std::size_t DeviceCount() const;

  private:
    struct Device {
        int fd = -1;
        std::string path;
        double dx = 0.0;
        double dy = 0.0;
        int absX = -1;
        int absY = -1;
        double absDistance = 0.0;
    };

    void OpenDevices();
    void CloseDevices();
    void Run();
    void HandleEvent(Device &dev, unsigned short type, unsigned short code, int value,
                     double ts);
    static void CloseFd(int &fd);

  private:
    InputQueue &m_Queue;
    std::filesystem::path m_Dir;
    std::vector<Device> m_Devices;

    std::atomic<bool> m_Running{false};
    std::atomic<bool> m_Stop{false};
    std::thread m_Thread;

    static constexpr std::chrono::milliseconds kPollTimeout{250};
};
