#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "common.hpp"

enum class InputKind { KEY, MOUSE_MOVE, CLICK, SCROLL };

struct InputEvent {
    InputKind kind = InputKind::KEY;
    double timestamp = 0.0;
    double distance = 0.0; // pixels, MOUSE_MOVE only
};

// Hand-off between the input listener thread and the tick loop.
class InputQueue {
  public:
    void Push(const InputEvent &ev);
    std::vector<InputEvent> Drain();
    std::size_t Size() const;

  private:
    static constexpr std::size_t kMaxPending = 65536;

    mutable std::mutex m_Mutex;
    std::deque<InputEvent> m_Events;
};

class MetricsSampler {
  public:
    MetricsSampler(InputQueue &queue, double now);

    ActivitySnapshot Sample(double now, const FocusedWindow &fw);

    void SetWindowSeconds(double seconds);
    void SetIdleThreshold(int seconds);
    void SetIdleZeroThreshold(double seconds);
    void SetAutoDetectFullscreen(bool enabled);
    void SetBlocklist(const std::vector<std::string> &apps);

    double LastInputTime() const;

  private:
    void Record(const InputEvent &ev);
    void Prune(double now);
    bool IsBlocklisted(const std::string &appId) const;

  private:
    InputQueue &m_Queue;

    std::deque<std::pair<double, double>> m_MouseMoves; // (timestamp, distance)
    std::deque<double> m_KeyPresses;
    std::deque<double> m_Clicks;
    std::deque<double> m_Scrolls;

    double m_LastInput;
    double m_LastSample;
    double m_PendingDistance = 0.0;
    double m_ActiveSeconds = 0.0;

    double m_WindowSeconds = 60.0;
    int m_IdleThreshold = 180;
    double m_IdleZeroThreshold = 1.0;
    bool m_AutoDetectFullscreen = true;
    std::vector<std::string> m_Blocklist;

    static constexpr double kMouseJitterPx = 5.0;
    static constexpr double kMaxSampleGap = 60.0;
};
