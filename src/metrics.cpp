#include "metrics.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

// ─────────────────────────────────────
void InputQueue::Push(const InputEvent &ev) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (m_Events.size() >= kMaxPending) {
        m_Events.pop_front();
    }
    m_Events.push_back(ev);
}

// ─────────────────────────────────────
std::vector<InputEvent> InputQueue::Drain() {
    std::lock_guard<std::mutex> lock(m_Mutex);
    std::vector<InputEvent> out(m_Events.begin(), m_Events.end());
    m_Events.clear();
    return out;
}

// ─────────────────────────────────────
std::size_t InputQueue::Size() const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return m_Events.size();
}

// ─────────────────────────────────────
MetricsSampler::MetricsSampler(InputQueue &queue, double now)
    : m_Queue(queue), m_LastInput(now), m_LastSample(now) {}

// ─────────────────────────────────────
void MetricsSampler::SetWindowSeconds(double seconds) {
    if (seconds > 0.0) {
        m_WindowSeconds = seconds;
    }
}

// ─────────────────────────────────────
void MetricsSampler::SetIdleThreshold(int seconds) {
    if (seconds > 0) {
        m_IdleThreshold = seconds;
    }
}

// ─────────────────────────────────────
void MetricsSampler::SetIdleZeroThreshold(double seconds) {
    if (seconds > 0.0) {
        m_IdleZeroThreshold = seconds;
    }
}

// ─────────────────────────────────────
void MetricsSampler::SetAutoDetectFullscreen(bool enabled) {
    m_AutoDetectFullscreen = enabled;
}

// ─────────────────────────────────────
void MetricsSampler::SetBlocklist(const std::vector<std::string> &apps) {
    m_Blocklist.clear();
    for (const auto &app : apps) {
        if (!app.empty()) {
            m_Blocklist.push_back(ToLower(app));
        }
    }
    spdlog::debug("Immersive block-list set to {} entries", m_Blocklist.size());
}

// ─────────────────────────────────────
double MetricsSampler::LastInputTime() const {
    return m_LastInput;
}

// ─────────────────────────────────────
void MetricsSampler::Record(const InputEvent &ev) {
    switch (ev.kind) {
    case InputKind::MOUSE_MOVE:
        // Sub-threshold movement accumulates until it adds up to a real move.
        m_PendingDistance += std::max(0.0, ev.distance);
        if (m_PendingDistance <= kMouseJitterPx) {
            return;
        }
        m_MouseMoves.emplace_back(ev.timestamp, m_PendingDistance);
        m_PendingDistance = 0.0;
        break;
    case InputKind::KEY:
        m_KeyPresses.push_back(ev.timestamp);
        break;
    case InputKind::CLICK:
        m_Clicks.push_back(ev.timestamp);
        break;
    case InputKind::SCROLL:
        m_Scrolls.push_back(ev.timestamp);
        break;
    }
    m_LastInput = std::max(m_LastInput, ev.timestamp);
}

// ─────────────────────────────────────
void MetricsSampler::Prune(double now) {
    const double cutoff = now - m_WindowSeconds;
    while (!m_MouseMoves.empty() && m_MouseMoves.front().first < cutoff) {
        m_MouseMoves.pop_front();
    }
    while (!m_KeyPresses.empty() && m_KeyPresses.front() < cutoff) {
        m_KeyPresses.pop_front();
    }
    while (!m_Clicks.empty() && m_Clicks.front() < cutoff) {
        m_Clicks.pop_front();
    }
    while (!m_Scrolls.empty() && m_Scrolls.front() < cutoff) {
        m_Scrolls.pop_front();
    }
}

// ─────────────────────────────────────
bool MetricsSampler::IsBlocklisted(const std::string &appId) const {
    if (appId.empty()) {
        return false;
    }
    const std::string lowered = ToLower(appId);
    return std::find(m_Blocklist.begin(), m_Blocklist.end(), lowered) != m_Blocklist.end();
}

// ─────────────────────────────────────
ActivitySnapshot MetricsSampler::Sample(double now, const FocusedWindow &fw) {
    std::vector<InputEvent> events = m_Queue.Drain();
    std::sort(events.begin(), events.end(),
              [](const InputEvent &a, const InputEvent &b) { return a.timestamp < b.timestamp; });
    for (const auto &ev : events) {
        if (ev.timestamp > now) {
            // Stamped after this tick started; count it as happening now.
            InputEvent clamped = ev;
            clamped.timestamp = now;
            Record(clamped);
        } else {
            Record(ev);
        }
    }

    Prune(now);

    ActivitySnapshot snap;
    snap.foreground_app = fw.app_id;
    snap.is_fullscreen = fw.fullscreen;

    const double sinceInput = std::max(0.0, now - m_LastInput);
    snap.idle_seconds = static_cast<int>(std::floor(sinceInput));

    if (sinceInput > m_IdleZeroThreshold) {
        snap.mouse_velocity = 0.0;
        snap.keys_per_minute = 0;
        snap.clicks_per_minute = 0;
        snap.scrolls_per_minute = 0;
    } else {
        double distance = 0.0;
        for (const auto &[ts, d] : m_MouseMoves) {
            distance += d;
        }
        const double perMinute = 60.0 / m_WindowSeconds;
        snap.mouse_velocity = distance / m_WindowSeconds;
        snap.keys_per_minute =
            static_cast<int>(std::lround(static_cast<double>(m_KeyPresses.size()) * perMinute));
        snap.clicks_per_minute =
            static_cast<int>(std::lround(static_cast<double>(m_Clicks.size()) * perMinute));
        snap.scrolls_per_minute =
            static_cast<int>(std::lround(static_cast<double>(m_Scrolls.size()) * perMinute));
    }

    if ((m_AutoDetectFullscreen && fw.fullscreen) || IsBlocklisted(fw.app_id)) {
        snap.state = ActivityState::IMMERSIVE;
    } else if (snap.idle_seconds >= m_IdleThreshold) {
        snap.state = ActivityState::IDLE;
    } else {
        snap.state = ActivityState::ACTIVE;
    }

    const double dt = now - m_LastSample;
    if (snap.state == ActivityState::ACTIVE && dt > 0.0 && dt <= kMaxSampleGap) {
        m_ActiveSeconds += dt;
    }
    if (now > m_LastSample) {
        m_LastSample = now;
    }
    snap.active_seconds = static_cast<int>(std::floor(m_ActiveSeconds));

    return snap;
}
