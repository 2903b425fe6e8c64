#include "input.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <linux/input.h>
#include <poll.h>
#include <unistd.h>

// ─────────────────────────────────────
InputListener::InputListener(InputQueue &queue, std::filesystem::path dir)
    : m_Queue(queue), m_Dir(std::move(dir)) {}

// ─────────────────────────────────────
InputListener::~InputListener() {
    Stop();
}

// ─────────────────────────────────────
void InputListener::CloseFd(int &fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// ─────────────────────────────────────
void InputListener::OpenDevices() {
    std::error_code ec;
    if (!std::filesystem::is_directory(m_Dir, ec)) {
        spdlog::warn("Input directory {} not available", m_Dir.string());
        return;
    }

    int denied = 0;
    for (const auto &entry : std::filesystem::directory_iterator(m_Dir, ec)) {
        const std::string name = entry.path().filename().string();
        if (name.rfind("event", 0) != 0) {
            continue;
        }

        const int fd = ::open(entry.path().c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
        if (fd < 0) {
            if (errno == EACCES || errno == EPERM) {
                denied++;
            } else {
                spdlog::debug("Failed to open {}: {}", entry.path().string(),
                              std::strerror(errno));
            }
            continue;
        }

        Device dev;
        dev.fd = fd;
        dev.path = entry.path().string();
        m_Devices.push_back(dev);
    }

    if (denied > 0) {
        spdlog::warn("Permission denied on {} input devices (add the user to the 'input' group)",
                     denied);
    }
    spdlog::debug("Opened {} input devices", m_Devices.size());
}

// ─────────────────────────────────────
void InputListener::CloseDevices() {
    for (auto &dev : m_Devices) {
        CloseFd(dev.fd);
    }
    m_Devices.clear();
}

// ─────────────────────────────────────
bool InputListener::Start() {
    if (m_Running.load()) {
        return true;
    }

    OpenDevices();
    if (m_Devices.empty()) {
        spdlog::warn("No readable input devices; activity metrics will stay at zero");
        return false;
    }

    m_Stop.store(false);
    m_Running.store(true);
    m_Thread = std::thread([this]() { Run(); });
    spdlog::info("Input listener started on {} devices", m_Devices.size());
    return true;
}

// ─────────────────────────────────────
void InputListener::Stop() {
    m_Stop.store(true);
    if (m_Thread.joinable()) {
        m_Thread.join();
    }
    m_Running.store(false);
    CloseDevices();
}

// ─────────────────────────────────────
bool InputListener::IsRunning() const {
    return m_Running.load();
}

// ─────────────────────────────────────
std::size_t InputListener::DeviceCount() const {
    return m_Devices.size();
}

// ─────────────────────────────────────
void InputListener::HandleEvent(Device &dev, unsigned short type, unsigned short code,
                                int value, double ts) {
    switch (type) {
    case EV_KEY: {
        // value: 0 release, 1 press, 2 autorepeat
        if (value != 1) {
            return;
        }
        InputEvent ev;
        ev.timestamp = ts;
        ev.kind = (code >= BTN_MISC && code < KEY_OK) ? InputKind::CLICK : InputKind::KEY;
        if (code == BTN_TOUCH || code == BTN_TOOL_FINGER) {
            // Touch begin; reset so the jump from the last finger position is not a move.
            dev.absX = -1;
            dev.absY = -1;
            return;
        }
        m_Queue.Push(ev);
        return;
    }
    case EV_REL:
        if (code == REL_X) {
            dev.dx += value;
        } else if (code == REL_Y) {
            dev.dy += value;
        } else if (code == REL_WHEEL || code == REL_HWHEEL) {
            InputEvent ev;
            ev.kind = InputKind::SCROLL;
            ev.timestamp = ts;
            m_Queue.Push(ev);
        }
        return;
    case EV_ABS:
        if (code == ABS_X || code == ABS_MT_POSITION_X) {
            if (dev.absX >= 0) {
                dev.absDistance += std::abs(value - dev.absX);
            }
            dev.absX = value;
        } else if (code == ABS_Y || code == ABS_MT_POSITION_Y) {
            if (dev.absY >= 0) {
                dev.absDistance += std::abs(value - dev.absY);
            }
            dev.absY = value;
        }
        return;
    case EV_SYN:
        if (code != SYN_REPORT) {
            return;
        }
        {
            const double distance = std::hypot(dev.dx, dev.dy) + dev.absDistance;
            dev.dx = 0.0;
            dev.dy = 0.0;
            dev.absDistance = 0.0;
            if (distance > 0.0) {
                InputEvent ev;
                ev.kind = InputKind::MOUSE_MOVE;
                ev.timestamp = ts;
                ev.distance = distance;
                m_Queue.Push(ev);
            }
        }
        return;
    default:
        return;
    }
}

// ─────────────────────────────────────
void InputListener::Run() {
    std::vector<pollfd> fds;

    while (!m_Stop.load()) {
        fds.clear();
        for (const auto &dev : m_Devices) {
            if (dev.fd >= 0) {
                pollfd pfd;
                pfd.fd = dev.fd;
                pfd.events = POLLIN;
                pfd.revents = 0;
                fds.push_back(pfd);
            }
        }
        if (fds.empty()) {
            spdlog::warn("All input devices went away; input listener stopping");
            break;
        }

        const int rc = ::poll(fds.data(), fds.size(), static_cast<int>(kPollTimeout.count()));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("Input poll failed: {}", std::strerror(errno));
            break;
        }
        if (rc == 0) {
            continue;
        }

        const double now = NowUnix();
        for (const auto &pfd : fds) {
            if (pfd.revents == 0) {
                continue;
            }
            auto it = std::find_if(m_Devices.begin(), m_Devices.end(),
                                   [&pfd](const Device &d) { return d.fd == pfd.fd; });
            if (it == m_Devices.end()) {
                continue;
            }

            if ((pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0) {
                spdlog::info("Input device {} disconnected", it->path);
                CloseFd(it->fd);
                continue;
            }

            input_event events[64];
            while (true) {
                const ssize_t n = ::read(it->fd, events, sizeof(events));
                if (n < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    if (errno != EAGAIN && errno != EWOULDBLOCK) {
                        spdlog::debug("Input read failed on {}: {}", it->path,
                                      std::strerror(errno));
                        CloseFd(it->fd);
                    }
                    break;
                }
                if (n == 0) {
                    break;
                }
                const std::size_t count = static_cast<std::size_t>(n) / sizeof(input_event);
                for (std::size_t i = 0; i < count; ++i) {
                    HandleEvent(*it, events[i].type, events[i].code, events[i].value, now);
                }
                if (static_cast<std::size_t>(n) < sizeof(events)) {
                    break;
                }
            }
        }
    }

    m_Running.store(false);
}
