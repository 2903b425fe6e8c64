#include "hyprland.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

static std::filesystem::path ResolveHyprBaseDir() {
    const char *xdgRuntimeDirEnv = std::getenv("XDG_RUNTIME_DIR");
    std::filesystem::path xdgRuntimeDir;
    if (xdgRuntimeDirEnv != nullptr && *xdgRuntimeDirEnv) {
        xdgRuntimeDir = std::filesystem::path(xdgRuntimeDirEnv);
    }

    std::error_code ec;
    if (!xdgRuntimeDir.empty() && std::filesystem::exists(xdgRuntimeDir / "hypr", ec)) {
        return xdgRuntimeDir / "hypr";
    }

    spdlog::debug("$XDG_RUNTIME_DIR/hypr does not exist, falling back to /tmp/hypr");
    return std::filesystem::path("/tmp") / "hypr";
}

// ─────────────────────────────────────
HyprlandIPC::HyprlandIPC() : m_InstanceSig(GetEnvInstanceSignature()) {
    if (!m_InstanceSig.empty()) {
        m_SocketFolder = GetSocketFolderForInstance(m_InstanceSig);
    }
}

// ─────────────────────────────────────
std::string HyprlandIPC::GetEnvInstanceSignature() {
    const char *env = std::getenv("HYPRLAND_INSTANCE_SIGNATURE");
    if (env == nullptr) {
        return {};
    }
    return std::string(env);
}

// ─────────────────────────────────────
std::filesystem::path HyprlandIPC::GetSocketFolderForInstance(const std::string &instanceSig) {
    return ResolveHyprBaseDir() / instanceSig;
}

// ─────────────────────────────────────
bool HyprlandIPC::IsAvailable() const {
    if (m_InstanceSig.empty() || m_SocketFolder.empty()) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::exists(m_SocketFolder / ".socket.sock", ec);
}

// ─────────────────────────────────────
bool HyprlandIPC::SendAll(int fd, const void *data, std::size_t size) {
    const char *ptr = static_cast<const char *>(data);
    std::size_t remaining = size;

    while (remaining > 0) {
        const ssize_t sent = ::send(fd, ptr, remaining, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        if (sent == 0) {
            return false;
        }
        ptr += static_cast<std::size_t>(sent);
        remaining -= static_cast<std::size_t>(sent);
    }

    return true;
}

// ─────────────────────────────────────
std::optional<nlohmann::json>
HyprlandIPC::SendJsonRequest(const std::string &rq, std::chrono::milliseconds timeout) const {
    if (!IsAvailable()) {
        return std::nullopt;
    }

    const auto socketPath = m_SocketFolder / ".socket.sock";

    const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        spdlog::warn("Hyprland IPC: socket() failed: {}", std::strerror(errno));
        return std::nullopt;
    }

    sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;

    const std::string socketPathStr = socketPath.string();
    if (socketPathStr.size() >= sizeof(addr.sun_path)) {
        ::close(fd);
        spdlog::warn("Hyprland IPC: socket path too long");
        return std::nullopt;
    }
    std::strncpy(addr.sun_path, socketPathStr.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
        spdlog::debug("Hyprland IPC: connect() failed: {}", std::strerror(errno));
        ::close(fd);
        return std::nullopt;
    }

    // "j/" prefix asks for a JSON reply.
    const std::string request = "j/" + rq;
    if (!SendAll(fd, request.data(), request.size())) {
        ::close(fd);
        return std::nullopt;
    }

    // Hyprland closes socket1 after the reply, so read until EOF or timeout.
    std::string response;
    char buffer[8192];

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        const int prc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (prc <= 0) {
            break;
        }
        if ((pfd.revents & (POLLERR | POLLNVAL)) != 0) {
            break;
        }
        if ((pfd.revents & POLLIN) == 0) {
            if ((pfd.revents & POLLHUP) != 0) {
                break;
            }
            continue;
        }

        const ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
        if (n <= 0) {
            break;
        }
        response.append(buffer, static_cast<std::size_t>(n));
    }

    ::close(fd);

    if (response.empty()) {
        return std::nullopt;
    }

    try {
        return nlohmann::json::parse(response);
    } catch (const nlohmann::json::exception &e) {
        spdlog::debug("Hyprland IPC: failed to parse JSON reply for '{}': {}", rq, e.what());
        return std::nullopt;
    }
}
