#include "niri.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

// ─────────────────────────────────────
NiriIPC::NiriIPC() : m_SocketPath(GetEnvSocketPath()) {}

// ─────────────────────────────────────
NiriIPC::~NiriIPC() {
    DisconnectQuery();
}

// ─────────────────────────────────────
std::string NiriIPC::GetEnvSocketPath() {
    const char *env = std::getenv("NIRI_SOCKET");
    if (env == nullptr) {
        return {};
    }
    return std::string(env);
}

// ─────────────────────────────────────
bool NiriIPC::IsAvailable() const {
    return !m_SocketPath.empty();
}

// ─────────────────────────────────────
void NiriIPC::CloseFd(int &fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// ─────────────────────────────────────
bool NiriIPC::ConnectQuery() {
    if (!IsAvailable()) {
        return false;
    }
    if (m_QueryFd >= 0) {
        return true;
    }

    const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        spdlog::error("Failed to create niri socket: {}", std::strerror(errno));
        return false;
    }

    sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;

    if (m_SocketPath.size() >= sizeof(addr.sun_path)) {
        spdlog::error("NIRI_SOCKET path too long");
        ::close(fd);
        return false;
    }
    std::strncpy(addr.sun_path, m_SocketPath.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
        const int err = errno;
        if (err != ENOENT && err != ECONNREFUSED) {
            spdlog::warn("Failed to connect to niri socket: {}", std::strerror(err));
        }
        ::close(fd);
        return false;
    }

    m_QueryFd = fd;
    return true;
}

// ─────────────────────────────────────
void NiriIPC::DisconnectQuery() {
    CloseFd(m_QueryFd);
}

// ─────────────────────────────────────
bool NiriIPC::SendAll(int fd, const void *data, std::size_t size) {
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
bool NiriIPC::ReadLine(int fd, std::string &out_line, std::string &buffer,
                       std::chrono::milliseconds timeout) {
    out_line.clear();
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        if (auto pos = buffer.find('\n'); pos != std::string::npos) {
            out_line = buffer.substr(0, pos);
            buffer.erase(0, pos + 1);
            return true;
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }

        pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;

        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        const int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc <= 0) {
            return false;
        }
        if ((pfd.revents & (POLLERR | POLLNVAL)) != 0) {
            return false;
        }

        char tmp[4096];
        const ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) {
            return false;
        }
        buffer.append(tmp, static_cast<std::size_t>(n));
    }
}

// ─────────────────────────────────────
std::optional<nlohmann::json> NiriIPC::SendEnumRequest(const std::string &enum_name,
                                                       std::chrono::milliseconds timeout) {
    if (!ConnectQuery()) {
        return std::nullopt;
    }

    const std::string request = "\"" + enum_name + "\"\n";
    if (!SendAll(m_QueryFd, request.data(), request.size())) {
        spdlog::debug("Failed to send niri IPC request");
        DisconnectQuery();
        return std::nullopt;
    }

    std::string buffer;
    std::string line;
    const bool ok = ReadLine(m_QueryFd, line, buffer, timeout);

    // niri answers one request per connection.
    DisconnectQuery();

    if (!ok) {
        spdlog::debug("No response from niri IPC (timeout/disconnect)");
        return std::nullopt;
    }

    try {
        return nlohmann::json::parse(line);
    } catch (const nlohmann::json::exception &e) {
        spdlog::warn("Failed to parse niri IPC response JSON: {}", e.what());
        return std::nullopt;
    }
}
