#include "connection.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

namespace dtnclient {

namespace {

std::string errno_text(int err) {
    return std::strerror(err);
}

bool is_timeout(int err) {
    return err == EAGAIN || err == EWOULDBLOCK;
}

void set_timeout(int fd, int option, std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    if (::setsockopt(fd, SOL_SOCKET, option, &tv, sizeof(tv)) < 0) {
        throw TransportError("setsockopt failed: " + errno_text(errno));
    }
}

} // namespace

UnixConnection::UnixConnection(const std::string& path, std::chrono::milliseconds timeout) : path_(path) {
    sockaddr_un addr{};
    if (path_.size() >= sizeof(addr.sun_path)) {
        throw TransportError("Socket path too long: " + path_);
    }

    fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) {
        throw TransportError("socket failed: " + errno_text(errno));
    }

    try {
        if (timeout.count() > 0) {
            set_timeout(fd_, SO_RCVTIMEO, timeout);
            set_timeout(fd_, SO_SNDTIMEO, timeout);
        }

        addr.sun_family = AF_UNIX;
        std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", path_.c_str());

        if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            int err = errno;
            if (err == ENOENT || err == ECONNREFUSED || err == ENOTDIR) {
                throw ConnectionNotFoundError("Could not connect to agent socket " + path_ + ": " + errno_text(err));
            }
            if (is_timeout(err)) {
                throw TransportError("Timed out connecting to " + path_);
            }
            throw TransportError("connect to " + path_ + " failed: " + errno_text(err));
        }
    } catch (const Error&) {
        ::close(fd_);
        fd_ = -1;
        throw;
    }

    LOG4CPLUS_DEBUG(transport_logger(), "Connected to " << path_);
}

UnixConnection::~UnixConnection() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

void UnixConnection::write_all(const char* data, std::size_t size) {
    std::size_t offset = 0;
    while (offset < size) {
        ssize_t written = ::send(fd_, data + offset, size - offset, MSG_NOSIGNAL);
        if (written < 0) {
            int err = errno;
            if (err == EINTR) {
                continue;
            }
            if (is_timeout(err)) {
                throw TransportError("Timed out writing to " + path_);
            }
            throw TransportError("write to " + path_ + " failed: " + errno_text(err));
        }
        offset += static_cast<std::size_t>(written);
    }
}

std::size_t UnixConnection::read_some(char* buffer, std::size_t size) {
    while (true) {
        ssize_t received = ::recv(fd_, buffer, size, 0);
        if (received >= 0) {
            return static_cast<std::size_t>(received);
        }
        int err = errno;
        if (err == EINTR) {
            continue;
        }
        if (is_timeout(err)) {
            throw TransportError("Timed out reading from " + path_);
        }
        throw TransportError("read from " + path_ + " failed: " + errno_text(err));
    }
}

ConnectionFactory unix_socket_factory(std::string path, std::chrono::milliseconds timeout) {
    return [path = std::move(path), timeout]() -> std::unique_ptr<Connection> {
        return std::make_unique<UnixConnection>(path, timeout);
    };
}

} // namespace dtnclient
