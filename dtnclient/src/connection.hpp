#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace dtnclient {

/// Blocking byte stream to the daemon. Closed on destruction.
class Connection {
public:
    virtual ~Connection() = default;

    /// Writes every byte or throws TransportError.
    virtual void write_all(const char* data, std::size_t size) = 0;

    /// Reads up to size bytes; returns 0 on orderly end of stream. Throws TransportError.
    virtual std::size_t read_some(char* buffer, std::size_t size) = 0;
};

using ConnectionFactory = std::function<std::unique_ptr<Connection>()>;

/// AF_UNIX stream socket connection.
class UnixConnection final : public Connection {
public:
    /**
     * Connects to the socket at path.
     *
     * @param path Filesystem path of the daemon's socket
     * @param timeout Send/receive deadline per operation (zero = block indefinitely)
     *
     * Throws ConnectionNotFoundError when nothing listens at path,
     * TransportError for any other socket failure.
     */
    UnixConnection(const std::string& path, std::chrono::milliseconds timeout);
    ~UnixConnection() override;

    UnixConnection(const UnixConnection&) = delete;
    UnixConnection& operator=(const UnixConnection&) = delete;

    void write_all(const char* data, std::size_t size) override;
    std::size_t read_some(char* buffer, std::size_t size) override;

private:
    std::string path_;
    int fd_ = -1;
};

/// Factory opening a fresh UnixConnection for every call.
ConnectionFactory unix_socket_factory(std::string path,
                                      std::chrono::milliseconds timeout = std::chrono::milliseconds::zero());

} // namespace dtnclient
