#pragma once

#include "connection.hpp"
#include "message.hpp"

#include <msgpack.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

std::string pack_raw(const std::function<void(msgpack::packer<msgpack::sbuffer>&)>& pack_fn);

/// Length prefix + encoded message, as the daemon would send it.
std::string frame(const std::string& body);
std::string frame_message(const dtnclient::Message& message);

/// What a scripted connection saw during a call.
struct ScriptRecord {
    std::string written;
    int opened = 0;
    int closed = 0;
};

/// In-memory connection replaying a fixed byte stream in small chunks.
class ScriptedConnection final : public dtnclient::Connection {
public:
    ScriptedConnection(std::string incoming, std::shared_ptr<ScriptRecord> record, std::size_t max_chunk = 5);
    ~ScriptedConnection() override;

    void write_all(const char* data, std::size_t size) override;
    std::size_t read_some(char* buffer, std::size_t size) override;

private:
    std::string incoming_;
    std::size_t offset_ = 0;
    std::shared_ptr<ScriptRecord> record_;
    std::size_t max_chunk_;
};

dtnclient::ConnectionFactory scripted_factory(std::string incoming, std::shared_ptr<ScriptRecord> record);

/**
 * Minimal dtnd stand-in listening on a Unix socket in the temp directory.
 *
 * Each connection gets one framed request read; the handler's return value
 * is written back verbatim (use frame()/frame_message()).
 */
class StubDaemon {
public:
    using Handler = std::function<std::string(const std::string& request_bytes)>;

    explicit StubDaemon(Handler handler);
    ~StubDaemon();

    StubDaemon(const StubDaemon&) = delete;
    StubDaemon& operator=(const StubDaemon&) = delete;

    bool start();
    void stop();

    const std::string& socket_path() const { return socket_path_; }
    std::vector<std::string> requests() const;

private:
    void accept_loop();
    void handle_client(int client_fd);

    std::string socket_path_;
    Handler handler_;
    int server_fd_ = -1;
    std::atomic<bool> running_{false};
    std::thread accept_thread_;
    mutable std::mutex requests_mutex_;
    std::vector<std::string> requests_;
};

/// Fresh, empty directory under the system temp dir; removed on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();

    const std::string& path() const { return path_; }

private:
    std::string path_;
};
