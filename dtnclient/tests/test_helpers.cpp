#include "test_helpers.hpp"

#include "framed_call.hpp"
#include "logger.hpp"
#include "msgpack_codec.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <filesystem>

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace {

class LoggingEnvironment final : public ::testing::Environment {
public:
    void SetUp() override {
        static std::once_flag once;
        std::call_once(once, []() { dtnclient::init_logging(DTNCLIENT_TEST_LOG_CONFIG); });
    }
};

::testing::Environment* const kLoggingEnvironment = ::testing::AddGlobalTestEnvironment(new LoggingEnvironment());

std::string unique_temp_name(const char* prefix) {
    static std::atomic<unsigned> counter{0};
    return (std::filesystem::temp_directory_path() /
            (std::string(prefix) + std::to_string(::getpid()) + "-" + std::to_string(counter.fetch_add(1))))
        .string();
}

bool read_exact(int fd, char* buffer, std::size_t size) {
    std::size_t offset = 0;
    while (offset < size) {
        ssize_t chunk = ::read(fd, buffer + offset, size - offset);
        if (chunk <= 0) {
            return false;
        }
        offset += static_cast<std::size_t>(chunk);
    }
    return true;
}

void write_all(int fd, const std::string& data) {
    std::size_t offset = 0;
    while (offset < data.size()) {
        ssize_t chunk = ::send(fd, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
        if (chunk <= 0) {
            return;
        }
        offset += static_cast<std::size_t>(chunk);
    }
}

} // namespace

std::string pack_raw(const std::function<void(msgpack::packer<msgpack::sbuffer>&)>& pack_fn) {
    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> pk(&buffer);
    pack_fn(pk);
    return std::string(buffer.data(), buffer.size());
}

std::string frame(const std::string& body) {
    return dtnclient::encode_length_prefix(body.size()) + body;
}

std::string frame_message(const dtnclient::Message& message) {
    return frame(dtnclient::codec::encode(message));
}

// ScriptedConnection

ScriptedConnection::ScriptedConnection(std::string incoming, std::shared_ptr<ScriptRecord> record,
                                       std::size_t max_chunk)
    : incoming_(std::move(incoming)), record_(std::move(record)), max_chunk_(max_chunk) {
    ++record_->opened;
}

ScriptedConnection::~ScriptedConnection() {
    ++record_->closed;
}

void ScriptedConnection::write_all(const char* data, std::size_t size) {
    record_->written.append(data, size);
}

std::size_t ScriptedConnection::read_some(char* buffer, std::size_t size) {
    std::size_t n = std::min({size, max_chunk_, incoming_.size() - offset_});
    std::memcpy(buffer, incoming_.data() + offset_, n);
    offset_ += n;
    return n;
}

dtnclient::ConnectionFactory scripted_factory(std::string incoming, std::shared_ptr<ScriptRecord> record) {
    return [incoming = std::move(incoming), record]() -> std::unique_ptr<dtnclient::Connection> {
        return std::make_unique<ScriptedConnection>(incoming, record);
    };
}

// StubDaemon

StubDaemon::StubDaemon(Handler handler)
    : socket_path_(unique_temp_name("dtnclient-stub-") + ".sock"), handler_(std::move(handler)) {}

StubDaemon::~StubDaemon() {
    stop();
}

bool StubDaemon::start() {
    if (running_) {
        return true;
    }

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        std::perror("socket");
        return false;
    }

    ::unlink(socket_path_.c_str());

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", socket_path_.c_str());

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::perror("bind");
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (::listen(server_fd_, 8) < 0) {
        std::perror("listen");
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    running_ = true;
    accept_thread_ = std::thread(&StubDaemon::accept_loop, this);
    return true;
}

void StubDaemon::stop() {
    if (!running_) {
        return;
    }
    running_ = false;

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }

    ::unlink(socket_path_.c_str());
}

std::vector<std::string> StubDaemon::requests() const {
    std::lock_guard<std::mutex> lock(requests_mutex_);
    return requests_;
}

void StubDaemon::accept_loop() {
    while (running_) {
        pollfd pfd{};
        pfd.fd = server_fd_;
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, 50);
        if (ready <= 0) {
            continue;
        }

        int client_fd = ::accept(server_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            continue;
        }
        handle_client(client_fd);
        ::close(client_fd);
    }
}

void StubDaemon::handle_client(int client_fd) {
    char prefix[dtnclient::kLengthPrefixSize];
    if (!read_exact(client_fd, prefix, sizeof(prefix))) {
        return;
    }

    std::uint64_t length = dtnclient::decode_length_prefix(prefix);
    std::string request(length, '\0');
    if (length > 0 && !read_exact(client_fd, &request[0], request.size())) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(requests_mutex_);
        requests_.push_back(request);
    }

    write_all(client_fd, handler_(request));
}

// TempDir

TempDir::TempDir() : path_(unique_temp_name("dtnclient-test-")) {
    std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}
