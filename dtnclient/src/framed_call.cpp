#include "framed_call.hpp"

#include "logger.hpp"
#include "msgpack_codec.hpp"

#include <log4cplus/loggingmacros.h>

#include <algorithm>
#include <vector>

namespace dtnclient {

namespace {

constexpr std::size_t kReadChunkSize = 64 * 1024;

// Returns the number of bytes read; less than size only at end of stream.
std::size_t read_exact(Connection& connection, char* buffer, std::size_t size) {
    std::size_t offset = 0;
    while (offset < size) {
        std::size_t chunk = connection.read_some(buffer + offset, size - offset);
        if (chunk == 0) {
            break;
        }
        offset += chunk;
    }
    return offset;
}

} // namespace

std::string encode_length_prefix(std::uint64_t length) {
    std::string prefix(kLengthPrefixSize, '\0');
    for (std::size_t i = 0; i < kLengthPrefixSize; ++i) {
        prefix[kLengthPrefixSize - 1 - i] = static_cast<char>((length >> (8 * i)) & 0xFF);
    }
    return prefix;
}

std::uint64_t decode_length_prefix(const char* prefix) {
    std::uint64_t length = 0;
    for (std::size_t i = 0; i < kLengthPrefixSize; ++i) {
        length = (length << 8) | static_cast<std::uint8_t>(prefix[i]);
    }
    return length;
}

void write_frame(Connection& connection, const std::string& body) {
    std::string prefix = encode_length_prefix(body.size());
    connection.write_all(prefix.data(), prefix.size());
    if (!body.empty()) {
        connection.write_all(body.data(), body.size());
    }
}

std::string read_frame(Connection& connection) {
    char prefix[kLengthPrefixSize] = {0};
    std::size_t prefix_read = read_exact(connection, prefix, sizeof(prefix));
    if (prefix_read != sizeof(prefix)) {
        throw DataError("Received truncated length prefix: " + std::to_string(prefix_read) + " of " +
                        std::to_string(kLengthPrefixSize) + " bytes");
    }

    std::uint64_t length = decode_length_prefix(prefix);
    LOG4CPLUS_DEBUG(transport_logger(), "Reply length: " << length);
    if (length == 0) {
        throw DataError("Received nonsensical data-length: " + std::to_string(length));
    }

    // Grow with the data actually received instead of trusting the announced length.
    std::string body;
    std::vector<char> chunk(kReadChunkSize);
    while (body.size() < length) {
        std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(chunk.size(), length - body.size()));
        std::size_t got = read_exact(connection, chunk.data(), want);
        body.append(chunk.data(), got);
        if (got < want) {
            break;
        }
    }

    if (body.size() != length) {
        throw DataError("Announced data length and actual length do not match - announced: " +
                        std::to_string(length) + ", actual: " + std::to_string(body.size()));
    }
    return body;
}

Message call(const ConnectionFactory& factory, const Message& request) {
    std::unique_ptr<Connection> connection = factory();
    if (!connection) {
        throw TransportError("Connection factory returned no connection");
    }

    LOG4CPLUS_DEBUG(transport_logger(), "Sending message: " << message_type_name(message_type(request)));

    std::string request_bytes = codec::encode(request);
    LOG4CPLUS_DEBUG(transport_logger(), "Message length: " << request_bytes.size());
    write_frame(*connection, request_bytes);
    LOG4CPLUS_DEBUG(transport_logger(), "Sent message");

    std::string reply_bytes = read_frame(*connection);
    Message reply = codec::decode(reply_bytes);
    LOG4CPLUS_DEBUG(transport_logger(), "Received reply: " << message_type_name(message_type(reply)));

    if (!is_response(reply)) {
        throw DataError("Received response is not a response message - message type: " +
                        message_type_name(message_type(reply)));
    }

    const std::string* error = response_error(reply);
    if (error && !error->empty()) {
        throw DaemonError(*error);
    }
    return reply;
}

} // namespace dtnclient
