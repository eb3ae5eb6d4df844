#pragma once

#include "connection.hpp"
#include "errors.hpp"
#include "message.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace dtnclient {

/// Size of the big-endian length prefix in front of every message.
constexpr std::size_t kLengthPrefixSize = 8;

std::string encode_length_prefix(std::uint64_t length);
std::uint64_t decode_length_prefix(const char* prefix);

/// Writes one length-prefixed frame.
void write_frame(Connection& connection, const std::string& body);

/// Reads one length-prefixed frame. Throws DataError on a zero length or a short read.
std::string read_frame(Connection& connection);

/**
 * One request/response exchange on a fresh connection.
 *
 * Returns the decoded reply, which is always a Response-family variant
 * with an empty error. Throws ConnectionNotFoundError, TransportError,
 * DataError, InvalidMessageError or DaemonError.
 */
Message call(const ConnectionFactory& factory, const Message& request);

/// Extracts the expected reply variant or throws DataError naming both types.
template <typename T>
T expect(const Message& reply) {
    if (const T* typed = std::get_if<T>(&reply)) {
        return *typed;
    }
    throw DataError(std::string("response should have been ") + T::kName + ", was " +
                    message_type_name(message_type(reply)));
}

} // namespace dtnclient
