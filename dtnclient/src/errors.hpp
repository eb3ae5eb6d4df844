#pragma once

#include <stdexcept>
#include <string>

namespace dtnclient {

/// Base of every error raised by the client library.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/// Malformed endpoint identifier text.
class EidError : public Error {
public:
    using Error::Error;
};

/// A message violates its structural invariants, or a wire payload has a
/// missing or unknown discriminant.
class InvalidMessageError : public Error {
public:
    using Error::Error;
};

/// Data received from the daemon is inconsistent.
class DataError : public Error {
public:
    using Error::Error;
};

/// The daemon's reply carried an error string.
class DaemonError : public Error {
public:
    using Error::Error;
};

/// The socket path does not resolve to a listening daemon.
class ConnectionNotFoundError : public Error {
public:
    using Error::Error;
};

/// Socket level failure (I/O error, expired deadline).
class TransportError : public Error {
public:
    using Error::Error;
};

} // namespace dtnclient
