#pragma once

#include "message.hpp"
#include "message_registry.hpp"
#include "value.hpp"

#include <msgpack.hpp>

#include <filesystem>
#include <string>

namespace dtnclient::codec {

/// Serializes the message's field mapping as a MessagePack map.
std::string encode(const Message& message);

/**
 * Parses a MessagePack map and dispatches on its `Type` field.
 *
 * Throws InvalidMessageError for malformed data, a missing or unknown
 * discriminant, or a variant whose invariants do not hold. The raw bytes
 * are saved to the dump directory first and the error names the file.
 */
Message decode(const std::string& bytes);
Message decode(const std::string& bytes, const MessageRegistry& registry);

/// Directory receiving raw bytes of undecodable messages (default: system temp dir).
void set_dump_directory(const std::filesystem::path& directory);
std::filesystem::path dump_directory();

void pack_value(msgpack::packer<msgpack::sbuffer>& pk, const Value& value);

/// Converts an unpacked object into an owned Value. Throws InvalidMessageError
/// for non-string map keys, unsupported types, or nesting deeper than 1024 levels.
Value to_value(const msgpack::object& obj);

} // namespace dtnclient::codec
