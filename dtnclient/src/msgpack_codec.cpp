#include "msgpack_codec.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <atomic>
#include <fstream>
#include <mutex>
#include <optional>
#include <system_error>

#include <unistd.h>

namespace dtnclient::codec {

namespace {

// Deepest container nesting accepted from the wire.
constexpr std::size_t kMaxNestingDepth = 1024;

std::mutex& dump_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::optional<std::filesystem::path>& configured_dump_directory() {
    static std::optional<std::filesystem::path> directory;
    return directory;
}

// Returns the path written, or nullopt when the dump could not be saved.
std::optional<std::filesystem::path> save_raw_message(const std::string& bytes) {
    static std::atomic<unsigned> sequence{0};

    std::error_code ec;
    std::filesystem::path directory = dump_directory();
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        LOG4CPLUS_WARN(codec_logger(), "Cannot create dump directory " << directory.string() << ": " << ec.message());
        return std::nullopt;
    }

    std::filesystem::path path = directory / ("dtnclient-decode-" + std::to_string(::getpid()) + "-" +
                                              std::to_string(sequence.fetch_add(1)) + ".msgpack");
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out) {
        LOG4CPLUS_WARN(codec_logger(), "Cannot write raw message to " << path.string());
        return std::nullopt;
    }
    return path;
}

std::string render_type_value(const Value& value) {
    switch (value.kind()) {
        case Value::Kind::unsigned_integer:
            return std::to_string(value.as_uint64());
        case Value::Kind::signed_integer:
            return std::to_string(value.as_int64());
        case Value::Kind::string:
            return "'" + value.as_string() + "'";
        default:
            return std::string("<") + kind_name(value.kind()) + ">";
    }
}

Value convert(const msgpack::object& obj, std::size_t depth) {
    if (depth > kMaxNestingDepth) {
        throw InvalidMessageError("MessagePack nesting too deep (limit " + std::to_string(kMaxNestingDepth) + ")");
    }

    switch (obj.type) {
        case msgpack::type::NIL:
            return Value();
        case msgpack::type::BOOLEAN:
            return Value(obj.via.boolean);
        case msgpack::type::POSITIVE_INTEGER:
            return Value(static_cast<unsigned long long>(obj.via.u64));
        case msgpack::type::NEGATIVE_INTEGER:
            return Value(static_cast<long long>(obj.via.i64));
        case msgpack::type::FLOAT32:
        case msgpack::type::FLOAT64:
            return Value(obj.via.f64);
        case msgpack::type::STR:
            return Value(std::string(obj.via.str.ptr, obj.via.str.size));
        case msgpack::type::BIN: {
            const auto* begin = reinterpret_cast<const std::uint8_t*>(obj.via.bin.ptr);
            return Value(Bytes(begin, begin + obj.via.bin.size));
        }
        case msgpack::type::ARRAY: {
            Array array;
            array.reserve(obj.via.array.size);
            for (uint32_t i = 0; i < obj.via.array.size; ++i) {
                array.push_back(convert(obj.via.array.ptr[i], depth + 1));
            }
            return Value(std::move(array));
        }
        case msgpack::type::MAP: {
            Mapping mapping;
            mapping.reserve(obj.via.map.size);
            for (uint32_t i = 0; i < obj.via.map.size; ++i) {
                const msgpack::object_kv& kv = obj.via.map.ptr[i];
                std::string key;
                if (kv.key.type == msgpack::type::STR) {
                    key.assign(kv.key.via.str.ptr, kv.key.via.str.size);
                } else if (kv.key.type == msgpack::type::BIN) {
                    key.assign(kv.key.via.bin.ptr, kv.key.via.bin.size);
                } else {
                    throw InvalidMessageError("Map keys must be strings");
                }
                set(mapping, key, convert(kv.val, depth + 1));
            }
            return Value(std::move(mapping));
        }
        default:
            throw InvalidMessageError("Unsupported MessagePack type " + std::to_string(static_cast<int>(obj.type)));
    }
}

Mapping unpack_mapping(const std::string& bytes) {
    msgpack::object_handle handle;
    std::size_t offset = 0;
    const msgpack::unpack_limit limit(0xffffffff, 0xffffffff, 0xffffffff, 0xffffffff, 0xffffffff, kMaxNestingDepth);
    try {
        handle = msgpack::unpack(bytes.data(), bytes.size(), offset, nullptr, nullptr, limit);
    } catch (const msgpack::depth_size_overflow&) {
        throw InvalidMessageError("MessagePack nesting too deep (limit " + std::to_string(kMaxNestingDepth) + ")");
    } catch (const std::exception& exc) {
        throw InvalidMessageError(std::string("Malformed MessagePack: ") + exc.what());
    }
    if (offset != bytes.size()) {
        throw InvalidMessageError("Malformed MessagePack: " + std::to_string(bytes.size() - offset) +
                                  " trailing bytes after message");
    }

    const msgpack::object& root = handle.get();
    if (root.type != msgpack::type::MAP) {
        throw InvalidMessageError("Message is not a MessagePack map");
    }
    return to_value(root).as_mapping();
}

Message decode_mapping(const std::string& bytes, const MessageRegistry& registry) {
    Mapping mapping = unpack_mapping(bytes);

    const Value* type_value = find(mapping, field::kType);
    if (!type_value) {
        throw InvalidMessageError(std::string("Message missing '") + field::kType + "' field");
    }

    std::optional<MessageType> type;
    if (type_value->kind() == Value::Kind::unsigned_integer) {
        type = message_type_from_id(type_value->as_uint64());
    }
    if (!type) {
        throw InvalidMessageError("Unknown MessageType ID: " + render_type_value(*type_value));
    }

    MessageDecoder decoder = registry.find(*type);
    if (!decoder) {
        throw InvalidMessageError("No decoder registered for MessageType " + message_type_name(*type) + " (" +
                                  std::to_string(static_cast<int>(*type)) + ")");
    }
    return decoder(mapping);
}

} // namespace

std::string encode(const Message& message) {
    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> pk(&buffer);
    pack_value(pk, to_mapping(message));
    return std::string(buffer.data(), buffer.size());
}

Message decode(const std::string& bytes) {
    return decode(bytes, default_registry());
}

Message decode(const std::string& bytes, const MessageRegistry& registry) {
    try {
        return decode_mapping(bytes, registry);
    } catch (const InvalidMessageError& exc) {
        auto saved = save_raw_message(bytes);
        std::string reason = exc.what();
        LOG4CPLUS_ERROR(codec_logger(), "Decode error: " << reason);
        if (saved) {
            throw InvalidMessageError(reason + " (raw message saved to " + saved->string() + ")");
        }
        throw;
    }
}

void set_dump_directory(const std::filesystem::path& directory) {
    std::lock_guard<std::mutex> lock(dump_mutex());
    configured_dump_directory() = directory;
}

std::filesystem::path dump_directory() {
    std::lock_guard<std::mutex> lock(dump_mutex());
    if (configured_dump_directory() && !configured_dump_directory()->empty()) {
        return *configured_dump_directory();
    }
    std::error_code ec;
    std::filesystem::path temp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return "/tmp";
    }
    return temp;
}

void pack_value(msgpack::packer<msgpack::sbuffer>& pk, const Value& value) {
    switch (value.kind()) {
        case Value::Kind::nil:
            pk.pack_nil();
            break;
        case Value::Kind::boolean:
            pk.pack(value.as_bool());
            break;
        case Value::Kind::unsigned_integer:
            pk.pack(value.as_uint64());
            break;
        case Value::Kind::signed_integer:
            pk.pack(value.as_int64());
            break;
        case Value::Kind::floating:
            pk.pack_double(value.as_double());
            break;
        case Value::Kind::string:
            pk.pack(value.as_string());
            break;
        case Value::Kind::bytes: {
            const Bytes& bytes = value.as_bytes();
            pk.pack_bin(static_cast<uint32_t>(bytes.size()));
            pk.pack_bin_body(reinterpret_cast<const char*>(bytes.data()), static_cast<uint32_t>(bytes.size()));
            break;
        }
        case Value::Kind::array: {
            const Array& array = value.as_array();
            pk.pack_array(static_cast<uint32_t>(array.size()));
            for (const auto& element : array) {
                pack_value(pk, element);
            }
            break;
        }
        case Value::Kind::mapping: {
            const Mapping& mapping = value.as_mapping();
            pk.pack_map(static_cast<uint32_t>(mapping.size()));
            for (const auto& entry : mapping) {
                pk.pack(entry.first);
                pack_value(pk, entry.second);
            }
            break;
        }
    }
}

Value to_value(const msgpack::object& obj) {
    return convert(obj, 1);
}

} // namespace dtnclient::codec
