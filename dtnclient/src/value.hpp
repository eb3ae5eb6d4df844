#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace dtnclient {

class Value;

using Bytes = std::vector<std::uint8_t>;
using Array = std::vector<Value>;
/// Ordered mapping of field name to value; keys are unique.
using Mapping = std::vector<std::pair<std::string, Value>>;

/**
 * Owned, self-describing value mirroring the MessagePack object model.
 *
 * Non-negative integers are always held as unsigned so that a value read
 * back from the wire compares equal to the one that was packed.
 */
class Value {
public:
    enum class Kind {
        nil,
        boolean,
        unsigned_integer,
        signed_integer,
        floating,
        string,
        bytes,
        array,
        mapping,
    };

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool v) : data_(std::in_place_type<bool>, v) {}
    Value(int v) : data_(from_signed(v)) {}
    Value(long v) : data_(from_signed(v)) {}
    Value(long long v) : data_(from_signed(v)) {}
    Value(unsigned v) : data_(std::in_place_type<std::uint64_t>, v) {}
    Value(unsigned long v) : data_(std::in_place_type<std::uint64_t>, v) {}
    Value(unsigned long long v) : data_(std::in_place_type<std::uint64_t>, v) {}
    Value(double v) : data_(std::in_place_type<double>, v) {}
    Value(const char* v) : data_(std::in_place_type<std::string>, v) {}
    Value(std::string v) : data_(std::in_place_type<std::string>, std::move(v)) {}
    Value(Bytes v) : data_(std::in_place_type<Bytes>, std::move(v)) {}
    Value(Array v) : data_(std::in_place_type<Array>, std::move(v)) {}
    Value(Mapping v) : data_(std::in_place_type<Mapping>, std::move(v)) {}

    Kind kind() const { return static_cast<Kind>(data_.index()); }

    bool is_nil() const { return kind() == Kind::nil; }
    bool is_bool() const { return kind() == Kind::boolean; }
    bool is_integer() const { return kind() == Kind::unsigned_integer || kind() == Kind::signed_integer; }
    bool is_string() const { return kind() == Kind::string; }
    bool is_bytes() const { return kind() == Kind::bytes; }
    bool is_array() const { return kind() == Kind::array; }
    bool is_mapping() const { return kind() == Kind::mapping; }

    bool as_bool() const { return std::get<bool>(data_); }
    std::uint64_t as_uint64() const { return std::get<std::uint64_t>(data_); }
    std::int64_t as_int64() const;
    double as_double() const;
    const std::string& as_string() const { return std::get<std::string>(data_); }
    const Bytes& as_bytes() const { return std::get<Bytes>(data_); }
    const Array& as_array() const { return std::get<Array>(data_); }
    const Mapping& as_mapping() const { return std::get<Mapping>(data_); }

    bool operator==(const Value& other) const { return data_ == other.data_; }
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    using Storage = std::variant<std::monostate, bool, std::uint64_t, std::int64_t, double, std::string, Bytes, Array, Mapping>;

    static Storage from_signed(long long v);

    Storage data_;
};

const char* kind_name(Value::Kind kind);

const Value* find(const Mapping& mapping, const std::string& key);

/// Replaces the value under key, or appends it when the key is new.
void set(Mapping& mapping, const std::string& key, Value value);

} // namespace dtnclient
