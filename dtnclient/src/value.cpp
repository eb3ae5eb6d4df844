#include "value.hpp"

#include <algorithm>

namespace dtnclient {

Value::Storage Value::from_signed(long long v) {
    if (v >= 0) {
        return Storage(std::in_place_type<std::uint64_t>, static_cast<std::uint64_t>(v));
    }
    return Storage(std::in_place_type<std::int64_t>, static_cast<std::int64_t>(v));
}

std::int64_t Value::as_int64() const {
    if (kind() == Kind::signed_integer) {
        return std::get<std::int64_t>(data_);
    }
    return static_cast<std::int64_t>(std::get<std::uint64_t>(data_));
}

double Value::as_double() const {
    switch (kind()) {
        case Kind::floating:
            return std::get<double>(data_);
        case Kind::unsigned_integer:
            return static_cast<double>(std::get<std::uint64_t>(data_));
        case Kind::signed_integer:
            return static_cast<double>(std::get<std::int64_t>(data_));
        default:
            return std::get<double>(data_);
    }
}

const char* kind_name(Value::Kind kind) {
    switch (kind) {
        case Value::Kind::nil:
            return "nil";
        case Value::Kind::boolean:
            return "bool";
        case Value::Kind::unsigned_integer:
        case Value::Kind::signed_integer:
            return "integer";
        case Value::Kind::floating:
            return "float";
        case Value::Kind::string:
            return "string";
        case Value::Kind::bytes:
            return "bytes";
        case Value::Kind::array:
            return "array";
        case Value::Kind::mapping:
            return "map";
    }
    return "unknown";
}

const Value* find(const Mapping& mapping, const std::string& key) {
    auto it = std::find_if(mapping.begin(), mapping.end(),
                           [&key](const auto& entry) { return entry.first == key; });
    if (it == mapping.end()) {
        return nullptr;
    }
    return &it->second;
}

void set(Mapping& mapping, const std::string& key, Value value) {
    for (auto& entry : mapping) {
        if (entry.first == key) {
            entry.second = std::move(value);
            return;
        }
    }
    mapping.emplace_back(key, std::move(value));
}

} // namespace dtnclient
