#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace dtnclient {

/**
 * Endpoint identifier in one of the canonical forms
 * `dtn:none`, `dtn://<node>/<service>` or `ipn:<node>.<service>`.
 *
 * Every constructor normalizes and validates; a malformed identifier
 * throws EidError. Instances are immutable and compare by canonical text.
 */
class Eid {
public:
    enum class Scheme {
        none,
        dtn,
        ipn,
    };

    /// The `dtn:none` endpoint.
    Eid();

    static Eid parse(const std::string& text);
    static Eid none();
    static Eid dtn(const std::string& node, const std::string& service = "");
    static Eid ipn(std::uint64_t node, std::uint64_t service);

    Scheme scheme() const;

    /// Node part, or nullopt for `dtn:none`.
    std::optional<std::string> node() const;

    /// Service part, or nullopt for `dtn:none`.
    std::optional<std::string> service() const;

    const std::string& str() const { return text_; }

    /// False only for `dtn:none`.
    explicit operator bool() const;

    bool operator==(const Eid& other) const { return text_ == other.text_; }
    bool operator!=(const Eid& other) const { return text_ != other.text_; }
    bool operator<(const Eid& other) const { return text_ < other.text_; }

private:
    explicit Eid(std::string canonical) : text_(std::move(canonical)) {}

    static std::string normalize(const std::string& text);

    std::string text_;
};

std::ostream& operator<<(std::ostream& os, const Eid& eid);

// Well-known group endpoints.
const Eid& broadcast_address();
const Eid& broker_multicast_address();
const Eid& datastore_multicast_address();
const Eid& executor_multicast_address();
const Eid& client_multicast_address();

} // namespace dtnclient

namespace std {

template <>
struct hash<dtnclient::Eid> {
    size_t operator()(const dtnclient::Eid& eid) const noexcept {
        return hash<string>()(eid.str());
    }
};

} // namespace std
