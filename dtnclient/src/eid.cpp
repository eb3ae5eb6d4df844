#include "eid.hpp"

#include "errors.hpp"

#include <charconv>
#include <cstring>

namespace dtnclient {

namespace {

constexpr const char* kDtnNone = "dtn:none";
constexpr const char* kDtnPrefix = "dtn://";
constexpr const char* kIpnPrefix = "ipn:";

bool starts_with(const std::string& text, const char* prefix) {
    return text.compare(0, std::strlen(prefix), prefix) == 0;
}

// RFC 3986 reg-name / unreserved characters, as used by RFC 9171 section 4.2.5.1.1.
bool is_node_char(char c) {
    if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
        return true;
    }
    return std::strchr("-._~!$&'()*+,;=", c) != nullptr && c != '\0';
}

bool is_valid_node(const std::string& node) {
    for (char c : node) {
        if (!is_node_char(c)) {
            return false;
        }
    }
    return true;
}

bool is_ascii(const std::string& text) {
    for (char c : text) {
        if (static_cast<unsigned char>(c) > 0x7F) {
            return false;
        }
    }
    return true;
}

struct IpnNumber {
    bool negative = false;
    std::uint64_t magnitude = 0;
};

IpnNumber parse_ipn_number(const std::string& part, const char* what) {
    IpnNumber number;
    std::size_t pos = 0;
    if (!part.empty() && (part[0] == '+' || part[0] == '-')) {
        number.negative = part[0] == '-';
        pos = 1;
    }
    const char* first = part.data() + pos;
    const char* last = part.data() + part.size();
    if (first == last) {
        throw EidError(std::string("invalid IPN numbers: empty ") + what + " number");
    }
    auto result = std::from_chars(first, last, number.magnitude, 10);
    if (result.ec == std::errc::result_out_of_range) {
        throw EidError(std::string("invalid IPN numbers: ") + what + " number '" + part + "' out of range");
    }
    if (result.ec != std::errc() || result.ptr != last) {
        throw EidError(std::string("invalid IPN numbers: invalid ") + what + " number '" + part + "'");
    }
    if (number.magnitude == 0) {
        number.negative = false;
    }
    return number;
}

std::string make_ipn_text(std::uint64_t node, std::uint64_t service) {
    return std::string(kIpnPrefix) + std::to_string(node) + "." + std::to_string(service);
}

} // namespace

Eid::Eid() : text_(kDtnNone) {}

Eid Eid::parse(const std::string& text) {
    return Eid(normalize(text));
}

Eid Eid::none() {
    return Eid();
}

Eid Eid::dtn(const std::string& node, const std::string& service) {
    if (!is_valid_node(node)) {
        throw EidError("invalid DTN node '" + node + "'");
    }
    if (!is_ascii(service)) {
        throw EidError("invalid DTN service '" + service + "'");
    }
    return Eid(normalize(kDtnPrefix + node + "/" + service));
}

Eid Eid::ipn(std::uint64_t node, std::uint64_t service) {
    if (node < 1) {
        throw EidError("IPN node must be >= 1");
    }
    return Eid(make_ipn_text(node, service));
}

Eid::Scheme Eid::scheme() const {
    if (text_ == kDtnNone) {
        return Scheme::none;
    }
    if (starts_with(text_, kDtnPrefix)) {
        return Scheme::dtn;
    }
    return Scheme::ipn;
}

std::optional<std::string> Eid::node() const {
    switch (scheme()) {
        case Scheme::none:
            return std::nullopt;
        case Scheme::dtn: {
            std::string ssp = text_.substr(std::strlen(kDtnPrefix));
            return ssp.substr(0, ssp.find('/'));
        }
        case Scheme::ipn: {
            std::string ssp = text_.substr(std::strlen(kIpnPrefix));
            return ssp.substr(0, ssp.find('.'));
        }
    }
    return std::nullopt;
}

std::optional<std::string> Eid::service() const {
    switch (scheme()) {
        case Scheme::none:
            return std::nullopt;
        case Scheme::dtn: {
            std::string ssp = text_.substr(std::strlen(kDtnPrefix));
            return ssp.substr(ssp.find('/') + 1);
        }
        case Scheme::ipn: {
            std::string ssp = text_.substr(std::strlen(kIpnPrefix));
            return ssp.substr(ssp.find('.') + 1);
        }
    }
    return std::nullopt;
}

Eid::operator bool() const {
    return text_ != kDtnNone;
}

std::string Eid::normalize(const std::string& text) {
    if (text == kDtnNone) {
        return text;
    }

    if (starts_with(text, kDtnPrefix)) {
        std::string ssp = text.substr(std::strlen(kDtnPrefix));
        if (ssp == "none") {
            throw EidError("invalid DTN host: use 'dtn:none', not 'dtn://none'");
        }
        if (ssp.empty()) {
            throw EidError("invalid DTN EID: missing node");
        }

        std::string node;
        std::string service;
        auto slash = ssp.find('/');
        if (slash == std::string::npos) {
            node = ssp;
        } else {
            node = ssp.substr(0, slash);
            service = ssp.substr(slash + 1);
        }

        if (node == "none") {
            throw EidError("invalid DTN host: use 'dtn:none', not 'dtn://none'");
        }
        if (!is_valid_node(node)) {
            throw EidError("invalid DTN node '" + node + "'");
        }
        if (!is_ascii(service)) {
            throw EidError("invalid DTN service '" + service + "'");
        }
        return kDtnPrefix + node + "/" + service;
    }

    if (starts_with(text, kIpnPrefix)) {
        std::string rest = text.substr(std::strlen(kIpnPrefix));
        if (starts_with(rest, "//")) {
            throw EidError("invalid IPN EID: must be 'ipn:N.S', not 'ipn://N.S'");
        }
        auto dot = rest.find('.');
        if (dot == std::string::npos || rest.find('.', dot + 1) != std::string::npos) {
            throw EidError("invalid IPN EID: need exactly one dot (node.service)");
        }
        IpnNumber node = parse_ipn_number(rest.substr(0, dot), "node");
        IpnNumber service = parse_ipn_number(rest.substr(dot + 1), "service");
        if (node.negative || node.magnitude < 1) {
            throw EidError("IPN node must be >= 1");
        }
        if (service.negative) {
            throw EidError("IPN service must be >= 0");
        }
        return make_ipn_text(node.magnitude, service.magnitude);
    }

    throw EidError("unknown scheme (expected 'dtn:' or 'ipn:')");
}

std::ostream& operator<<(std::ostream& os, const Eid& eid) {
    return os << eid.str();
}

const Eid& broadcast_address() {
    static const Eid eid = Eid::dtn("rec.all", "~");
    return eid;
}

const Eid& broker_multicast_address() {
    static const Eid eid = Eid::dtn("rec.broker", "~");
    return eid;
}

const Eid& datastore_multicast_address() {
    static const Eid eid = Eid::dtn("rec.store", "~");
    return eid;
}

const Eid& executor_multicast_address() {
    static const Eid eid = Eid::dtn("rec.executor", "~");
    return eid;
}

const Eid& client_multicast_address() {
    static const Eid eid = Eid::dtn("rec.client", "~");
    return eid;
}

} // namespace dtnclient
