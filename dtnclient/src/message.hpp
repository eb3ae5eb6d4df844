#pragma once

#include "eid.hpp"
#include "value.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace dtnclient {

/// Wire discriminant carried in the `Type` field of every message.
enum class MessageType : std::uint8_t {
    Response = 1,
    RegisterEID = 2,
    UnregisterEID = 3,
    BundleCreate = 4,
    BundleCreateResponse = 5,
    ListBundles = 6,
    ListResponse = 7,
    FetchBundle = 8,
    FetchBundleResponse = 9,
    FetchAllBundles = 10,
    FetchAllBundlesResponse = 11,
};

std::string message_type_name(MessageType type);
std::optional<MessageType> message_type_from_id(std::uint64_t id);

// Wire field names.
namespace field {
constexpr const char* kType = "Type";
constexpr const char* kError = "Error";
constexpr const char* kEndpointId = "EndpointID";
constexpr const char* kArgs = "Args";
constexpr const char* kBundleId = "BundleID";
constexpr const char* kMailbox = "Mailbox";
constexpr const char* kNew = "New";
constexpr const char* kRemove = "Remove";
constexpr const char* kBundles = "Bundles";
constexpr const char* kBundleContent = "BundleContent";
constexpr const char* kSourceId = "SourceID";
constexpr const char* kDestinationId = "DestinationID";
constexpr const char* kPayload = "Payload";
} // namespace field

/**
 * One bundle as delivered by the daemon.
 *
 * to_mapping() omits empty fields; from_mapping() restores the defaults
 * (empty id, `dtn:none` endpoints, empty payload).
 */
struct BundleContent {
    std::string bundle_id;
    Eid source;
    Eid destination;
    Bytes payload;

    Mapping to_mapping() const;
    static BundleContent from_mapping(const Mapping& mapping);

    bool operator==(const BundleContent& other) const;
    bool operator!=(const BundleContent& other) const { return !(*this == other); }
};

/// Generic daemon reply; an empty error means success.
class Response {
public:
    static constexpr const char* kName = "Response";
    static constexpr bool kIsResponse = true;

    explicit Response(MessageType type, std::string error = "");

    MessageType type() const { return type_; }
    const std::string& error() const { return error_; }

    Mapping to_mapping() const;
    static Response from_mapping(const Mapping& mapping);

    bool operator==(const Response& other) const;

private:
    MessageType type_;
    std::string error_;
};

/// Adds (RegisterEID) or removes (UnregisterEID) a local registration.
class RegisterUnregister {
public:
    static constexpr const char* kName = "RegisterUnregister";
    static constexpr bool kIsResponse = false;

    RegisterUnregister(MessageType type, Eid endpoint);

    MessageType type() const { return type_; }
    const Eid& endpoint() const { return endpoint_; }
    bool is_register() const { return type_ == MessageType::RegisterEID; }

    Mapping to_mapping() const;
    static RegisterUnregister from_mapping(const Mapping& mapping);

    bool operator==(const RegisterUnregister& other) const;

private:
    MessageType type_;
    Eid endpoint_;
};

/// Asks the daemon to build and inject a bundle from a set of named arguments.
class BundleCreate {
public:
    static constexpr const char* kName = "BundleCreate";
    static constexpr bool kIsResponse = false;

    BundleCreate(MessageType type, Mapping args);

    MessageType type() const { return type_; }
    const Mapping& args() const { return args_; }

    Mapping to_mapping() const;
    static BundleCreate from_mapping(const Mapping& mapping);

    bool operator==(const BundleCreate& other) const;

private:
    MessageType type_;
    Mapping args_;
};

class BundleCreateResponse {
public:
    static constexpr const char* kName = "BundleCreateResponse";
    static constexpr bool kIsResponse = true;

    BundleCreateResponse(MessageType type, std::string error, std::string bundle_id);

    MessageType type() const { return type_; }
    const std::string& error() const { return error_; }
    const std::string& bundle_id() const { return bundle_id_; }

    Mapping to_mapping() const;
    static BundleCreateResponse from_mapping(const Mapping& mapping);

    bool operator==(const BundleCreateResponse& other) const;

private:
    MessageType type_;
    std::string error_;
    std::string bundle_id_;
};

class ListBundles {
public:
    static constexpr const char* kName = "ListBundles";
    static constexpr bool kIsResponse = false;

    ListBundles(MessageType type, Eid mailbox, bool new_only);

    MessageType type() const { return type_; }
    const Eid& mailbox() const { return mailbox_; }
    bool new_only() const { return new_only_; }

    Mapping to_mapping() const;
    static ListBundles from_mapping(const Mapping& mapping);

    bool operator==(const ListBundles& other) const;

private:
    MessageType type_;
    Eid mailbox_;
    bool new_only_;
};

class ListResponse {
public:
    static constexpr const char* kName = "ListResponse";
    static constexpr bool kIsResponse = true;

    ListResponse(MessageType type, std::string error, std::vector<std::string> bundle_ids);

    MessageType type() const { return type_; }
    const std::string& error() const { return error_; }
    const std::vector<std::string>& bundle_ids() const { return bundle_ids_; }

    Mapping to_mapping() const;
    static ListResponse from_mapping(const Mapping& mapping);

    bool operator==(const ListResponse& other) const;

private:
    MessageType type_;
    std::string error_;
    std::vector<std::string> bundle_ids_;
};

class FetchBundle {
public:
    static constexpr const char* kName = "FetchBundle";
    static constexpr bool kIsResponse = false;

    FetchBundle(MessageType type, Eid mailbox, std::string bundle_id, bool remove);

    MessageType type() const { return type_; }
    const Eid& mailbox() const { return mailbox_; }
    const std::string& bundle_id() const { return bundle_id_; }
    bool remove() const { return remove_; }

    Mapping to_mapping() const;
    static FetchBundle from_mapping(const Mapping& mapping);

    bool operator==(const FetchBundle& other) const;

private:
    MessageType type_;
    Eid mailbox_;
    std::string bundle_id_;
    bool remove_;
};

class FetchBundleResponse {
public:
    static constexpr const char* kName = "FetchBundleResponse";
    static constexpr bool kIsResponse = true;

    FetchBundleResponse(MessageType type, std::string error, BundleContent content);

    MessageType type() const { return type_; }
    const std::string& error() const { return error_; }
    const BundleContent& content() const { return content_; }

    Mapping to_mapping() const;
    static FetchBundleResponse from_mapping(const Mapping& mapping);

    bool operator==(const FetchBundleResponse& other) const;

private:
    MessageType type_;
    std::string error_;
    BundleContent content_;
};

class FetchAllBundles {
public:
    static constexpr const char* kName = "FetchAllBundles";
    static constexpr bool kIsResponse = false;

    FetchAllBundles(MessageType type, Eid mailbox, bool new_only, bool remove);

    MessageType type() const { return type_; }
    const Eid& mailbox() const { return mailbox_; }
    bool new_only() const { return new_only_; }
    bool remove() const { return remove_; }

    Mapping to_mapping() const;
    static FetchAllBundles from_mapping(const Mapping& mapping);

    bool operator==(const FetchAllBundles& other) const;

private:
    MessageType type_;
    Eid mailbox_;
    bool new_only_;
    bool remove_;
};

class FetchAllBundlesResponse {
public:
    static constexpr const char* kName = "FetchAllBundlesResponse";
    static constexpr bool kIsResponse = true;

    FetchAllBundlesResponse(MessageType type, std::string error, std::vector<BundleContent> contents);

    MessageType type() const { return type_; }
    const std::string& error() const { return error_; }
    const std::vector<BundleContent>& contents() const { return contents_; }

    Mapping to_mapping() const;
    static FetchAllBundlesResponse from_mapping(const Mapping& mapping);

    bool operator==(const FetchAllBundlesResponse& other) const;

private:
    MessageType type_;
    std::string error_;
    std::vector<BundleContent> contents_;
};

using Message = std::variant<
    Response,
    RegisterUnregister,
    BundleCreate,
    BundleCreateResponse,
    ListBundles,
    ListResponse,
    FetchBundle,
    FetchBundleResponse,
    FetchAllBundles,
    FetchAllBundlesResponse>;

MessageType message_type(const Message& message);

/// True for the reply family (Response and every *Response variant).
bool is_response(const Message& message);

/// The reply's error text, or nullptr for request variants.
const std::string* response_error(const Message& message);

Mapping to_mapping(const Message& message);

} // namespace dtnclient
