#include "message.hpp"

#include "errors.hpp"

#include <type_traits>

namespace dtnclient {

namespace {

std::string describe_type(MessageType type) {
    return message_type_name(type) + " (" + std::to_string(static_cast<int>(type)) + ")";
}

void require_type(MessageType actual, MessageType expected) {
    if (actual != expected) {
        throw InvalidMessageError("Message needs MessageType " + describe_type(expected) + ", but has " +
                                  describe_type(actual));
    }
}

Mapping base_fields(MessageType type) {
    Mapping mapping;
    mapping.emplace_back(field::kType, static_cast<std::uint64_t>(type));
    return mapping;
}

Mapping response_fields(MessageType type, const std::string& error) {
    Mapping mapping = base_fields(type);
    set(mapping, field::kError, error);
    return mapping;
}

const Value& require_field(const Mapping& mapping, const char* key) {
    const Value* value = find(mapping, key);
    if (!value) {
        throw InvalidMessageError(std::string("Message missing '") + key + "' field");
    }
    return *value;
}

[[noreturn]] void wrong_kind(const char* key, const char* expected, const Value& value) {
    throw InvalidMessageError(std::string("Field '") + key + "' must be " + expected + ", got " +
                              kind_name(value.kind()));
}

MessageType read_type(const Mapping& mapping) {
    const Value& value = require_field(mapping, field::kType);
    if (value.kind() == Value::Kind::unsigned_integer) {
        if (auto type = message_type_from_id(value.as_uint64())) {
            return *type;
        }
    }
    throw InvalidMessageError("Unknown MessageType ID in '" + std::string(field::kType) + "' field");
}

std::string read_string(const Mapping& mapping, const char* key) {
    const Value& value = require_field(mapping, key);
    if (!value.is_string()) {
        wrong_kind(key, "a string", value);
    }
    return value.as_string();
}

std::string read_string_or(const Mapping& mapping, const char* key, const std::string& fallback) {
    if (!find(mapping, key)) {
        return fallback;
    }
    return read_string(mapping, key);
}

bool read_bool(const Mapping& mapping, const char* key) {
    const Value& value = require_field(mapping, key);
    if (!value.is_bool()) {
        wrong_kind(key, "a bool", value);
    }
    return value.as_bool();
}

Eid to_eid(const char* key, const std::string& text) {
    try {
        return Eid::parse(text);
    } catch (const EidError& exc) {
        throw InvalidMessageError(std::string("Field '") + key + "' holds an invalid EID: " + exc.what());
    }
}

Eid read_eid(const Mapping& mapping, const char* key) {
    return to_eid(key, read_string(mapping, key));
}

// Go daemons encode an empty slice as nil.
const Array& read_array(const Mapping& mapping, const char* key) {
    static const Array kEmpty;
    const Value& value = require_field(mapping, key);
    if (value.is_nil()) {
        return kEmpty;
    }
    if (!value.is_array()) {
        wrong_kind(key, "an array", value);
    }
    return value.as_array();
}

const Mapping& read_mapping(const Mapping& mapping, const char* key) {
    static const Mapping kEmpty;
    const Value& value = require_field(mapping, key);
    if (value.is_nil()) {
        return kEmpty;
    }
    if (!value.is_mapping()) {
        wrong_kind(key, "a map", value);
    }
    return value.as_mapping();
}

void require_endpoint(const Eid& eid, const char* name) {
    if (!eid) {
        throw InvalidMessageError(std::string(name) + " must not be none/empty");
    }
}

} // namespace

std::string message_type_name(MessageType type) {
    switch (type) {
        case MessageType::Response:
            return "Response";
        case MessageType::RegisterEID:
            return "RegisterEID";
        case MessageType::UnregisterEID:
            return "UnregisterEID";
        case MessageType::BundleCreate:
            return "BundleCreate";
        case MessageType::BundleCreateResponse:
            return "BundleCreateResponse";
        case MessageType::ListBundles:
            return "ListBundles";
        case MessageType::ListResponse:
            return "ListResponse";
        case MessageType::FetchBundle:
            return "FetchBundle";
        case MessageType::FetchBundleResponse:
            return "FetchBundleResponse";
        case MessageType::FetchAllBundles:
            return "FetchAllBundles";
        case MessageType::FetchAllBundlesResponse:
            return "FetchAllBundlesResponse";
    }
    return "MessageType(" + std::to_string(static_cast<int>(type)) + ")";
}

std::optional<MessageType> message_type_from_id(std::uint64_t id) {
    if (id < static_cast<std::uint64_t>(MessageType::Response) ||
        id > static_cast<std::uint64_t>(MessageType::FetchAllBundlesResponse)) {
        return std::nullopt;
    }
    return static_cast<MessageType>(id);
}

// BundleContent

Mapping BundleContent::to_mapping() const {
    Mapping mapping;
    if (!bundle_id.empty()) {
        mapping.emplace_back(field::kBundleId, bundle_id);
    }
    if (source) {
        mapping.emplace_back(field::kSourceId, source.str());
    }
    if (destination) {
        mapping.emplace_back(field::kDestinationId, destination.str());
    }
    if (!payload.empty()) {
        mapping.emplace_back(field::kPayload, payload);
    }
    return mapping;
}

BundleContent BundleContent::from_mapping(const Mapping& mapping) {
    BundleContent content;
    content.bundle_id = read_string_or(mapping, field::kBundleId, "");
    // An empty endpoint string stands for an omitted one.
    std::string source = read_string_or(mapping, field::kSourceId, "");
    if (!source.empty()) {
        content.source = to_eid(field::kSourceId, source);
    }
    std::string destination = read_string_or(mapping, field::kDestinationId, "");
    if (!destination.empty()) {
        content.destination = to_eid(field::kDestinationId, destination);
    }
    if (const Value* payload = find(mapping, field::kPayload)) {
        if (payload->is_bytes()) {
            content.payload = payload->as_bytes();
        } else if (payload->is_string()) {
            // Some encoders emit raw payloads as str; keep the bytes unchanged.
            const std::string& text = payload->as_string();
            content.payload.assign(text.begin(), text.end());
        } else if (!payload->is_nil()) {
            wrong_kind(field::kPayload, "bytes", *payload);
        }
    }
    return content;
}

bool BundleContent::operator==(const BundleContent& other) const {
    return bundle_id == other.bundle_id && source == other.source && destination == other.destination &&
           payload == other.payload;
}

// Response

Response::Response(MessageType type, std::string error) : type_(type), error_(std::move(error)) {
    require_type(type_, MessageType::Response);
}

Mapping Response::to_mapping() const {
    return response_fields(type_, error_);
}

Response Response::from_mapping(const Mapping& mapping) {
    return Response(read_type(mapping), read_string_or(mapping, field::kError, ""));
}

bool Response::operator==(const Response& other) const {
    return type_ == other.type_ && error_ == other.error_;
}

// RegisterUnregister

RegisterUnregister::RegisterUnregister(MessageType type, Eid endpoint) : type_(type), endpoint_(std::move(endpoint)) {
    if (type_ != MessageType::RegisterEID && type_ != MessageType::UnregisterEID) {
        throw InvalidMessageError("Message needs MessageType " + describe_type(MessageType::RegisterEID) + " or " +
                                  describe_type(MessageType::UnregisterEID) + ", but has " + describe_type(type_));
    }
    require_endpoint(endpoint_, field::kEndpointId);
}

Mapping RegisterUnregister::to_mapping() const {
    Mapping mapping = base_fields(type_);
    set(mapping, field::kEndpointId, endpoint_.str());
    return mapping;
}

RegisterUnregister RegisterUnregister::from_mapping(const Mapping& mapping) {
    return RegisterUnregister(read_type(mapping), read_eid(mapping, field::kEndpointId));
}

bool RegisterUnregister::operator==(const RegisterUnregister& other) const {
    return type_ == other.type_ && endpoint_ == other.endpoint_;
}

// BundleCreate

BundleCreate::BundleCreate(MessageType type, Mapping args) : type_(type), args_(std::move(args)) {
    require_type(type_, MessageType::BundleCreate);
    if (args_.empty()) {
        throw InvalidMessageError("Args must not be empty");
    }
}

Mapping BundleCreate::to_mapping() const {
    Mapping mapping = base_fields(type_);
    set(mapping, field::kArgs, args_);
    return mapping;
}

BundleCreate BundleCreate::from_mapping(const Mapping& mapping) {
    return BundleCreate(read_type(mapping), read_mapping(mapping, field::kArgs));
}

bool BundleCreate::operator==(const BundleCreate& other) const {
    return type_ == other.type_ && args_ == other.args_;
}

// BundleCreateResponse

BundleCreateResponse::BundleCreateResponse(MessageType type, std::string error, std::string bundle_id)
    : type_(type), error_(std::move(error)), bundle_id_(std::move(bundle_id)) {
    require_type(type_, MessageType::BundleCreateResponse);
    if (bundle_id_.empty()) {
        throw InvalidMessageError("BundleID must not be empty");
    }
}

Mapping BundleCreateResponse::to_mapping() const {
    Mapping mapping = response_fields(type_, error_);
    set(mapping, field::kBundleId, bundle_id_);
    return mapping;
}

BundleCreateResponse BundleCreateResponse::from_mapping(const Mapping& mapping) {
    return BundleCreateResponse(read_type(mapping), read_string_or(mapping, field::kError, ""),
                                read_string(mapping, field::kBundleId));
}

bool BundleCreateResponse::operator==(const BundleCreateResponse& other) const {
    return type_ == other.type_ && error_ == other.error_ && bundle_id_ == other.bundle_id_;
}

// ListBundles

ListBundles::ListBundles(MessageType type, Eid mailbox, bool new_only)
    : type_(type), mailbox_(std::move(mailbox)), new_only_(new_only) {
    require_type(type_, MessageType::ListBundles);
    require_endpoint(mailbox_, field::kMailbox);
}

Mapping ListBundles::to_mapping() const {
    Mapping mapping = base_fields(type_);
    set(mapping, field::kMailbox, mailbox_.str());
    set(mapping, field::kNew, new_only_);
    return mapping;
}

ListBundles ListBundles::from_mapping(const Mapping& mapping) {
    return ListBundles(read_type(mapping), read_eid(mapping, field::kMailbox), read_bool(mapping, field::kNew));
}

bool ListBundles::operator==(const ListBundles& other) const {
    return type_ == other.type_ && mailbox_ == other.mailbox_ && new_only_ == other.new_only_;
}

// ListResponse

ListResponse::ListResponse(MessageType type, std::string error, std::vector<std::string> bundle_ids)
    : type_(type), error_(std::move(error)), bundle_ids_(std::move(bundle_ids)) {
    require_type(type_, MessageType::ListResponse);
}

Mapping ListResponse::to_mapping() const {
    Mapping mapping = response_fields(type_, error_);
    Array ids;
    ids.reserve(bundle_ids_.size());
    for (const auto& id : bundle_ids_) {
        ids.emplace_back(id);
    }
    set(mapping, field::kBundles, std::move(ids));
    return mapping;
}

ListResponse ListResponse::from_mapping(const Mapping& mapping) {
    std::vector<std::string> ids;
    for (const auto& entry : read_array(mapping, field::kBundles)) {
        if (!entry.is_string()) {
            wrong_kind(field::kBundles, "an array of strings", entry);
        }
        ids.push_back(entry.as_string());
    }
    return ListResponse(read_type(mapping), read_string_or(mapping, field::kError, ""), std::move(ids));
}

bool ListResponse::operator==(const ListResponse& other) const {
    return type_ == other.type_ && error_ == other.error_ && bundle_ids_ == other.bundle_ids_;
}

// FetchBundle

FetchBundle::FetchBundle(MessageType type, Eid mailbox, std::string bundle_id, bool remove)
    : type_(type), mailbox_(std::move(mailbox)), bundle_id_(std::move(bundle_id)), remove_(remove) {
    require_type(type_, MessageType::FetchBundle);
    require_endpoint(mailbox_, field::kMailbox);
    if (bundle_id_.empty()) {
        throw InvalidMessageError("BundleID must not be empty");
    }
}

Mapping FetchBundle::to_mapping() const {
    Mapping mapping = base_fields(type_);
    set(mapping, field::kMailbox, mailbox_.str());
    set(mapping, field::kBundleId, bundle_id_);
    set(mapping, field::kRemove, remove_);
    return mapping;
}

FetchBundle FetchBundle::from_mapping(const Mapping& mapping) {
    return FetchBundle(read_type(mapping), read_eid(mapping, field::kMailbox), read_string(mapping, field::kBundleId),
                       read_bool(mapping, field::kRemove));
}

bool FetchBundle::operator==(const FetchBundle& other) const {
    return type_ == other.type_ && mailbox_ == other.mailbox_ && bundle_id_ == other.bundle_id_ &&
           remove_ == other.remove_;
}

// FetchBundleResponse

FetchBundleResponse::FetchBundleResponse(MessageType type, std::string error, BundleContent content)
    : type_(type), error_(std::move(error)), content_(std::move(content)) {
    require_type(type_, MessageType::FetchBundleResponse);
}

Mapping FetchBundleResponse::to_mapping() const {
    Mapping mapping = response_fields(type_, error_);
    set(mapping, field::kBundleContent, content_.to_mapping());
    return mapping;
}

FetchBundleResponse FetchBundleResponse::from_mapping(const Mapping& mapping) {
    BundleContent content;
    if (find(mapping, field::kBundleContent)) {
        content = BundleContent::from_mapping(read_mapping(mapping, field::kBundleContent));
    }
    return FetchBundleResponse(read_type(mapping), read_string_or(mapping, field::kError, ""), std::move(content));
}

bool FetchBundleResponse::operator==(const FetchBundleResponse& other) const {
    return type_ == other.type_ && error_ == other.error_ && content_ == other.content_;
}

// FetchAllBundles

FetchAllBundles::FetchAllBundles(MessageType type, Eid mailbox, bool new_only, bool remove)
    : type_(type), mailbox_(std::move(mailbox)), new_only_(new_only), remove_(remove) {
    require_type(type_, MessageType::FetchAllBundles);
    require_endpoint(mailbox_, field::kMailbox);
}

Mapping FetchAllBundles::to_mapping() const {
    Mapping mapping = base_fields(type_);
    set(mapping, field::kMailbox, mailbox_.str());
    set(mapping, field::kNew, new_only_);
    set(mapping, field::kRemove, remove_);
    return mapping;
}

FetchAllBundles FetchAllBundles::from_mapping(const Mapping& mapping) {
    return FetchAllBundles(read_type(mapping), read_eid(mapping, field::kMailbox), read_bool(mapping, field::kNew),
                           read_bool(mapping, field::kRemove));
}

bool FetchAllBundles::operator==(const FetchAllBundles& other) const {
    return type_ == other.type_ && mailbox_ == other.mailbox_ && new_only_ == other.new_only_ &&
           remove_ == other.remove_;
}

// FetchAllBundlesResponse

FetchAllBundlesResponse::FetchAllBundlesResponse(MessageType type, std::string error,
                                                 std::vector<BundleContent> contents)
    : type_(type), error_(std::move(error)), contents_(std::move(contents)) {
    require_type(type_, MessageType::FetchAllBundlesResponse);
}

Mapping FetchAllBundlesResponse::to_mapping() const {
    Mapping mapping = response_fields(type_, error_);
    Array bundles;
    bundles.reserve(contents_.size());
    for (const auto& content : contents_) {
        bundles.emplace_back(content.to_mapping());
    }
    set(mapping, field::kBundles, std::move(bundles));
    return mapping;
}

FetchAllBundlesResponse FetchAllBundlesResponse::from_mapping(const Mapping& mapping) {
    std::vector<BundleContent> contents;
    for (const auto& entry : read_array(mapping, field::kBundles)) {
        if (!entry.is_mapping()) {
            wrong_kind(field::kBundles, "an array of maps", entry);
        }
        contents.push_back(BundleContent::from_mapping(entry.as_mapping()));
    }
    return FetchAllBundlesResponse(read_type(mapping), read_string_or(mapping, field::kError, ""),
                                   std::move(contents));
}

bool FetchAllBundlesResponse::operator==(const FetchAllBundlesResponse& other) const {
    return type_ == other.type_ && error_ == other.error_ && contents_ == other.contents_;
}

// Message

MessageType message_type(const Message& message) {
    return std::visit([](const auto& m) { return m.type(); }, message);
}

bool is_response(const Message& message) {
    return std::visit([](const auto& m) { return std::decay_t<decltype(m)>::kIsResponse; }, message);
}

const std::string* response_error(const Message& message) {
    return std::visit(
        [](const auto& m) -> const std::string* {
            if constexpr (std::decay_t<decltype(m)>::kIsResponse) {
                return &m.error();
            } else {
                return nullptr;
            }
        },
        message);
}

Mapping to_mapping(const Message& message) {
    return std::visit([](const auto& m) { return m.to_mapping(); }, message);
}

} // namespace dtnclient
