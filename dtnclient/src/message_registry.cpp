#include "message_registry.hpp"

namespace dtnclient {

namespace {

template <typename T>
Message decode_as(const Mapping& mapping) {
    return T::from_mapping(mapping);
}

} // namespace

void MessageRegistry::add(MessageType type, MessageDecoder decoder) {
    if (!decoder) {
        return;
    }
    decoders_[type] = decoder;
}

MessageDecoder MessageRegistry::find(MessageType type) const {
    auto it = decoders_.find(type);
    if (it == decoders_.end()) {
        return nullptr;
    }
    return it->second;
}

const MessageRegistry& default_registry() {
    static const MessageRegistry registry = [] {
        MessageRegistry reg;
        reg.add(MessageType::Response, &decode_as<Response>);
        reg.add(MessageType::RegisterEID, &decode_as<RegisterUnregister>);
        reg.add(MessageType::UnregisterEID, &decode_as<RegisterUnregister>);
        reg.add(MessageType::BundleCreate, &decode_as<BundleCreate>);
        reg.add(MessageType::BundleCreateResponse, &decode_as<BundleCreateResponse>);
        reg.add(MessageType::ListBundles, &decode_as<ListBundles>);
        reg.add(MessageType::ListResponse, &decode_as<ListResponse>);
        reg.add(MessageType::FetchBundle, &decode_as<FetchBundle>);
        reg.add(MessageType::FetchBundleResponse, &decode_as<FetchBundleResponse>);
        reg.add(MessageType::FetchAllBundles, &decode_as<FetchAllBundles>);
        reg.add(MessageType::FetchAllBundlesResponse, &decode_as<FetchAllBundlesResponse>);
        return reg;
    }();

    return registry;
}

} // namespace dtnclient
