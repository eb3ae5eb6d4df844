#include "client.hpp"

#include "framed_call.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace dtnclient {

Client::Client(ConnectionFactory factory) : factory_(std::move(factory)) {}

void Client::register_endpoint(const Eid& endpoint) const {
    register_unregister(endpoint, true);
}

void Client::unregister_endpoint(const Eid& endpoint) const {
    register_unregister(endpoint, false);
}

void Client::register_unregister(const Eid& endpoint, bool do_register) const {
    LOG4CPLUS_DEBUG(client_logger(), (do_register ? "Performing registration of " : "Performing unregistration of ")
                                         << endpoint);

    RegisterUnregister request(do_register ? MessageType::RegisterEID : MessageType::UnregisterEID, endpoint);
    call(factory_, request);

    LOG4CPLUS_DEBUG(client_logger(), (do_register ? "Successfully registered " : "Successfully unregistered ")
                                         << endpoint);
}

std::string Client::create_bundle(const Mapping& args) const {
    BundleCreate request(MessageType::BundleCreate, args);
    auto reply = expect<BundleCreateResponse>(call(factory_, request));

    LOG4CPLUS_DEBUG(client_logger(), "Created bundle " << reply.bundle_id());
    return reply.bundle_id();
}

std::vector<std::string> Client::list_bundles(const Eid& mailbox, bool new_only) const {
    ListBundles request(MessageType::ListBundles, mailbox, new_only);
    auto reply = expect<ListResponse>(call(factory_, request));

    LOG4CPLUS_DEBUG(client_logger(), "Mailbox " << mailbox << " lists " << reply.bundle_ids().size() << " bundles");
    return reply.bundle_ids();
}

BundleContent Client::fetch_bundle(const Eid& mailbox, const std::string& bundle_id, bool remove) const {
    FetchBundle request(MessageType::FetchBundle, mailbox, bundle_id, remove);
    auto reply = expect<FetchBundleResponse>(call(factory_, request));

    LOG4CPLUS_DEBUG(client_logger(), "Fetched bundle " << bundle_id << " (" << reply.content().payload.size()
                                                       << " payload bytes)");
    return reply.content();
}

std::vector<BundleContent> Client::fetch_all_bundles(const Eid& mailbox, bool new_only, bool remove) const {
    FetchAllBundles request(MessageType::FetchAllBundles, mailbox, new_only, remove);
    auto reply = expect<FetchAllBundlesResponse>(call(factory_, request));

    LOG4CPLUS_DEBUG(client_logger(), "Fetched " << reply.contents().size() << " bundles from " << mailbox);
    return reply.contents();
}

} // namespace dtnclient
