#pragma once

#include "connection.hpp"
#include "eid.hpp"
#include "message.hpp"

#include <string>
#include <vector>

namespace dtnclient {

/**
 * Typed operations against the daemon's application agent.
 *
 * Every operation opens its own connection and propagates
 * ConnectionNotFoundError, TransportError, DataError,
 * InvalidMessageError and DaemonError unchanged.
 */
class Client {
public:
    explicit Client(ConnectionFactory factory);

    void register_endpoint(const Eid& endpoint) const;
    void unregister_endpoint(const Eid& endpoint) const;

    /**
     * Builds and injects a bundle.
     *
     * @param args Bundle builder arguments (destination, source, lifetime, payload_block, ...)
     * @return ID of the new bundle
     */
    std::string create_bundle(const Mapping& args) const;

    /// IDs of the bundles stored for mailbox; new_only skips bundles fetched before.
    std::vector<std::string> list_bundles(const Eid& mailbox, bool new_only = false) const;

    BundleContent fetch_bundle(const Eid& mailbox, const std::string& bundle_id, bool remove = false) const;

    std::vector<BundleContent> fetch_all_bundles(const Eid& mailbox, bool new_only = false, bool remove = false) const;

private:
    void register_unregister(const Eid& endpoint, bool do_register) const;

    ConnectionFactory factory_;
};

} // namespace dtnclient
