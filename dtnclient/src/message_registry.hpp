#pragma once

#include "message.hpp"

#include <unordered_map>

namespace dtnclient {

using MessageDecoder = Message (*)(const Mapping& mapping);

/// Discriminant -> decode function table used by the codec.
class MessageRegistry {
public:
    void add(MessageType type, MessageDecoder decoder);
    MessageDecoder find(MessageType type) const;

private:
    std::unordered_map<MessageType, MessageDecoder> decoders_;
};

/// Registry holding a decoder for every MessageType.
const MessageRegistry& default_registry();

} // namespace dtnclient
