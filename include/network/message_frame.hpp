#ifndef BLOBSTORE_NETWORK_MESSAGE_FRAME_HPP
#define BLOBSTORE_NETWORK_MESSAGE_FRAME_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include "network/network_error.hpp"
#include "types/chunk.hpp"

namespace blobstore {
namespace network {

// Message type used to differentiate between requests
enum class MessageType : uint8_t {
    STORE_CHUNK = 0,
    GET_CHUNK = 1
};

inline const char* message_type_to_string(MessageType type) {
    switch (type) {
        case MessageType::STORE_CHUNK: return "STORE_CHUNK";
        case MessageType::GET_CHUNK: return "GET_CHUNK";
        default: return "UNKNOWN";
    }
}

// A query, command or response exchanged with the network.
// Queries carry `address`; store commands and successful responses carry `chunk`;
// failed responses carry `error`.
struct MessageFrame {
    MessageType message_type{MessageType::GET_CHUNK};
    uint64_t operation_id{0};
    types::ContentHash address{};
    std::shared_ptr<const types::Chunk> chunk;
    NetworkError error{NetworkError::SUCCESS};

    static MessageFrame get_chunk(const types::ContentHash& address) {
        MessageFrame frame;
        frame.message_type = MessageType::GET_CHUNK;
        frame.address = address;
        return frame;
    }

    static MessageFrame store_chunk(types::Chunk chunk) {
        MessageFrame frame;
        frame.message_type = MessageType::STORE_CHUNK;
        frame.address = chunk.address();
        frame.chunk = std::make_shared<const types::Chunk>(std::move(chunk));
        return frame;
    }
};

} // namespace network
} // namespace blobstore

#endif // BLOBSTORE_NETWORK_MESSAGE_FRAME_HPP
