#include "network/store_session.hpp"
#include <boost/log/trivial.hpp>

namespace blobstore {
namespace network {

StoreSession::StoreSession(const std::filesystem::path& store_path)
  : store_(std::make_unique<store::Store>(store_path)) {
  BOOST_LOG_TRIVIAL(info) << "Store session: Serving chunks from: " << store_path.string();
}

MessageFrame StoreSession::send_query(const MessageFrame& query) {
  MessageFrame response;
  response.message_type = query.message_type;
  response.operation_id = next_operation_id();
  response.address = query.address;

  if (query.message_type != MessageType::GET_CHUNK) {
    BOOST_LOG_TRIVIAL(warning) << "Store session: Unsupported query type: "
                               << message_type_to_string(query.message_type);
    response.error = NetworkError::UNKNOWN_ERROR;
    return response;
  }

  try {
    if (!store_->has(query.address)) {
      response.error = NetworkError::NOT_FOUND;
      return response;
    }
    response.chunk = std::make_shared<const types::Chunk>(store_->get(query.address));
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Store session: Failed to read chunk " << types::to_hex(query.address) << ": " << e.what();
    response.error = NetworkError::TRANSFER_FAILED;
  }
  return response;
}

void StoreSession::send_cmd(const MessageFrame& cmd) {
  if (cmd.message_type != MessageType::STORE_CHUNK || !cmd.chunk) {
    BOOST_LOG_TRIVIAL(error) << "Store session: Invalid command: " << message_type_to_string(cmd.message_type);
    throw CmdError(NetworkError::UNKNOWN_ERROR, "Invalid store command");
  }

  try {
    store_->store(cmd.chunk->address(), cmd.chunk->value());
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Store session: Failed to store chunk " << types::to_hex(cmd.chunk->address()) << ": " << e.what();
    throw CmdError(NetworkError::STORAGE_FAILED, e.what());
  }
}

} // namespace network
} // namespace blobstore
