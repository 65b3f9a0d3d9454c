#ifndef BLOBSTORE_NETWORK_SESSION_HPP
#define BLOBSTORE_NETWORK_SESSION_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include "network/message_frame.hpp"

namespace blobstore {
namespace network {

// Connection to the chunk network. Implementations must be safe for
// concurrent use: one session is shared by every in-flight chunk operation.
class Session {
public:
  virtual ~Session() = default;

  // Sends a query and returns the response matched to it. The response kind
  // is whatever the network answered; callers check it.
  virtual MessageFrame send_query(const MessageFrame& query) = 0;
  // Sends a command, throws CmdError when the network rejects it
  virtual void send_cmd(const MessageFrame& cmd) = 0;

protected:
  uint64_t next_operation_id() { return ++operation_counter_; }

private:
  std::atomic<uint64_t> operation_counter_{0};
};

using SessionPtr = std::shared_ptr<Session>;

} // namespace network
} // namespace blobstore

#endif // BLOBSTORE_NETWORK_SESSION_HPP
