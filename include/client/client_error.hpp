#ifndef BLOBSTORE_CLIENT_ERROR_HPP
#define BLOBSTORE_CLIENT_ERROR_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace blobstore::client {

class ClientError : public std::runtime_error {
public:
  explicit ClientError(const std::string& message)
    : std::runtime_error(message) {}
};

// A read could not retrieve every chunk it set out to retrieve
class NotEnoughChunks : public ClientError {
public:
  NotEnoughChunks(size_t expected, size_t actual)
    : ClientError("Not enough chunks retrieved: expected " + std::to_string(expected) +
                  ", got " + std::to_string(actual))
    , expected_(expected)
    , actual_(actual) {}

  size_t expected() const { return expected_; }
  size_t actual() const { return actual_; }

private:
  size_t expected_;
  size_t actual_;
};

// Malformed head-chunk or indirection payload
class SerializationError : public ClientError {
public:
  explicit SerializationError(const std::string& message)
    : ClientError("Serialization error: " + message) {}
};

// A network response did not match the kind of the query that was sent
class UnexpectedResponseKind : public ClientError {
public:
  explicit UnexpectedResponseKind(const std::string& message)
    : ClientError("Unexpected response kind: " + message) {}
};

class IndirectionTooDeep : public ClientError {
public:
  explicit IndirectionTooDeep(size_t limit)
    : ClientError("Head chunk indirection exceeds the limit of " + std::to_string(limit) + " levels")
    , limit_(limit) {}

  size_t limit() const { return limit_; }

private:
  size_t limit_;
};

// Ranged read past the end of the blob
class RangeError : public ClientError {
public:
  RangeError(uint64_t position, uint64_t length, uint64_t file_size)
    : ClientError("Range error: " + std::to_string(length) + " bytes at position " + std::to_string(position) +
                  " exceed blob size " + std::to_string(file_size)) {}
};

} // namespace blobstore::client

#endif // BLOBSTORE_CLIENT_ERROR_HPP
