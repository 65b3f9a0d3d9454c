#ifndef BLOBSTORE_NETWORK_ERROR_HPP
#define BLOBSTORE_NETWORK_ERROR_HPP

#include <stdexcept>
#include <string>

namespace blobstore {
namespace network {

enum class NetworkError {
    SUCCESS = 0,
    NOT_FOUND,
    TIMEOUT,
    CONNECTION_LOST,
    TRANSFER_FAILED,
    STORAGE_FAILED,
    UNKNOWN_ERROR
};

inline const char* network_error_to_string(NetworkError error) {
    switch (error) {
        case NetworkError::SUCCESS: return "Success";
        case NetworkError::NOT_FOUND: return "Not found";
        case NetworkError::TIMEOUT: return "Timeout";
        case NetworkError::CONNECTION_LOST: return "Connection lost";
        case NetworkError::TRANSFER_FAILED: return "Transfer failed";
        case NetworkError::STORAGE_FAILED: return "Storage failed";
        case NetworkError::UNKNOWN_ERROR: return "Unknown error";
        default: return "Undefined error";
    }
}

// Failure of a GET_CHUNK query
class QueryError : public std::runtime_error {
public:
    QueryError(NetworkError kind, const std::string& message)
        : std::runtime_error(std::string("Query error (") + network_error_to_string(kind) + "): " + message)
        , kind_(kind) {}

    NetworkError kind() const { return kind_; }

private:
    NetworkError kind_;
};

// Failure of a STORE_CHUNK command
class CmdError : public std::runtime_error {
public:
    CmdError(NetworkError kind, const std::string& message)
        : std::runtime_error(std::string("Command error (") + network_error_to_string(kind) + "): " + message)
        , kind_(kind) {}

    NetworkError kind() const { return kind_; }

private:
    NetworkError kind_;
};

} // namespace network
} // namespace blobstore

#endif // BLOBSTORE_NETWORK_ERROR_HPP
