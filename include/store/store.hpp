#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <string>
#include "types/content_hash.hpp"

namespace blobstore {
namespace store {

// On-disk content-addressed chunk store
class Store {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Store(const std::filesystem::path& base_path);


  // ---- CORE STORAGE OPERATIONS ----
  // Stores bytes under their address, a no-op when already present
  void store(const types::ContentHash& address, const types::Bytes& data);
  // Retrieves bytes stored under the address, throws StoreError if missing
  types::Bytes get(const types::ContentHash& address) const;
  // Removes data associated with given address
  void remove(const types::ContentHash& address);
  // Removes all stored data and reset store
  void clear();


  // ---- QUERY OPERATIONS ----
  bool has(const types::ContentHash& address) const;
  // Returns the size of the stored chunk in bytes
  std::uintmax_t get_file_size(const types::ContentHash& address) const;
  // Number of chunks currently held
  std::size_t count() const;
  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  // Root path for all stored chunks
  std::filesystem::path base_path_;
  // Serialises writes and directory cleanup
  mutable std::mutex mutex_;
  uint64_t temp_counter_{0};


  // ---- CAS STORAGE SUPPORT ----
  // Creates a directory structure using parts of the hash:
  // {base_path}/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{remaining_hash}
  std::filesystem::path get_path_for_hash(const types::ContentHash& address) const;


  // ---- UTILITY METHODS ----
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
  // Verifies if a file exists at the given path, throws StoreError if not found
  void verify_file_exists(const std::filesystem::path& file_path) const;
};

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace store
} // namespace blobstore
