#include "store/store.hpp"
#include <fstream>
#include <boost/log/trivial.hpp>

namespace blobstore {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

// Initialize store with base directory path and ensure it exists
Store::Store(const std::filesystem::path& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing Store with base path: " << base_path_.string();
  check_directory_exists(base_path_);
  BOOST_LOG_TRIVIAL(debug) << "Store: Store directory created/verified at: " << base_path_.string();
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void Store::store(const types::ContentHash& address, const types::Bytes& data) {
  std::filesystem::path file_path = get_path_for_hash(address);
  std::lock_guard<std::mutex> lock(mutex_);

  if (std::filesystem::exists(file_path)) {
    BOOST_LOG_TRIVIAL(debug) << "Store: Chunk already present: " << types::to_hex(address);
    return;
  }

  check_directory_exists(file_path.parent_path());
  std::filesystem::path temp_path = file_path;
  temp_path += ".tmp" + std::to_string(++temp_counter_);

  // Write to a temporary file first so readers never observe a partial chunk
  {
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw StoreError("Store: Failed to create file: " + temp_path.string());
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file) {
      std::error_code ec;
      std::filesystem::remove(temp_path, ec);
      throw StoreError("Store: Failed to write file: " + temp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, file_path, ec);
  if (ec) {
    std::filesystem::remove(temp_path, ec);
    throw StoreError("Store: Failed to commit chunk " + types::to_hex(address) + ": " + ec.message());
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: Stored " << data.size() << " bytes under: " << types::to_hex(address);
}

types::Bytes Store::get(const types::ContentHash& address) const {
  BOOST_LOG_TRIVIAL(debug) << "Store: Retrieving chunk: " << types::to_hex(address);

  std::filesystem::path file_path = get_path_for_hash(address);
  verify_file_exists(file_path);

  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    throw StoreError("Store: Failed to open file: " + file_path.string());
  }

  types::Bytes data(std::filesystem::file_size(file_path));
  if (!data.empty() && !file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()))) {
    throw StoreError("Store: Failed to read file: " + file_path.string());
  }

  BOOST_LOG_TRIVIAL(trace) << "Store: Read " << data.size() << " bytes for: " << types::to_hex(address);
  return data;
}

void Store::remove(const types::ContentHash& address) {
  BOOST_LOG_TRIVIAL(info) << "Store: Removing chunk: " << types::to_hex(address);

  std::filesystem::path file_path = get_path_for_hash(address);

  std::lock_guard<std::mutex> lock(mutex_);
  if (!std::filesystem::remove(file_path)) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to remove chunk: " << types::to_hex(address);
    throw StoreError("Store: Failed to remove chunk");
  }

  // Clean up empty parent directories up to base_path_
  auto current = file_path.parent_path();
  while (current != base_path_ && std::filesystem::is_empty(current)) {
    std::filesystem::remove(current);
    current = current.parent_path();
  }
}

void Store::clear() {
  BOOST_LOG_TRIVIAL(info) << "Store: Clearing entire store at: " << base_path_.string();
  std::lock_guard<std::mutex> lock(mutex_);
  std::filesystem::remove_all(base_path_);
  check_directory_exists(base_path_);
  BOOST_LOG_TRIVIAL(info) << "Store: Store cleared successfully";
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool Store::has(const types::ContentHash& address) const {
  std::filesystem::path file_path = get_path_for_hash(address);
  bool exists = std::filesystem::exists(file_path);
  BOOST_LOG_TRIVIAL(trace) << "Store: Chunk " << types::to_hex(address) << (exists ? " exists" : " not found");
  return exists;
}

std::uintmax_t Store::get_file_size(const types::ContentHash& address) const {
  std::filesystem::path file_path = get_path_for_hash(address);
  verify_file_exists(file_path);
  return std::filesystem::file_size(file_path);
}

std::size_t Store::count() const {
  std::size_t total = 0;
  for (const auto& entry : std::filesystem::recursive_directory_iterator(base_path_)) {
    // Skip in-flight temporary files
    if (entry.is_regular_file() && entry.path().extension().string().rfind(".tmp", 0) != 0) {
      ++total;
    }
  }
  return total;
}


//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::filesystem::path Store::get_path_for_hash(const types::ContentHash& address) const {
  const std::string hash = types::to_hex(address);
  std::filesystem::path path = base_path_;

  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }

  path /= hash.substr(6);
  return path;
}


//==============================================
// UTILITY METHODS
//==============================================

void Store::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

void Store::verify_file_exists(const std::filesystem::path& file_path) const {
  if (!std::filesystem::exists(file_path)) {
    BOOST_LOG_TRIVIAL(debug) << "Store: File not found: " << file_path.string();
    throw StoreError("Store: File not found");
  }
}

} // namespace store
} // namespace blobstore
