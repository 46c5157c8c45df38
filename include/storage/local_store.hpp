#pragma once

#include <string>
#include <filesystem>
#include <mutex>
#include <vector>
#include "core/errors.hpp"
#include "storage/storage_gateway.hpp"

namespace farmtrace {
namespace storage {

// Content-addressed filesystem store. The content address is the hex
// SHA-256 of the stored bytes; pins are marker files under {base}/pins/.
class LocalStore : public StorageGateway {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit LocalStore(const std::string& base_path);


  // ---- CONTENT OPERATIONS ----
  // Stores bytes under their digest; storing the same bytes twice is a no-op
  UploadResult upload(const std::string& bytes) override;
  // Throws NotFoundError when nothing is stored under cid
  std::string fetch(const std::string& cid) override;


  // ---- DURABILITY ----
  void pin(const std::string& cid) override;
  void unpin(const std::string& cid) override;
  bool is_pinned(const std::string& cid) override;


  // ---- QUERY OPERATIONS ----
  bool has(const std::string& cid) const;
  std::uintmax_t get_file_size(const std::string& cid) const;
  std::vector<std::string> list_pins() const;
  // Removes all stored content and pins
  void clear();

  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  // Root path for all stored files
  std::filesystem::path base_path_;
  std::filesystem::path pins_path_;
  // Guards pin markers
  mutable std::mutex pin_mutex_;


  // ---- CAS STORAGE SUPPORT ----
  // Generate SHA-256 hex digest of content using OpenSSL EVP
  std::string hash_content(const std::string& bytes) const;
  // {base_path}/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{remaining_hash}
  std::filesystem::path get_path_for_hash(const std::string& hash) const;


  // ---- UTILITY METHODS ----
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
  // Rejects anything that is not 64 lowercase hex characters
  void validate_cid(const std::string& cid) const;
  // Throws NotFoundError if nothing is stored under cid
  void verify_content_exists(const std::string& cid) const;
};

// Filesystem failure inside the store
class StoreError : public StorageUnavailableError {
public:
  explicit StoreError(const std::string& message) : StorageUnavailableError(message) {}
};

} // namespace storage
} // namespace farmtrace
