#include "storage/local_store.hpp"
#include "crypto/entropy.hpp"
#include "crypto/hasher.hpp"
#include <fstream>
#include <sstream>
#include <system_error>
#include <boost/log/trivial.hpp>

namespace farmtrace {
namespace storage {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

// Initialize store with base directory path and ensure it exists
LocalStore::LocalStore(const std::string& base_path)
  : base_path_(base_path)
  , pins_path_(std::filesystem::path(base_path) / "pins") {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing local store with base path: " << base_path;
  check_directory_exists(base_path_);
  check_directory_exists(pins_path_);
  BOOST_LOG_TRIVIAL(debug) << "Store: Store directory created/verified at: " << base_path;
}


//==============================================
// CONTENT OPERATIONS
//==============================================

UploadResult LocalStore::upload(const std::string& bytes) {
  std::string cid = hash_content(bytes);
  BOOST_LOG_TRIVIAL(info) << "Store: Storing " << bytes.size() << " bytes as " << cid;

  std::filesystem::path file_path = get_path_for_hash(cid);
  if (std::filesystem::exists(file_path)) {
    BOOST_LOG_TRIVIAL(debug) << "Store: Content already present: " << cid;
    return UploadResult{cid, bytes.size()};
  }
  check_directory_exists(file_path.parent_path());

  // Write beside the target, then rename so readers never see partial content
  std::filesystem::path temp_path = file_path;
  temp_path += ".tmp." + crypto::generate_nonce();
  {
    std::ofstream file(temp_path, std::ios::binary);
    if (!file) {
      throw StoreError("Store: Failed to create file: " + temp_path.string());
    }
    file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    file.close();
    if (!file) {
      std::error_code ignored;
      std::filesystem::remove(temp_path, ignored);
      throw StoreError("Store: Failed to write file: " + temp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, file_path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to move content into place: " << ec.message();
    throw StoreError("Store: Failed to store content " + cid + ": " + ec.message());
  }

  BOOST_LOG_TRIVIAL(info) << "Store: Successfully stored " << bytes.size() << " bytes as " << cid;
  return UploadResult{cid, bytes.size()};
}

std::string LocalStore::fetch(const std::string& cid) {
  BOOST_LOG_TRIVIAL(info) << "Store: Retrieving content " << cid;
  verify_content_exists(cid);

  std::filesystem::path file_path = get_path_for_hash(cid);
  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    throw StoreError("Store: Failed to open file: " + file_path.string());
  }

  std::stringstream output;
  output << file.rdbuf();
  if (file.bad()) {
    throw StoreError("Store: Failed to read file: " + file_path.string());
  }

  std::string bytes = output.str();
  BOOST_LOG_TRIVIAL(info) << "Store: Successfully read " << bytes.size() << " bytes for " << cid;
  return bytes;
}


//==============================================
// DURABILITY
//==============================================

void LocalStore::pin(const std::string& cid) {
  verify_content_exists(cid);

  std::lock_guard<std::mutex> lock(pin_mutex_);
  std::ofstream marker(pins_path_ / cid);
  if (!marker) {
    throw StoreError("Store: Failed to write pin marker for " + cid);
  }
  BOOST_LOG_TRIVIAL(info) << "Store: Pinned " << cid;
}

void LocalStore::unpin(const std::string& cid) {
  validate_cid(cid);

  std::lock_guard<std::mutex> lock(pin_mutex_);
  std::error_code ec;
  bool removed = std::filesystem::remove(pins_path_ / cid, ec);
  if (ec) {
    throw StoreError("Store: Failed to remove pin marker for " + cid + ": " + ec.message());
  }
  if (!removed) {
    throw NotFoundError("Content " + cid + " is not pinned");
  }
  BOOST_LOG_TRIVIAL(info) << "Store: Unpinned " << cid;
}

bool LocalStore::is_pinned(const std::string& cid) {
  validate_cid(cid);

  std::lock_guard<std::mutex> lock(pin_mutex_);
  return std::filesystem::exists(pins_path_ / cid);
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool LocalStore::has(const std::string& cid) const {
  validate_cid(cid);
  bool exists = std::filesystem::exists(get_path_for_hash(cid));
  BOOST_LOG_TRIVIAL(debug) << "Store: Content " << cid << (exists ? " exists" : " not found");
  return exists;
}

std::uintmax_t LocalStore::get_file_size(const std::string& cid) const {
  verify_content_exists(cid);
  return std::filesystem::file_size(get_path_for_hash(cid));
}

std::vector<std::string> LocalStore::list_pins() const {
  std::lock_guard<std::mutex> lock(pin_mutex_);
  std::vector<std::string> pins;
  for (const auto& entry : std::filesystem::directory_iterator(pins_path_)) {
    pins.push_back(entry.path().filename().string());
  }
  return pins;
}

void LocalStore::clear() {
  BOOST_LOG_TRIVIAL(info) << "Store: Clearing entire store at: " << base_path_;
  std::lock_guard<std::mutex> lock(pin_mutex_);
  std::filesystem::remove_all(base_path_);
  check_directory_exists(base_path_);
  check_directory_exists(pins_path_);
  BOOST_LOG_TRIVIAL(info) << "Store: Store cleared successfully";
}


//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::string LocalStore::hash_content(const std::string& bytes) const {
  // Digest text is "0x" + hex; the address is the bare hex
  return crypto::general_hash(bytes).text.substr(2);
}

std::filesystem::path LocalStore::get_path_for_hash(const std::string& hash) const {
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

void LocalStore::check_directory_exists(const std::filesystem::path& path) const {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to create directory " << path.string() << ": " << ec.message();
    throw StoreError("Store: Failed to create directory: " + path.string());
  }
}

void LocalStore::validate_cid(const std::string& cid) const {
  bool valid = cid.size() == 64;
  for (char c : cid) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
      valid = false;
      break;
    }
  }
  if (!valid) {
    throw ValidationError("Invalid content address: " + cid);
  }
}

void LocalStore::verify_content_exists(const std::string& cid) const {
  validate_cid(cid);
  if (!std::filesystem::exists(get_path_for_hash(cid))) {
    BOOST_LOG_TRIVIAL(error) << "Store: Content not found: " << cid;
    throw NotFoundError("Content not found: " + cid);
  }
}

} // namespace storage
} // namespace farmtrace
