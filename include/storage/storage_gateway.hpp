#ifndef FARMTRACE_STORAGE_STORAGE_GATEWAY_HPP
#define FARMTRACE_STORAGE_STORAGE_GATEWAY_HPP

#include <cstdint>
#include <string>

namespace farmtrace {
namespace storage {

struct UploadResult {
  std::string cid;
  uint64_t size{0};
};

// Content-addressed storage collaborator. One instance is shared by
// reference across concurrent pipeline invocations, so implementations must
// be safe for concurrent use.
//
// fetch throws NotFoundError for unknown content; every other failure is a
// StorageUnavailableError.
class StorageGateway {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  virtual ~StorageGateway() = default;


  // ---- CONTENT OPERATIONS ----
  virtual UploadResult upload(const std::string& bytes) = 0;
  virtual std::string fetch(const std::string& cid) = 0;


  // ---- DURABILITY ----
  virtual void pin(const std::string& cid) = 0;
  virtual void unpin(const std::string& cid) = 0;
  virtual bool is_pinned(const std::string& cid) = 0;

protected:
  StorageGateway() = default;
};

} // namespace storage
} // namespace farmtrace

#endif // FARMTRACE_STORAGE_STORAGE_GATEWAY_HPP
