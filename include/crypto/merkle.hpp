#ifndef FARMTRACE_CRYPTO_MERKLE_HPP
#define FARMTRACE_CRYPTO_MERKLE_HPP

#include <string>
#include <vector>
#include "crypto/hasher.hpp"

namespace farmtrace::crypto {

// Order-sensitive merkle aggregation over caller-ordered leaves.
//   []        -> general_hash("empty")
//   [x]       -> x, returned verbatim
//   otherwise -> adjacent pairs hashed left to right as general_hash(a + b);
//                an odd trailing leaf is paired with itself
// Leaves are combined as strings, not as decoded bytes.
class MerkleAggregator {
public:
  static constexpr const char* EMPTY_SENTINEL_INPUT = "empty";

  static std::string root(const std::vector<std::string>& leaves);
  static std::string root(const std::vector<Digest>& leaves);

  // Hash of the empty sentinel, exposed for callers that compare against it
  static std::string empty_root();

private:
  static std::vector<std::string> next_level(const std::vector<std::string>& level);
};

} // namespace farmtrace::crypto

#endif // FARMTRACE_CRYPTO_MERKLE_HPP
