#include "crypto/merkle.hpp"
#include <boost/log/trivial.hpp>

namespace farmtrace::crypto {

std::string MerkleAggregator::root(const std::vector<std::string>& leaves) {
  if (leaves.empty()) {
    return empty_root();
  }

  if (leaves.size() == 1) {
    return leaves.front();
  }

  std::vector<std::string> level = leaves;
  size_t depth = 0;
  while (level.size() > 1) {
    level = next_level(level);
    ++depth;
  }

  BOOST_LOG_TRIVIAL(trace) << "Merkle: Aggregated " << leaves.size() << " leaves over "
                           << depth << " levels";
  return level.front();
}

std::string MerkleAggregator::root(const std::vector<Digest>& leaves) {
  std::vector<std::string> texts;
  texts.reserve(leaves.size());
  for (const auto& leaf : leaves) {
    texts.push_back(leaf.text);
  }
  return root(texts);
}

std::string MerkleAggregator::empty_root() {
  return general_hash(EMPTY_SENTINEL_INPUT).text;
}

std::vector<std::string> MerkleAggregator::next_level(const std::vector<std::string>& level) {
  std::vector<std::string> parents;
  parents.reserve((level.size() + 1) / 2);

  for (size_t i = 0; i < level.size(); i += 2) {
    const std::string& left = level[i];
    // Odd trailing node is duplicated, not promoted
    const std::string& right = (i + 1 < level.size()) ? level[i + 1] : level[i];
    parents.push_back(general_hash(left + right).text);
  }
  return parents;
}

} // namespace farmtrace::crypto
