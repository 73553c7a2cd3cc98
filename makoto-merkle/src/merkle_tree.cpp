#include "makoto/merkle/merkle_tree.h"

#include <memory>
#include <span>
#include <string>
#include <utility>

#include "makoto/common/errors.h"
#include "makoto/common/logging.h"

namespace makoto::merkle {

namespace {

std::shared_ptr<spdlog::logger> Logger() {
  static const auto logger = makoto::common::GetLogger("makoto:merkle");
  return logger;
}

std::string OutOfRangeMessage(std::size_t index, std::size_t count) {
  return "Leaf index " + std::to_string(index) + " out of bounds (tree has " + std::to_string(count) + " leaves)";
}

} // namespace

const char* ToString(HashAlgorithm algorithm) noexcept {
  switch (algorithm) {
    case HashAlgorithm::Sha256:
      return "sha256";
  }
  return "unknown";
}

MerkleTree MerkleTree::FromLeaves(const std::vector<std::vector<std::uint8_t>>& leaves) {
  std::vector<Digest> hashes;
  hashes.reserve(leaves.size());
  for (const auto& leaf : leaves) {
    hashes.push_back(makoto::common::Sha256(std::span<const std::uint8_t>(leaf.data(), leaf.size())));
  }
  return FromLeafHashes(std::move(hashes));
}

MerkleTree MerkleTree::FromLeaves(const std::vector<std::string>& leaves) {
  std::vector<Digest> hashes;
  hashes.reserve(leaves.size());
  for (const auto& leaf : leaves) {
    hashes.push_back(makoto::common::Sha256(std::string_view(leaf)));
  }
  return FromLeafHashes(std::move(hashes));
}

MerkleTree MerkleTree::FromLeafHashes(std::vector<Digest> leaf_hashes) {
  if (leaf_hashes.empty()) {
    return MerkleTree();
  }

  const std::size_t leaf_count = leaf_hashes.size();
  std::vector<std::vector<Digest>> levels;
  levels.push_back(std::move(leaf_hashes));

  while (levels.back().size() > 1) {
    const auto& current = levels.back();
    std::vector<Digest> next;
    next.reserve((current.size() + 1) / 2);

    for (std::size_t i = 0; i < current.size(); i += 2) {
      // An odd trailing node is paired with itself.
      const Digest& right = (i + 1 < current.size()) ? current[i + 1] : current[i];
      next.push_back(HashPair(current[i], right));
    }

    levels.push_back(std::move(next));
  }

  Logger()->debug("Built Merkle tree: leaves={}, height={}", leaf_count, levels.size());
  return MerkleTree(std::move(levels));
}

std::optional<Digest> MerkleTree::root() const {
  if (levels_.empty() || levels_.back().empty()) {
    return std::nullopt;
  }
  return levels_.back().front();
}

std::optional<std::string> MerkleTree::root_hex() const {
  const auto r = root();
  if (!r) {
    return std::nullopt;
  }
  return makoto::common::ToHex(*r);
}

std::size_t MerkleTree::leaf_count() const noexcept {
  return levels_.empty() ? 0 : levels_.front().size();
}

const Digest& MerkleTree::leaf(std::size_t index) const {
  if (index >= leaf_count()) {
    throw makoto::common::MerkleError(OutOfRangeMessage(index, leaf_count()));
  }
  return levels_.front()[index];
}

MerkleProof MerkleTree::Proof(std::size_t leaf_index) const {
  if (leaf_index >= leaf_count()) {
    throw makoto::common::MerkleError(OutOfRangeMessage(leaf_index, leaf_count()));
  }

  MerkleProof proof;
  proof.leaf_index = leaf_index;
  proof.leaf_hash = levels_.front()[leaf_index];
  proof.path.reserve(levels_.size() - 1);

  std::size_t index = leaf_index;
  for (std::size_t level = 0; level + 1 < levels_.size(); ++level) {
    const auto& nodes = levels_[level];
    const std::size_t sibling_index = (index % 2 == 0) ? index + 1 : index - 1;

    ProofElement pe;
    if (sibling_index < nodes.size()) {
      pe.hash = nodes[sibling_index];
      pe.position = (index % 2 == 0) ? SiblingPosition::Right : SiblingPosition::Left;
    } else {
      // Duplicated trailing node: the sibling is the node itself.
      pe.hash = nodes[index];
      pe.position = SiblingPosition::Right;
    }
    proof.path.push_back(pe);

    index /= 2;
  }

  Logger()->debug("Generated proof for leaf {} with {} siblings", leaf_index, proof.path.size());
  return proof;
}

bool MerkleTree::VerifyProof(const MerkleProof& proof) const {
  const auto r = root();
  if (!r) {
    return false;
  }

  // Sibling positions must spell out the bits of leaf_index.
  if (proof.leaf_index >= leaf_count() || proof.path.size() + 1 != levels_.size() ||
      proof.leaf_hash != levels_.front()[proof.leaf_index]) {
    return false;
  }
  std::size_t index = proof.leaf_index;
  for (const auto& pe : proof.path) {
    const auto expected = (index % 2 == 0) ? SiblingPosition::Right : SiblingPosition::Left;
    if (pe.position != expected) {
      return false;
    }
    index /= 2;
  }

  return proof.Verify(*r);
}

} // namespace makoto::merkle
