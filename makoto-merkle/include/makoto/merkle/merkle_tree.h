// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file merkle_tree.h
 * @brief Binary SHA-256 hash tree over an ordered sequence of leaves.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "makoto/common/digest.h"
#include "makoto/merkle/merkle_proof.h"

namespace makoto::merkle {

enum class HashAlgorithm {
  Sha256,
};

const char* ToString(HashAlgorithm algorithm) noexcept;

/**
 * @brief Immutable Merkle tree.
 *
 * Level 0 holds the leaf hashes in insertion order; every following level pairs adjacent
 * nodes left to right. A trailing odd node is paired with itself (H(last || last)) rather
 * than promoted, so proofs generated here only verify against trees built the same way.
 *
 * A built tree is never modified and can be shared between threads without locking.
 */
class MerkleTree {
 public:
  // Empty tree: no levels, no root.
  MerkleTree() = default;

  // Hashes each leaf with SHA-256 to form level 0.
  static MerkleTree FromLeaves(const std::vector<std::vector<std::uint8_t>>& leaves);
  static MerkleTree FromLeaves(const std::vector<std::string>& leaves);

  static MerkleTree FromLeafHashes(std::vector<Digest> leaf_hashes);

  std::optional<Digest> root() const;
  std::optional<std::string> root_hex() const;

  std::size_t leaf_count() const noexcept;

  // Number of levels including leaves and root; 0 for an empty tree.
  std::size_t height() const noexcept { return levels_.size(); }

  HashAlgorithm algorithm() const noexcept { return HashAlgorithm::Sha256; }

  /**
   * @throws MerkleError if @p index >= leaf_count().
   */
  const Digest& leaf(std::size_t index) const;

  const std::vector<std::vector<Digest>>& levels() const noexcept { return levels_; }

  /**
   * @brief Builds the inclusion proof for the leaf at @p leaf_index.
   * @throws MerkleError if @p leaf_index >= leaf_count().
   */
  MerkleProof Proof(std::size_t leaf_index) const;

  /**
   * @brief True iff the proof belongs to leaf `proof.leaf_index` of this tree.
   *
   * Besides recomputing the root, checks that the index is in range, the path length matches the
   * tree height, `leaf_hash` is the stored leaf and every sibling position matches the index bits.
   * Always false for an empty tree.
   */
  bool VerifyProof(const MerkleProof& proof) const;

 private:
  explicit MerkleTree(std::vector<std::vector<Digest>> levels) : levels_(std::move(levels)) {}

  std::vector<std::vector<Digest>> levels_;
};

} // namespace makoto::merkle
