// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file merkle_proof.h
 * @brief Inclusion proofs that can be checked without holding the whole tree.
 */

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "makoto/common/digest.h"

namespace makoto::merkle {

using makoto::common::Digest;

/**
 * @brief Which side a sibling occupies when it is recombined with the running hash.
 */
enum class SiblingPosition {
  Left,
  Right,
};

const char* ToString(SiblingPosition position) noexcept;

// H(left || right).
Digest HashPair(const Digest& left, const Digest& right);

struct ProofElement {
  SiblingPosition position = SiblingPosition::Right;
  Digest hash{};
};

struct MerkleProofHex;

/**
 * @brief Sibling path from one leaf up to the root.
 *
 * `path` is ordered leaf-to-root and has exactly height - 1 entries for the tree it came from.
 */
struct MerkleProof {
  std::size_t leaf_index = 0;
  Digest leaf_hash{};
  std::vector<ProofElement> path;

  /**
   * @brief Recomputes the candidate root from the leaf hash and the sibling path.
   *
   * A `Left` sibling yields H(sibling || current), a `Right` sibling yields H(current || sibling).
   */
  Digest ComputeRoot() const;

  // True iff ComputeRoot() equals @p expected_root. leaf_index is not consulted; use
  // MerkleTree::VerifyProof to bind the proof to a position.
  bool Verify(const Digest& expected_root) const;

  MerkleProofHex ToHex() const;
};

/**
 * @brief Hex form of a MerkleProof used for JSON exchange.
 *
 * JSON shape: {"leafIndex": n, "leafHash": hex, "siblings": [hex...], "positions": ["left"|"right"...]}
 */
struct MerkleProofHex {
  std::size_t leaf_index = 0;
  std::string leaf_hash;
  std::vector<std::string> siblings;
  std::vector<std::string> positions;

  /**
   * @brief Converts back to binary form.
   * @throws InvalidAttestationError for malformed hex digests.
   * @throws MerkleError when siblings and positions differ in length or a position is unknown.
   */
  MerkleProof ToProof() const;
};

void to_json(nlohmann::json& j, const MerkleProofHex& proof);
void from_json(const nlohmann::json& j, MerkleProofHex& proof);

/**
 * @brief Parses proof JSON text.
 * @throws MerkleError if the text is not JSON or does not have the expected shape.
 */
MerkleProofHex ParseMerkleProofJson(std::string_view json_text);

std::string SerializeMerkleProofJson(const MerkleProofHex& proof);

} // namespace makoto::merkle
