// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file test_merkle_tree.cpp
 * @brief Unit tests for tree construction and inclusion proofs.
 */

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "makoto/common/digest.h"
#include "makoto/common/errors.h"
#include "makoto/merkle/merkle_tree.h"

namespace {
using makoto::common::Digest;
using makoto::common::Sha256;
using makoto::merkle::HashPair;
using makoto::merkle::MerkleProof;
using makoto::merkle::MerkleTree;
using makoto::merkle::SiblingPosition;

MerkleTree Build(std::vector<std::string> leaves) {
  return MerkleTree::FromLeaves(leaves);
}

std::vector<std::string> NumberedLeaves(std::size_t n) {
  std::vector<std::string> out;
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back("record-" + std::to_string(i));
  }
  return out;
}

} // namespace

TEST_CASE("Empty tree has no root") {
  const auto tree = MerkleTree::FromLeaves(std::vector<std::string>{});
  REQUIRE_FALSE(tree.root().has_value());
  REQUIRE_FALSE(tree.root_hex().has_value());
  REQUIRE(tree.leaf_count() == 0);
  REQUIRE(tree.height() == 0);
  REQUIRE_THROWS_AS(tree.Proof(0), makoto::common::MerkleError);
}

TEST_CASE("Single leaf tree: root is the leaf hash") {
  const auto tree = Build({"only"});
  REQUIRE(tree.height() == 1);
  REQUIRE(tree.leaf_count() == 1);
  REQUIRE(*tree.root() == Sha256(std::string_view("only")));

  const auto proof = tree.Proof(0);
  REQUIRE(proof.path.empty());
  REQUIRE(tree.VerifyProof(proof));
}

TEST_CASE("Heights for two and four leaves") {
  REQUIRE(Build({"leaf1", "leaf2"}).height() == 2);
  REQUIRE(Build({"a", "b", "c", "d"}).height() == 3);
}

TEST_CASE("Height is ceil(log2(n)) + 1") {
  REQUIRE(Build(NumberedLeaves(3)).height() == 3);
  REQUIRE(Build(NumberedLeaves(5)).height() == 4);
  REQUIRE(Build(NumberedLeaves(8)).height() == 4);
  REQUIRE(Build(NumberedLeaves(9)).height() == 5);
}

TEST_CASE("Two leaf root is H(H(a) || H(b))") {
  const auto tree = Build({"leaf1", "leaf2"});
  const Digest expected = HashPair(Sha256(std::string_view("leaf1")), Sha256(std::string_view("leaf2")));
  REQUIRE(*tree.root() == expected);
}

TEST_CASE("Odd trailing node is paired with itself") {
  const auto tree = Build({"a", "b", "c"});
  const Digest ha = Sha256(std::string_view("a"));
  const Digest hb = Sha256(std::string_view("b"));
  const Digest hc = Sha256(std::string_view("c"));
  const Digest expected = HashPair(HashPair(ha, hb), HashPair(hc, hc));
  REQUIRE(*tree.root() == expected);

  // The last leaf's first sibling is itself, on the right.
  const auto proof = tree.Proof(2);
  REQUIRE(proof.path.size() == 2);
  REQUIRE(proof.path[0].hash == hc);
  REQUIRE(proof.path[0].position == SiblingPosition::Right);
  REQUIRE(proof.path[1].position == SiblingPosition::Left);

  for (std::size_t i = 0; i < 3; ++i) {
    REQUIRE(tree.VerifyProof(tree.Proof(i)));
  }
}

TEST_CASE("Insertion order determines the root") {
  REQUIRE(*Build({"a", "b"}).root() != *Build({"b", "a"}).root());
}

TEST_CASE("Every proof verifies for assorted sizes") {
  for (std::size_t n : {1u, 2u, 3u, 4u, 5u, 6u, 7u, 8u, 13u, 16u, 33u}) {
    const auto tree = Build(NumberedLeaves(n));
    for (std::size_t i = 0; i < n; ++i) {
      const auto proof = tree.Proof(i);
      REQUIRE(proof.path.size() == tree.height() - 1);
      REQUIRE(proof.leaf_index == i);
      REQUIRE(proof.leaf_hash == tree.leaf(i));
      REQUIRE(tree.VerifyProof(proof));
      REQUIRE(proof.Verify(*tree.root()));
    }
  }
}

TEST_CASE("Flipping any bit in a proof breaks verification") {
  const auto tree = Build(NumberedLeaves(7));
  const auto root = *tree.root();

  for (std::size_t i = 0; i < tree.leaf_count(); ++i) {
    const auto proof = tree.Proof(i);

    auto bad_leaf = proof;
    bad_leaf.leaf_hash[0] ^= 0x01;
    REQUIRE_FALSE(bad_leaf.Verify(root));

    for (std::size_t s = 0; s < proof.path.size(); ++s) {
      auto bad_sibling = proof;
      bad_sibling.path[s].hash[31] ^= 0x80;
      REQUIRE_FALSE(bad_sibling.Verify(root));
    }
  }
}

TEST_CASE("Proof out of range throws MerkleError") {
  const auto tree = Build({"a", "b", "c"});
  REQUIRE_THROWS_AS(tree.Proof(3), makoto::common::MerkleError);
  REQUIRE_THROWS_AS(tree.leaf(3), makoto::common::MerkleError);
}

TEST_CASE("Proof from one tree does not verify against another") {
  const auto a = Build({"a", "b", "c", "d"});
  const auto b = Build({"a", "b", "c", "e"});
  REQUIRE_FALSE(b.VerifyProof(a.Proof(3)));
  REQUIRE_FALSE(MerkleTree().VerifyProof(a.Proof(0)));
}

TEST_CASE("Byte leaves and precomputed hashes build the same tree") {
  const std::vector<std::vector<std::uint8_t>> bytes = {{'a'}, {'b'}, {'c'}};
  const auto from_bytes = MerkleTree::FromLeaves(bytes);

  std::vector<Digest> hashes;
  for (const auto& leaf : bytes) {
    hashes.push_back(Sha256(std::span<const std::uint8_t>(leaf.data(), leaf.size())));
  }
  const auto from_hashes = MerkleTree::FromLeafHashes(hashes);

  REQUIRE(*from_bytes.root() == *from_hashes.root());
  REQUIRE(*from_bytes.root() == *Build({"a", "b", "c"}).root());
  REQUIRE(from_bytes.algorithm() == makoto::merkle::HashAlgorithm::Sha256);
  REQUIRE(std::string(makoto::merkle::ToString(from_bytes.algorithm())) == "sha256");
}

TEST_CASE("root_hex is 64 lowercase hex characters") {
  const auto hex = Build({"a", "b"}).root_hex();
  REQUIRE(hex.has_value());
  REQUIRE(hex->size() == 64);
  for (char c : *hex) {
    REQUIRE(((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')));
  }
}

TEST_CASE("Building a tree keeps the host's default log level") {
  const auto host_level = spdlog::default_logger()->level();
  spdlog::set_level(spdlog::level::debug);

  const auto tree = MerkleTree::FromLeaves(NumberedLeaves(5));
  REQUIRE(tree.root());
  REQUIRE(spdlog::default_logger()->level() == spdlog::level::debug);

  spdlog::set_level(host_level);
}

TEST_CASE("A proof does not verify under a rewritten leaf index") {
  const auto tree = Build(NumberedLeaves(8));
  const auto root = *tree.root();

  for (std::size_t i = 0; i < tree.leaf_count(); ++i) {
    for (std::size_t claimed = 0; claimed < tree.leaf_count() + 2; ++claimed) {
      if (claimed == i) {
        continue;
      }
      auto relabeled = tree.Proof(i);
      relabeled.leaf_index = claimed;

      // The bare hash chain still recomputes to the root; only the tree binds the index.
      REQUIRE(relabeled.Verify(root));
      REQUIRE_FALSE(tree.VerifyProof(relabeled));
    }
  }
}

TEST_CASE("VerifyProof rejects paths with the wrong length or flipped positions") {
  const auto tree = Build(NumberedLeaves(5));
  const auto proof = tree.Proof(4);

  auto truncated = proof;
  truncated.path.pop_back();
  REQUIRE_FALSE(tree.VerifyProof(truncated));

  auto flipped = proof;
  flipped.path[0].position = SiblingPosition::Left;
  REQUIRE_FALSE(tree.VerifyProof(flipped));
}
