#include "makoto/merkle/merkle_proof.h"

#include <algorithm>
#include <cstdint>
#include <span>
#include <string>

#include <nlohmann/json.hpp>

#include "makoto/common/errors.h"

namespace makoto::merkle {

namespace {
constexpr std::string_view kLeft = "left";
constexpr std::string_view kRight = "right";
} // namespace

const char* ToString(SiblingPosition position) noexcept {
  return position == SiblingPosition::Left ? "left" : "right";
}

Digest HashPair(const Digest& left, const Digest& right) {
  std::uint8_t buf[2 * makoto::common::kSha256Size];
  std::copy(left.begin(), left.end(), buf);
  std::copy(right.begin(), right.end(), buf + makoto::common::kSha256Size);
  return makoto::common::Sha256(std::span<const std::uint8_t>(buf, sizeof(buf)));
}

Digest MerkleProof::ComputeRoot() const {
  Digest current = leaf_hash;
  for (const auto& pe : path) {
    if (pe.position == SiblingPosition::Left) {
      current = HashPair(pe.hash, current);
    } else {
      current = HashPair(current, pe.hash);
    }
  }
  return current;
}

bool MerkleProof::Verify(const Digest& expected_root) const {
  return ComputeRoot() == expected_root;
}

MerkleProofHex MerkleProof::ToHex() const {
  MerkleProofHex out;
  out.leaf_index = leaf_index;
  out.leaf_hash = makoto::common::ToHex(leaf_hash);
  out.siblings.reserve(path.size());
  out.positions.reserve(path.size());
  for (const auto& pe : path) {
    out.siblings.push_back(makoto::common::ToHex(pe.hash));
    out.positions.emplace_back(ToString(pe.position));
  }
  return out;
}

MerkleProof MerkleProofHex::ToProof() const {
  if (siblings.size() != positions.size()) {
    throw makoto::common::MerkleError("Proof has " + std::to_string(siblings.size()) + " siblings but " +
                                      std::to_string(positions.size()) + " positions");
  }

  MerkleProof out;
  out.leaf_index = leaf_index;
  out.leaf_hash = makoto::common::DigestFromHex(leaf_hash);
  out.path.reserve(siblings.size());
  for (std::size_t i = 0; i < siblings.size(); ++i) {
    ProofElement pe;
    pe.hash = makoto::common::DigestFromHex(siblings[i]);
    if (positions[i] == kLeft) {
      pe.position = SiblingPosition::Left;
    } else if (positions[i] == kRight) {
      pe.position = SiblingPosition::Right;
    } else {
      throw makoto::common::MerkleError("Unknown sibling position '" + positions[i] + "'");
    }
    out.path.push_back(pe);
  }
  return out;
}

void to_json(nlohmann::json& j, const MerkleProofHex& proof) {
  j = nlohmann::json{
      {"leafIndex", proof.leaf_index},
      {"leafHash", proof.leaf_hash},
      {"siblings", proof.siblings},
      {"positions", proof.positions},
  };
}

void from_json(const nlohmann::json& j, MerkleProofHex& proof) {
  if (!j.at("leafIndex").is_number_unsigned()) {
    throw makoto::common::MerkleError("leafIndex must be a non-negative integer");
  }
  j.at("leafIndex").get_to(proof.leaf_index);
  j.at("leafHash").get_to(proof.leaf_hash);
  j.at("siblings").get_to(proof.siblings);
  j.at("positions").get_to(proof.positions);
}

MerkleProofHex ParseMerkleProofJson(std::string_view json_text) {
  try {
    return nlohmann::json::parse(json_text).get<MerkleProofHex>();
  } catch (const nlohmann::json::exception& e) {
    throw makoto::common::MerkleError(std::string("Malformed proof JSON: ") + e.what());
  }
}

std::string SerializeMerkleProofJson(const MerkleProofHex& proof) {
  return nlohmann::json(proof).dump();
}

} // namespace makoto::merkle
