// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file test_attestation_verifier.cpp
 * @brief End-to-end checks of signed attestations at L2.
 */

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "attestation_fixtures.h"
#include "makoto/common/encoding.h"
#include "makoto/merkle/merkle_tree.h"
#include "makoto/signing/signed_envelope.h"
#include "makoto/validation/attestation_verifier.h"

namespace {
using makoto::signing::Signer;
using makoto::validation::MakotoLevel;
using makoto::validation::VerificationResult;
namespace fixtures = makoto::validation::testing;

bool HasMessage(const VerificationResult& r, const std::string& needle) {
  return std::any_of(r.messages.begin(), r.messages.end(),
                     [&](const std::string& m) { return m.find(needle) != std::string::npos; });
}

} // namespace

TEST_CASE("Signed origin attestation verifies at L2") {
  const auto signer = Signer::Generate();
  const auto envelope = makoto::signing::Sign(fixtures::ValidOrigin(), signer);

  const auto result = makoto::validation::VerifySignedAttestation(envelope, signer.GetVerifier());
  REQUIRE(result.valid);
  REQUIRE(result.level == MakotoLevel::L2);
  REQUIRE(HasMessage(result, "Signed attestation is valid"));
  REQUIRE(HasMessage(result, "Signature verified for key: " + signer.key_id()));
  REQUIRE(HasMessage(result, "Origin attestation structure is valid"));
}

TEST_CASE("Stream window attestation over a real Merkle root") {
  const auto tree = makoto::merkle::MerkleTree::FromLeaves(std::vector<std::string>{
      R"({"sensor":"s1","t":1})", R"({"sensor":"s2","t":2})", R"({"sensor":"s3","t":3})"});

  auto doc = fixtures::ValidStreamWindow();
  doc["predicate"]["integrity"]["merkleTree"]["root"] = *tree.root_hex();
  doc["predicate"]["integrity"]["merkleTree"]["leafCount"] = tree.leaf_count();

  const auto signer = Signer::Generate();
  const auto envelope = makoto::signing::Sign(doc, signer);
  const auto result = makoto::validation::VerifySignedAttestation(envelope, signer.GetVerifier());
  REQUIRE(result.valid);
  REQUIRE(result.level == MakotoLevel::L2);
}

TEST_CASE("Wrong key yields NO_MATCHING_KEY") {
  const auto signer = Signer::Generate();
  const auto other = Signer::Generate();
  const auto envelope = makoto::signing::Sign(fixtures::ValidOrigin(), signer);

  const auto result = makoto::validation::VerifySignedAttestation(envelope, other.GetVerifier());
  REQUIRE_FALSE(result.valid);
  REQUIRE(result.error_code == "NO_MATCHING_KEY");
  REQUIRE(HasMessage(result, other.key_id()));
}

TEST_CASE("Tampered payload yields SIGNATURE_INVALID") {
  const auto signer = Signer::Generate();
  auto envelope = makoto::signing::Sign(fixtures::ValidOrigin(), signer);

  auto changed = fixtures::ValidOrigin();
  changed["predicate"]["origin"]["source"] = "https://attacker.example.com";
  envelope.payload = makoto::common::Base64Encode(std::string_view(changed.dump()));

  const auto result = makoto::validation::VerifySignedAttestation(envelope, signer.GetVerifier());
  REQUIRE_FALSE(result.valid);
  REQUIRE(result.error_code == "SIGNATURE_INVALID");
}

TEST_CASE("Malformed signature yields SIGNATURE_MALFORMED") {
  const auto signer = Signer::Generate();
  auto envelope = makoto::signing::Sign(fixtures::ValidOrigin(), signer);
  envelope.signatures[0].sig = "%%%";

  const auto result = makoto::validation::VerifySignedAttestation(envelope, signer.GetVerifier());
  REQUIRE(result.error_code == "SIGNATURE_MALFORMED");
}

TEST_CASE("Validly signed but structurally broken payload fails with the structural code") {
  auto doc = fixtures::ValidOrigin();
  doc["subject"][0]["digest"]["sha256"] = "abc123";

  const auto signer = Signer::Generate();
  const auto envelope = makoto::signing::Sign(doc, signer);
  const auto result = makoto::validation::VerifySignedAttestation(envelope, signer.GetVerifier());
  REQUIRE_FALSE(result.valid);
  REQUIRE(result.error_code == "INVALID_DIGEST_LENGTH");
}

TEST_CASE("Signed payloads that are not attestations") {
  const auto signer = Signer::Generate();

  const auto not_json = makoto::signing::SignPayload(std::string_view("plain text"), signer);
  REQUIRE(makoto::validation::VerifySignedAttestation(not_json, signer.GetVerifier()).error_code ==
          "PAYLOAD_DECODE_ERROR");

  const auto unknown = makoto::signing::Sign(nlohmann::json{{"hello", "world"}}, signer);
  REQUIRE(makoto::validation::VerifySignedAttestation(unknown, signer.GetVerifier()).error_code == "UNKNOWN_TYPE");
}

TEST_CASE("Signed DBOM verifies at L2") {
  const auto signer = Signer::Generate();
  const auto envelope = makoto::signing::Sign(fixtures::ValidDbom(), signer);
  const auto result = makoto::validation::VerifySignedAttestation(envelope, signer.GetVerifier());
  REQUIRE(result.valid);
  REQUIRE(result.level == MakotoLevel::L2);
}

TEST_CASE("Envelope JSON without a key is not structurally verifiable") {
  const auto signer = Signer::Generate();
  const auto envelope = makoto::signing::Sign(fixtures::ValidOrigin(), signer);
  const auto result = makoto::validation::VerifyAttestationJson(makoto::signing::SerializeSignedEnvelope(envelope));
  REQUIRE_FALSE(result.valid);
  REQUIRE(result.error_code == "VERIFIER_REQUIRED");
}
