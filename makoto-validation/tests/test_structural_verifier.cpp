// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file test_structural_verifier.cpp
 * @brief Unit tests for per-type structural checks.
 */

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>

#include <nlohmann/json.hpp>

#include "attestation_fixtures.h"
#include "makoto/validation/attestation_verifier.h"
#include "makoto/validation/structural_verifier.h"

namespace {
using makoto::validation::MakotoLevel;
using makoto::validation::StructuralVerifyOptions;
using makoto::validation::VerificationResult;
namespace fixtures = makoto::validation::testing;

bool HasMessage(const VerificationResult& r, const std::string& needle) {
  return std::any_of(r.messages.begin(), r.messages.end(),
                     [&](const std::string& m) { return m.find(needle) != std::string::npos; });
}

} // namespace

TEST_CASE("Well-formed documents pass at L1") {
  const auto origin = makoto::validation::VerifyOriginStructure(fixtures::ValidOrigin());
  REQUIRE(origin.valid);
  REQUIRE(origin.level == MakotoLevel::L1);
  REQUIRE(HasMessage(origin, "Origin attestation structure is valid"));
  REQUIRE_FALSE(origin.error_code.has_value());

  REQUIRE(makoto::validation::VerifyTransformStructure(fixtures::ValidTransform()).valid);
  REQUIRE(makoto::validation::VerifyStreamWindowStructure(fixtures::ValidStreamWindow()).valid);

  const auto dbom = makoto::validation::VerifyDbomStructure(fixtures::ValidDbom());
  REQUIRE(dbom.valid);
  REQUIRE(HasMessage(dbom, "DBOM structure is valid"));
}

TEST_CASE("Subject digest must be 64 characters") {
  auto doc = fixtures::ValidOrigin();
  doc["subject"][0]["digest"]["sha256"] = "abc123";

  const auto result = makoto::validation::VerifyOriginStructure(doc);
  REQUIRE_FALSE(result.valid);
  REQUIRE_FALSE(result.level.has_value());
  REQUIRE(result.error_code == "INVALID_DIGEST_LENGTH");
  REQUIRE(HasMessage(result, "expected 64, got 6"));
}

TEST_CASE("Subject digest must be hex") {
  auto doc = fixtures::ValidOrigin();
  doc["subject"][0]["digest"]["sha256"] = std::string(64, 'g');
  const auto result = makoto::validation::VerifyOriginStructure(doc);
  REQUIRE(result.error_code == "INVALID_DIGEST_ENCODING");
}

TEST_CASE("Empty subject list is rejected") {
  auto doc = fixtures::ValidTransform();
  doc["subject"] = nlohmann::json::array();
  const auto result = makoto::validation::VerifyTransformStructure(doc);
  REQUIRE(result.error_code == "EMPTY_SUBJECTS");
  REQUIRE(HasMessage(result, "No subjects in attestation"));
}

TEST_CASE("Missing origin fields are reported by path") {
  auto doc = fixtures::ValidOrigin();
  doc["predicate"]["origin"].erase("collectionTimestamp");
  const auto result = makoto::validation::VerifyOriginStructure(doc);
  REQUIRE(result.error_code == "MISSING_FIELD");
  REQUIRE(HasMessage(result, "predicate.origin.collectionTimestamp"));

  auto null_collector = fixtures::ValidOrigin();
  null_collector["predicate"]["collector"]["id"] = nullptr;
  REQUIRE(makoto::validation::VerifyOriginStructure(null_collector).error_code == "MISSING_FIELD");

  auto empty_source = fixtures::ValidOrigin();
  empty_source["predicate"]["origin"]["source"] = "";
  REQUIRE(makoto::validation::VerifyOriginStructure(empty_source).error_code == "EMPTY_FIELD");

  auto wrong_type = fixtures::ValidOrigin();
  wrong_type["predicate"]["origin"]["sourceType"] = 7;
  REQUIRE(makoto::validation::VerifyOriginStructure(wrong_type).error_code == "INVALID_FIELD_TYPE");
}

TEST_CASE("Statement type and predicate type are checked") {
  auto wrong_statement = fixtures::ValidOrigin();
  wrong_statement["_type"] = "https://in-toto.io/Statement/v0.1";
  REQUIRE(makoto::validation::VerifyOriginStructure(wrong_statement).error_code == "INVALID_STATEMENT_TYPE");

  StructuralVerifyOptions lenient;
  lenient.require_statement_type = false;
  REQUIRE(makoto::validation::VerifyOriginStructure(wrong_statement, lenient).valid);

  auto missing_statement = fixtures::ValidOrigin();
  missing_statement.erase("_type");
  REQUIRE_FALSE(makoto::validation::VerifyOriginStructure(missing_statement).valid);
  REQUIRE(makoto::validation::VerifyOriginStructure(missing_statement, lenient).valid);

  // An origin document checked as a transform.
  const auto mismatch = makoto::validation::VerifyTransformStructure(fixtures::ValidOrigin());
  REQUIRE(mismatch.error_code == "INVALID_PREDICATE_TYPE");
}

TEST_CASE("Transform requires inputs with valid digests") {
  auto no_inputs = fixtures::ValidTransform();
  no_inputs["predicate"]["inputs"] = nlohmann::json::array();
  const auto empty = makoto::validation::VerifyTransformStructure(no_inputs);
  REQUIRE(empty.error_code == "EMPTY_INPUTS");
  REQUIRE(HasMessage(empty, "No inputs in transform attestation"));

  auto bad_input = fixtures::ValidTransform();
  bad_input["predicate"]["inputs"][0]["digest"]["sha256"] = std::string(63, 'a');
  REQUIRE(makoto::validation::VerifyTransformStructure(bad_input).error_code == "INVALID_DIGEST_LENGTH");

  auto no_executor = fixtures::ValidTransform();
  no_executor["predicate"].erase("executor");
  REQUIRE(makoto::validation::VerifyTransformStructure(no_executor).error_code == "MISSING_FIELD");
}

TEST_CASE("Stream window Merkle root and leaf count are checked") {
  auto short_root = fixtures::ValidStreamWindow();
  short_root["predicate"]["integrity"]["merkleTree"]["root"] = "abcd";
  REQUIRE(makoto::validation::VerifyStreamWindowStructure(short_root).error_code == "INVALID_DIGEST_LENGTH");

  auto zero_leaves = fixtures::ValidStreamWindow();
  zero_leaves["predicate"]["integrity"]["merkleTree"]["leafCount"] = 0;
  const auto zero = makoto::validation::VerifyStreamWindowStructure(zero_leaves);
  REQUIRE(zero.error_code == "EMPTY_MERKLE_TREE");
  REQUIRE(HasMessage(zero, "Merkle tree has no leaves"));

  auto negative = fixtures::ValidStreamWindow();
  negative["predicate"]["integrity"]["merkleTree"]["leafCount"] = -3;
  REQUIRE(makoto::validation::VerifyStreamWindowStructure(negative).error_code == "INVALID_FIELD_TYPE");

  auto fractional = fixtures::ValidStreamWindow();
  fractional["predicate"]["integrity"]["merkleTree"]["leafCount"] = 1.5;
  REQUIRE(makoto::validation::VerifyStreamWindowStructure(fractional).error_code == "INVALID_FIELD_TYPE");

  auto no_tree = fixtures::ValidStreamWindow();
  no_tree["predicate"]["integrity"].erase("merkleTree");
  REQUIRE(makoto::validation::VerifyStreamWindowStructure(no_tree).error_code == "MISSING_FIELD");
}

TEST_CASE("Stream window chain back-reference") {
  auto chained = fixtures::ValidStreamWindow();
  chained["predicate"]["integrity"]["chain"] = {{"previousWindowId", "window_0041"},
                                                 {"previousMerkleRoot", fixtures::HexDigest('e')}};
  const auto ok = makoto::validation::VerifyStreamWindowStructure(chained);
  REQUIRE(ok.valid);
  REQUIRE(ok.warnings.empty());

  auto empty_id = chained;
  empty_id["predicate"]["integrity"]["chain"]["previousWindowId"] = "";
  REQUIRE(makoto::validation::VerifyStreamWindowStructure(empty_id).error_code == "INVALID_CHAIN");

  auto bad_prev_root = chained;
  bad_prev_root["predicate"]["integrity"]["chain"]["previousMerkleRoot"] = "xyz";
  REQUIRE(makoto::validation::VerifyStreamWindowStructure(bad_prev_root).error_code == "INVALID_DIGEST_LENGTH");

  auto half = chained;
  half["predicate"]["integrity"]["chain"].erase("previousMerkleRoot");
  const auto warned = makoto::validation::VerifyStreamWindowStructure(half);
  REQUIRE(warned.valid);
  REQUIRE(warned.warnings.size() == 1);
}

TEST_CASE("DBOM checks") {
  auto bad_id = fixtures::ValidDbom();
  bad_id["dbomId"] = "dbom:example";
  REQUIRE(makoto::validation::VerifyDbomStructure(bad_id).error_code == "INVALID_DBOM_ID");

  auto no_sources = fixtures::ValidDbom();
  no_sources["sources"] = nlohmann::json::array();
  const auto empty = makoto::validation::VerifyDbomStructure(no_sources);
  REQUIRE(empty.error_code == "EMPTY_SOURCES");
  REQUIRE(HasMessage(empty, "DBOM has no sources"));

  auto unnamed_source = fixtures::ValidDbom();
  unnamed_source["sources"][1].erase("name");
  const auto unnamed = makoto::validation::VerifyDbomStructure(unnamed_source);
  REQUIRE(unnamed.error_code == "MISSING_FIELD");
  REQUIRE(HasMessage(unnamed, "sources[1].name"));

  auto no_dataset_name = fixtures::ValidDbom();
  no_dataset_name["dataset"].erase("name");
  REQUIRE(makoto::validation::VerifyDbomStructure(no_dataset_name).error_code == "MISSING_FIELD");
}

TEST_CASE("Collect-all mode reports every failure with the first code") {
  auto doc = fixtures::ValidOrigin();
  doc["subject"][0]["digest"]["sha256"] = "abc";
  doc["predicate"]["origin"].erase("source");
  doc["predicate"].erase("collector");

  const auto first_only = makoto::validation::VerifyOriginStructure(doc);
  REQUIRE(first_only.messages.size() == 1);
  REQUIRE(first_only.error_code == "INVALID_DIGEST_LENGTH");

  StructuralVerifyOptions collect_all;
  collect_all.stop_on_first_failure = false;
  const auto all = makoto::validation::VerifyOriginStructure(doc, collect_all);
  REQUIRE_FALSE(all.valid);
  REQUIRE(all.messages.size() == 3);
  REQUIRE(all.error_code == "INVALID_DIGEST_LENGTH");
  REQUIRE(HasMessage(all, "predicate.origin.source"));
  REQUIRE(HasMessage(all, "predicate.collector.id"));
}

TEST_CASE("VerifyStructure dispatches on type") {
  using makoto::validation::AttestationType;
  REQUIRE(makoto::validation::VerifyStructure(fixtures::ValidDbom(), AttestationType::Dbom).valid);
  REQUIRE_FALSE(makoto::validation::VerifyStructure(fixtures::ValidDbom(), AttestationType::Origin).valid);

  const auto signed_doc = makoto::validation::VerifyStructure(nlohmann::json::object(), AttestationType::Signed);
  REQUIRE_FALSE(signed_doc.valid);
  REQUIRE(signed_doc.error_code == "VERIFIER_REQUIRED");
}

TEST_CASE("VerifyAttestationJson detects then checks") {
  const auto ok = makoto::validation::VerifyAttestationJson(fixtures::ValidStreamWindow().dump());
  REQUIRE(ok.valid);
  REQUIRE(ok.level == MakotoLevel::L1);

  REQUIRE(makoto::validation::VerifyAttestationJson("{not json").error_code == "UNKNOWN_TYPE");
  REQUIRE(makoto::validation::VerifyAttestationJson(R"({"hello":"world"})").error_code == "UNKNOWN_TYPE");

  auto bad = fixtures::ValidStreamWindow();
  bad["predicate"]["integrity"]["merkleTree"]["root"] = "abc";
  REQUIRE(makoto::validation::VerifyAttestationJson(bad.dump()).error_code == "INVALID_DIGEST_LENGTH");
}
