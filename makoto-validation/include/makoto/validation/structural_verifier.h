// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file structural_verifier.h
 * @brief Level 1 checks: required fields, subject digests and type-specific invariants.
 *
 * These functions never throw for malformed documents; every problem is reported through
 * a failing VerificationResult. A passing result is always level L1.
 */

#include <vector>

#include <nlohmann/json.hpp>

#include "makoto/validation/attestation_type.h"
#include "makoto/validation/verification_result.h"

namespace makoto::validation {

struct StructuralVerifyOptions {
  // Require "_type" to be the in-toto Statement v1 URI.
  bool require_statement_type = true;

  // When false, every failure is collected into messages; error_code is the first one's.
  bool stop_on_first_failure = true;
};

/**
 * @brief Origin statement: header, subjects, predicate.origin.{source, sourceType,
 *        collectionMethod, collectionTimestamp} and predicate.collector.id.
 */
VerificationResult VerifyOriginStructure(const nlohmann::json& doc, const StructuralVerifyOptions& options = {});

/**
 * @brief Transform statement: header, subjects, non-empty predicate.inputs with valid
 *        digests, predicate.transform.{type, name} and predicate.executor.id.
 */
VerificationResult VerifyTransformStructure(const nlohmann::json& doc, const StructuralVerifyOptions& options = {});

/**
 * @brief Stream-window statement: header, subjects, predicate.stream.id, predicate.window,
 *        predicate.integrity.merkleTree (64-char root, leafCount > 0) and, if present,
 *        the predicate.integrity.chain back-reference.
 *
 * A chain carrying only one of previousWindowId / previousMerkleRoot is accepted with a warning.
 */
VerificationResult VerifyStreamWindowStructure(const nlohmann::json& doc,
                                               const StructuralVerifyOptions& options = {});

// Manifest: dbomVersion, dbomId ("urn:dbom:" prefix), dataset.name and non-empty sources.
VerificationResult VerifyDbomStructure(const nlohmann::json& doc, const StructuralVerifyOptions& options = {});

/**
 * @brief Dispatches to the checker for @p type.
 *
 * Signed envelopes cannot be checked structurally and fail with error code VERIFIER_REQUIRED.
 */
VerificationResult VerifyStructure(const nlohmann::json& doc,
                                   AttestationType type,
                                   const StructuralVerifyOptions& options = {});

/**
 * @brief Checks an ordered lineage of statements.
 *
 * Each statement is detected and verified structurally; its failures and warnings are reported
 * with a "Statement <i>: " prefix. Subject name/sha256 pairs become known outputs for later
 * statements. A transform input whose name is a known output with a different sha256 fails with
 * CHAIN_HASH_MISMATCH; an input with no earlier producer only adds a warning. An empty list is valid.
 */
VerificationResult VerifyStatementChain(const std::vector<nlohmann::json>& statements,
                                        const StructuralVerifyOptions& options = {});

} // namespace makoto::validation
