// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file attestation_verifier.h
 * @brief Entry points that detect, decode and verify attestation documents.
 */

#include <string_view>

#include "makoto/signing/signed_envelope.h"
#include "makoto/signing/verifier.h"
#include "makoto/validation/structural_verifier.h"
#include "makoto/validation/verification_result.h"

namespace makoto::validation {

/**
 * @brief Detects the type of an unsigned document and runs its structural checks.
 *
 * Unparseable or unclassifiable input yields a failing result (UNKNOWN_TYPE), as does a
 * signed envelope (VERIFIER_REQUIRED). At most L1.
 */
VerificationResult VerifyAttestationJson(std::string_view json_text, const StructuralVerifyOptions& options = {});

/**
 * @brief Verifies the envelope signature for @p verifier, then the decoded statement's structure.
 *
 * Failure codes: NO_MATCHING_KEY, SIGNATURE_INVALID, SIGNATURE_MALFORMED, PAYLOAD_DECODE_ERROR,
 * UNKNOWN_TYPE, or the structural code. On success the level is L2 and the messages name the
 * verifying key id.
 */
VerificationResult VerifySignedAttestation(const makoto::signing::SignedEnvelope& envelope,
                                           const makoto::signing::Verifier& verifier,
                                           const StructuralVerifyOptions& options = {});

} // namespace makoto::validation
