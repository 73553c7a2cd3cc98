// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file attestation_type.h
 * @brief Shape-based classification of attestation documents.
 */

#include <string_view>

#include <nlohmann/json.hpp>

namespace makoto::validation {

enum class AttestationType {
  Origin,
  Transform,
  StreamWindow,
  Dbom,
  Signed,
};

// "origin", "transform", "stream-window", "dbom" or "signed".
const char* ToString(AttestationType type) noexcept;

/**
 * @brief Classifies a parsed document by its top-level keys.
 *
 * Checked in order: payloadType + signatures (signed envelope), a known predicateType URI,
 * dbomVersion + dbomId (manifest). Nothing below the top level is inspected.
 *
 * @throws InvalidAttestationError("Unknown attestation type") if no rule matches.
 */
AttestationType DetectAttestationType(const nlohmann::json& doc);

/**
 * @throws InvalidAttestationError if @p json_text is not valid JSON or no rule matches.
 */
AttestationType DetectAttestationTypeFromJson(std::string_view json_text);

} // namespace makoto::validation
