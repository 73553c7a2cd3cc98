// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file statement.h
 * @brief in-toto v1 statement header around an opaque predicate.
 */

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "makoto/signing/signed_envelope.h"
#include "makoto/validation/predicate_type.h"

namespace makoto::validation {

struct Subject {
  std::string name;
  // Algorithm name -> hex digest. "sha256" is required.
  std::map<std::string, std::string> digest;

  bool operator==(const Subject&) const = default;
};

/**
 * @brief in-toto Statement v1.
 *
 * The predicate body is kept as JSON; only the header fields are modelled.
 */
struct Statement {
  std::string type = std::string(kStatementTypeV1);
  std::vector<Subject> subject;
  std::string predicate_type;
  nlohmann::json predicate = nlohmann::json::object();

  PredicateType kind() const noexcept { return ParsePredicateType(predicate_type); }

  bool operator==(const Statement&) const = default;
};

/**
 * @brief Builds a statement from fully specified parts.
 *
 * @throws MissingFieldError if @p subjects is empty, a subject lacks a name or a sha256
 *         digest, @p predicate_type is Unknown, or @p predicate is not a JSON object.
 */
Statement MakeStatement(std::vector<Subject> subjects, PredicateType predicate_type, nlohmann::json predicate);

/**
 * @brief Decodes an envelope payload as a statement of the expected predicate type.
 *
 * @throws InvalidAttestationError if the payload is not base64 JSON.
 * @throws MissingFieldError if a statement header field is absent.
 * @throws InvalidPredicateTypeError if the statement's predicate type is not @p expected.
 */
Statement DecodeStatement(const makoto::signing::SignedEnvelope& envelope, PredicateType expected);

void to_json(nlohmann::json& j, const Subject& subject);
void from_json(const nlohmann::json& j, Subject& subject);
void to_json(nlohmann::json& j, const Statement& statement);
void from_json(const nlohmann::json& j, Statement& statement);

} // namespace makoto::validation
