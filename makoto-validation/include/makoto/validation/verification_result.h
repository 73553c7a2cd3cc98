// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file verification_result.h
 * @brief Leveled outcome of structural or signed verification.
 */

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace makoto::validation {

/**
 * @brief Assurance level reached by a passing verification.
 *
 * L1: structure and field invariants hold. L2: L1 plus a valid signature over the payload.
 * L3 is reserved and never produced by this library.
 */
enum class MakotoLevel {
  L1,
  L2,
  L3,
};

const char* ToString(MakotoLevel level) noexcept;

struct VerificationResult {
  bool valid = false;
  // Set only when valid.
  std::optional<MakotoLevel> level;
  std::vector<std::string> messages;
  std::vector<std::string> warnings;
  // Machine-readable code of the first failure, e.g. "INVALID_DIGEST_LENGTH".
  std::optional<std::string> error_code;

  static VerificationResult Pass(MakotoLevel level) {
    VerificationResult r;
    r.valid = true;
    r.level = level;
    return r;
  }

  static VerificationResult Fail(std::string message, std::optional<std::string> error_code = std::nullopt) {
    VerificationResult r;
    r.valid = false;
    r.messages.push_back(std::move(message));
    r.error_code = std::move(error_code);
    return r;
  }

  VerificationResult& WithMessage(std::string message) {
    messages.push_back(std::move(message));
    return *this;
  }

  VerificationResult& WithWarning(std::string warning) {
    warnings.push_back(std::move(warning));
    return *this;
  }
};

} // namespace makoto::validation
