// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file errors.h
 * @brief Exception types raised for malformed input and failed integrity checks.
 */

#include <stdexcept>
#include <string>

namespace makoto::common {

enum class ErrorKind {
  Signature,
  HashMismatch,
  InvalidAttestation,
  MissingField,
  InvalidPredicateType,
  KeyError,
  MerkleError,
};

/**
 * @brief Returns a stable, human-readable name for @p kind.
 */
const char* ToString(ErrorKind kind) noexcept;

/**
 * @brief Base class for every error raised by this library.
 *
 * Semantic verification failures are reported through VerificationResult instead;
 * these exceptions are reserved for input that cannot be processed at all.
 */
class MakotoError : public std::runtime_error {
 public:
  MakotoError(ErrorKind kind, const std::string& message);

  ErrorKind kind() const noexcept { return kind_; }

 private:
  ErrorKind kind_;
};

// Malformed signature encoding or signature bytes.
class SignatureError : public MakotoError {
 public:
  explicit SignatureError(const std::string& message);
};

class HashMismatchError : public MakotoError {
 public:
  HashMismatchError(std::string expected, std::string actual);

  const std::string& expected() const noexcept { return expected_; }
  const std::string& actual() const noexcept { return actual_; }

 private:
  std::string expected_;
  std::string actual_;
};

class InvalidAttestationError : public MakotoError {
 public:
  explicit InvalidAttestationError(const std::string& message);
};

class MissingFieldError : public MakotoError {
 public:
  explicit MissingFieldError(std::string field);

  const std::string& field() const noexcept { return field_; }

 private:
  std::string field_;
};

class InvalidPredicateTypeError : public MakotoError {
 public:
  InvalidPredicateTypeError(std::string expected, std::string actual);

  const std::string& expected() const noexcept { return expected_; }
  const std::string& actual() const noexcept { return actual_; }

 private:
  std::string expected_;
  std::string actual_;
};

// Key parsing or import failure.
class KeyError : public MakotoError {
 public:
  explicit KeyError(const std::string& message);
};

class MerkleError : public MakotoError {
 public:
  explicit MerkleError(const std::string& message);
};

} // namespace makoto::common
