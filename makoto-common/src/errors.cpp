#include "makoto/common/errors.h"

#include <utility>

namespace makoto::common {

const char* ToString(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::Signature:
      return "Signature";
    case ErrorKind::HashMismatch:
      return "HashMismatch";
    case ErrorKind::InvalidAttestation:
      return "InvalidAttestation";
    case ErrorKind::MissingField:
      return "MissingField";
    case ErrorKind::InvalidPredicateType:
      return "InvalidPredicateType";
    case ErrorKind::KeyError:
      return "KeyError";
    case ErrorKind::MerkleError:
      return "MerkleError";
  }
  return "Unknown";
}

MakotoError::MakotoError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

SignatureError::SignatureError(const std::string& message)
    : MakotoError(ErrorKind::Signature, "Signature error: " + message) {}

HashMismatchError::HashMismatchError(std::string expected, std::string actual)
    : MakotoError(ErrorKind::HashMismatch,
                  "Hash verification failed: expected " + expected + ", got " + actual),
      expected_(std::move(expected)),
      actual_(std::move(actual)) {}

InvalidAttestationError::InvalidAttestationError(const std::string& message)
    : MakotoError(ErrorKind::InvalidAttestation, "Invalid attestation: " + message) {}

MissingFieldError::MissingFieldError(std::string field)
    : MakotoError(ErrorKind::MissingField, "Missing required field: " + field), field_(std::move(field)) {}

InvalidPredicateTypeError::InvalidPredicateTypeError(std::string expected, std::string actual)
    : MakotoError(ErrorKind::InvalidPredicateType,
                  "Invalid predicate type: expected " + expected + ", got " + actual),
      expected_(std::move(expected)),
      actual_(std::move(actual)) {}

KeyError::KeyError(const std::string& message) : MakotoError(ErrorKind::KeyError, "Key error: " + message) {}

MerkleError::MerkleError(const std::string& message)
    : MakotoError(ErrorKind::MerkleError, "Merkle tree error: " + message) {}

} // namespace makoto::common
