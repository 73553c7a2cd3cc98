// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file signed_envelope.h
 * @brief DSSE-style envelope: a base64 payload bound to its type by one or more signatures.
 *
 * What gets signed is the pre-authentication encoding
 * @code
 *   "DSSEv1" SP payloadType SP base64(payload)
 * @endcode
 * so a signature over one payload type cannot be replayed as covering another.
 */

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "makoto/common/errors.h"
#include "makoto/signing/signer.h"
#include "makoto/signing/verifier.h"

namespace makoto::signing {

constexpr std::string_view kPaeVersionTag = "DSSEv1";
constexpr std::string_view kInTotoPayloadType = "application/vnd.in-toto+json";

struct SignOptions {
  std::string payload_type = std::string(kInTotoPayloadType);
};

struct EnvelopeSignature {
  std::string keyid;
  // Base64 of the raw 64-byte r||s signature.
  std::string sig;

  bool operator==(const EnvelopeSignature&) const = default;
};

struct SignedEnvelope {
  std::string payload_type;
  // Base64 of the serialized payload.
  std::string payload;
  // Order is not significant and key ids are not required to be unique.
  std::vector<EnvelopeSignature> signatures;

  bool operator==(const SignedEnvelope&) const = default;
};

enum class EnvelopeVerifyStatus {
  Verified,
  // No entry carries the verifier's key id.
  NoMatchingKey,
  // At least one entry with the verifier's key id failed cryptographic verification.
  SignatureInvalid,
};

const char* ToString(EnvelopeVerifyStatus status) noexcept;

std::string PreAuthEncoding(std::string_view payload_type, std::string_view payload_b64);

/**
 * @brief Base64-encodes @p payload, signs its PAE and wraps both with the signer's key id.
 */
SignedEnvelope SignPayload(std::span<const std::uint8_t> payload, const Signer& signer, const SignOptions& options = {});

inline SignedEnvelope SignPayload(std::string_view payload, const Signer& signer, const SignOptions& options = {}) {
  return SignPayload(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(payload.data()), payload.size()),
                     signer, options);
}

/**
 * @brief Serializes @p payload with nlohmann::json and signs the compact JSON text.
 */
template <typename T>
SignedEnvelope Sign(const T& payload, const Signer& signer, const SignOptions& options = {}) {
  const std::string text = nlohmann::json(payload).dump();
  return SignPayload(std::string_view(text), signer, options);
}

// Appends a signature from @p signer over the envelope's existing PAE.
void AddSignature(SignedEnvelope& envelope, const Signer& signer);

/**
 * @brief Verifies every signature carrying @p verifier's key id.
 *
 * The PAE is rebuilt from the envelope's own payloadType and payload.
 *
 * @return true only if at least one entry matches the key id and all matching entries verify.
 *         A missing key and a bad signature both return false; use VerifyEnvelopeDetailed()
 *         to tell them apart.
 * @throws SignatureError if a matching entry's signature is not valid base64 or not 64 bytes.
 */
bool VerifyEnvelope(const SignedEnvelope& envelope, const Verifier& verifier);

/**
 * @brief Same checks as VerifyEnvelope(), reporting why verification did not succeed.
 * @throws SignatureError under the same conditions as VerifyEnvelope().
 */
EnvelopeVerifyStatus VerifyEnvelopeDetailed(const SignedEnvelope& envelope, const Verifier& verifier);

/**
 * @throws InvalidAttestationError if the payload is not valid base64.
 */
std::vector<std::uint8_t> DecodePayloadBytes(const SignedEnvelope& envelope);

/**
 * @throws InvalidAttestationError if the payload is not valid base64 or not JSON.
 */
nlohmann::json DecodePayloadJson(const SignedEnvelope& envelope);

/**
 * @brief Decodes the payload and converts it to @p T through nlohmann::json.
 * @throws InvalidAttestationError if the payload does not have the shape of @p T.
 */
template <typename T>
T DecodePayload(const SignedEnvelope& envelope) {
  const nlohmann::json doc = DecodePayloadJson(envelope);
  try {
    return doc.get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw makoto::common::InvalidAttestationError(std::string("Payload does not match expected shape: ") + e.what());
  }
}

void to_json(nlohmann::json& j, const EnvelopeSignature& signature);
void from_json(const nlohmann::json& j, EnvelopeSignature& signature);
void to_json(nlohmann::json& j, const SignedEnvelope& envelope);
void from_json(const nlohmann::json& j, SignedEnvelope& envelope);

/**
 * @throws InvalidAttestationError if @p json_text is not an envelope object.
 */
SignedEnvelope ParseSignedEnvelope(std::string_view json_text);

std::string SerializeSignedEnvelope(const SignedEnvelope& envelope);

} // namespace makoto::signing
