#include "makoto/signing/signed_envelope.h"

#include <memory>
#include <utility>

#include <spdlog/spdlog.h>

#include "makoto/common/encoding.h"
#include "makoto/common/logging.h"

namespace makoto::signing {

namespace {

std::shared_ptr<spdlog::logger> Logger() {
  static const auto logger = makoto::common::GetLogger("makoto:signing");
  return logger;
}

std::span<const std::uint8_t> AsBytes(std::string_view s) {
  return std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
}

EnvelopeSignature SignPae(const SignedEnvelope& envelope, const Signer& signer) {
  const std::string pae = PreAuthEncoding(envelope.payload_type, envelope.payload);
  const auto sig = signer.Sign(AsBytes(pae));
  return EnvelopeSignature{.keyid = signer.key_id(), .sig = makoto::common::Base64Encode(sig)};
}

} // namespace

const char* ToString(EnvelopeVerifyStatus status) noexcept {
  switch (status) {
    case EnvelopeVerifyStatus::Verified:
      return "verified";
    case EnvelopeVerifyStatus::NoMatchingKey:
      return "no-matching-key";
    case EnvelopeVerifyStatus::SignatureInvalid:
      return "signature-invalid";
  }
  return "unknown";
}

std::string PreAuthEncoding(std::string_view payload_type, std::string_view payload_b64) {
  std::string pae;
  pae.reserve(kPaeVersionTag.size() + payload_type.size() + payload_b64.size() + 2);
  pae.append(kPaeVersionTag);
  pae.push_back(' ');
  pae.append(payload_type);
  pae.push_back(' ');
  pae.append(payload_b64);
  return pae;
}

SignedEnvelope SignPayload(std::span<const std::uint8_t> payload, const Signer& signer, const SignOptions& options) {
  SignedEnvelope envelope;
  envelope.payload_type = options.payload_type;
  envelope.payload = makoto::common::Base64Encode(payload);
  envelope.signatures.push_back(SignPae(envelope, signer));

  Logger()->debug("Signed {} byte payload of type '{}' with key {}", payload.size(), envelope.payload_type,
                  signer.key_id());
  return envelope;
}

void AddSignature(SignedEnvelope& envelope, const Signer& signer) {
  envelope.signatures.push_back(SignPae(envelope, signer));
}

EnvelopeVerifyStatus VerifyEnvelopeDetailed(const SignedEnvelope& envelope, const Verifier& verifier) {
  const std::string pae = PreAuthEncoding(envelope.payload_type, envelope.payload);

  bool found_matching_key = false;
  for (const auto& entry : envelope.signatures) {
    if (entry.keyid != verifier.key_id()) {
      continue;
    }
    found_matching_key = true;

    const auto sig = makoto::common::Base64Decode(entry.sig);
    if (!sig) {
      throw makoto::common::SignatureError("Invalid signature base64 for key " + entry.keyid);
    }

    if (!verifier.Verify(AsBytes(pae), *sig)) {
      Logger()->debug("Signature from key {} does not verify", entry.keyid);
      return EnvelopeVerifyStatus::SignatureInvalid;
    }
  }

  if (!found_matching_key) {
    Logger()->debug("No signature in envelope matches key {}", verifier.key_id());
    return EnvelopeVerifyStatus::NoMatchingKey;
  }
  return EnvelopeVerifyStatus::Verified;
}

bool VerifyEnvelope(const SignedEnvelope& envelope, const Verifier& verifier) {
  return VerifyEnvelopeDetailed(envelope, verifier) == EnvelopeVerifyStatus::Verified;
}

std::vector<std::uint8_t> DecodePayloadBytes(const SignedEnvelope& envelope) {
  auto bytes = makoto::common::Base64Decode(envelope.payload);
  if (!bytes) {
    throw makoto::common::InvalidAttestationError("Invalid base64 payload");
  }
  return std::move(*bytes);
}

nlohmann::json DecodePayloadJson(const SignedEnvelope& envelope) {
  const auto bytes = DecodePayloadBytes(envelope);
  try {
    return nlohmann::json::parse(bytes.begin(), bytes.end());
  } catch (const nlohmann::json::parse_error& e) {
    throw makoto::common::InvalidAttestationError(std::string("Payload is not valid JSON: ") + e.what());
  }
}

void to_json(nlohmann::json& j, const EnvelopeSignature& signature) {
  j = nlohmann::json{{"keyid", signature.keyid}, {"sig", signature.sig}};
}

void from_json(const nlohmann::json& j, EnvelopeSignature& signature) {
  j.at("keyid").get_to(signature.keyid);
  j.at("sig").get_to(signature.sig);
}

void to_json(nlohmann::json& j, const SignedEnvelope& envelope) {
  j = nlohmann::json{
      {"payloadType", envelope.payload_type},
      {"payload", envelope.payload},
      {"signatures", envelope.signatures},
  };
}

void from_json(const nlohmann::json& j, SignedEnvelope& envelope) {
  j.at("payloadType").get_to(envelope.payload_type);
  j.at("payload").get_to(envelope.payload);
  j.at("signatures").get_to(envelope.signatures);
}

SignedEnvelope ParseSignedEnvelope(std::string_view json_text) {
  try {
    return nlohmann::json::parse(json_text).get<SignedEnvelope>();
  } catch (const nlohmann::json::exception& e) {
    throw makoto::common::InvalidAttestationError(std::string("Malformed signed envelope: ") + e.what());
  }
}

std::string SerializeSignedEnvelope(const SignedEnvelope& envelope) {
  return nlohmann::json(envelope).dump();
}

} // namespace makoto::signing
