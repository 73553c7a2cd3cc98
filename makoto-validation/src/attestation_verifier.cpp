#include "makoto/validation/attestation_verifier.h"

#include <memory>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "makoto/common/errors.h"
#include "makoto/common/logging.h"
#include "makoto/validation/attestation_type.h"

namespace makoto::validation {

namespace {

std::shared_ptr<spdlog::logger> Logger() {
  static const auto logger = makoto::common::GetLogger("makoto:validation");
  return logger;
}

} // namespace

VerificationResult VerifyAttestationJson(std::string_view json_text, const StructuralVerifyOptions& options) {
  nlohmann::json doc;
  AttestationType type = AttestationType::Signed;
  try {
    doc = nlohmann::json::parse(json_text);
    type = DetectAttestationType(doc);
  } catch (const nlohmann::json::parse_error& e) {
    return VerificationResult::Fail(std::string("Type detection failed: invalid JSON: ") + e.what(), "UNKNOWN_TYPE");
  } catch (const makoto::common::InvalidAttestationError& e) {
    return VerificationResult::Fail(std::string("Type detection failed: ") + e.what(), "UNKNOWN_TYPE");
  }

  Logger()->debug("Detected {} attestation", ToString(type));
  return VerifyStructure(doc, type, options);
}

VerificationResult VerifySignedAttestation(const makoto::signing::SignedEnvelope& envelope,
                                           const makoto::signing::Verifier& verifier,
                                           const StructuralVerifyOptions& options) {
  auto status = makoto::signing::EnvelopeVerifyStatus::NoMatchingKey;
  try {
    status = makoto::signing::VerifyEnvelopeDetailed(envelope, verifier);
  } catch (const makoto::common::SignatureError& e) {
    return VerificationResult::Fail(e.what(), "SIGNATURE_MALFORMED");
  }

  switch (status) {
    case makoto::signing::EnvelopeVerifyStatus::Verified:
      break;
    case makoto::signing::EnvelopeVerifyStatus::NoMatchingKey:
      return VerificationResult::Fail("No signature from key " + verifier.key_id(), "NO_MATCHING_KEY");
    case makoto::signing::EnvelopeVerifyStatus::SignatureInvalid:
      return VerificationResult::Fail("Signature verification failed", "SIGNATURE_INVALID");
  }

  nlohmann::json doc;
  try {
    doc = makoto::signing::DecodePayloadJson(envelope);
  } catch (const makoto::common::InvalidAttestationError& e) {
    return VerificationResult::Fail(std::string("Payload decode error: ") + e.what(), "PAYLOAD_DECODE_ERROR");
  }

  AttestationType type = AttestationType::Signed;
  try {
    type = DetectAttestationType(doc);
  } catch (const makoto::common::InvalidAttestationError& e) {
    return VerificationResult::Fail(std::string("Type detection failed: ") + e.what(), "UNKNOWN_TYPE");
  }

  auto structural = VerifyStructure(doc, type, options);
  if (!structural.valid) {
    return structural;
  }

  auto result = VerificationResult::Pass(MakotoLevel::L2);
  result.WithMessage("Signed attestation is valid").WithMessage("Signature verified for key: " + verifier.key_id());
  for (auto& m : structural.messages) {
    result.WithMessage(std::move(m));
  }
  result.warnings = std::move(structural.warnings);
  return result;
}

} // namespace makoto::validation
