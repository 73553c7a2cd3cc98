#include "makoto/signing/verifier.h"

#include <utility>

#include "makoto/common/errors.h"
#include "makoto/signing/key_id.h"

#include "internal/openssl_utils.h"
#include "internal/pem_armor.h"

namespace makoto::signing {

namespace {

std::shared_ptr<EVP_PKEY> Share(makoto::internal::EvpPkeyPtr key) {
  return std::shared_ptr<EVP_PKEY>(key.release(), &EVP_PKEY_free);
}

} // namespace

Verifier::Verifier(std::shared_ptr<EVP_PKEY> key, std::vector<std::uint8_t> public_key)
    : key_(std::move(key)), public_key_(std::move(public_key)), key_id_(ComputeKeyId(public_key_)) {}

Verifier Verifier::FromBytes(std::span<const std::uint8_t> sec1) {
  auto key = makoto::internal::EcP256KeyFromPublicPoint(sec1);
  if (!key) {
    throw makoto::common::KeyError("Invalid public key bytes: not a P-256 SEC1 point");
  }

  // Normalize so compressed and uncompressed imports share a key id.
  auto uncompressed = makoto::internal::ExportUncompressedPublicPoint(key.get());
  if (!uncompressed) {
    throw makoto::common::KeyError("Invalid public key bytes: cannot encode point");
  }

  return Verifier(Share(std::move(key)), std::move(*uncompressed));
}

Verifier Verifier::FromPem(std::string_view pem) {
  if (auto sec1 = makoto::internal::ReadPemArmor(pem, makoto::internal::kPublicKeyLabel)) {
    return FromBytes(*sec1);
  }

  auto key = makoto::internal::LoadEcP256PublicKeyFromPem(std::string(pem));
  if (!key) {
    throw makoto::common::KeyError("Invalid PEM: expected a " + std::string(makoto::internal::kPublicKeyLabel) +
                                   " block or a P-256 PUBLIC KEY");
  }

  auto uncompressed = makoto::internal::ExportUncompressedPublicPoint(key.get());
  if (!uncompressed) {
    throw makoto::common::KeyError("Invalid PEM: cannot encode public point");
  }

  return Verifier(Share(std::move(key)), std::move(*uncompressed));
}

std::string Verifier::ToPem() const {
  return makoto::internal::WritePemArmor(makoto::internal::kPublicKeyLabel, public_key_);
}

bool Verifier::Verify(std::span<const std::uint8_t> data, std::span<const std::uint8_t> signature) const {
  if (signature.size() != kSignatureSize) {
    throw makoto::common::SignatureError("Invalid signature format: expected " + std::to_string(kSignatureSize) +
                                         " bytes, got " + std::to_string(signature.size()));
  }
  return makoto::internal::VerifyEs256(key_.get(), data, signature);
}

} // namespace makoto::signing
