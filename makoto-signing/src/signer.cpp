#include "makoto/signing/signer.h"

#include <stdexcept>
#include <utility>

#include "makoto/common/errors.h"
#include "makoto/common/logging.h"
#include "makoto/signing/key_id.h"

#include "internal/openssl_utils.h"
#include "internal/pem_armor.h"

namespace makoto::signing {

namespace {

Signer::KeyPtr TakeKey(makoto::internal::EvpPkeyPtr key) {
  return Signer::KeyPtr(key.release(), &EVP_PKEY_free);
}

} // namespace

Signer::Signer(KeyPtr key, std::vector<std::uint8_t> public_key)
    : key_(std::move(key)), public_key_(std::move(public_key)), key_id_(ComputeKeyId(public_key_)) {}

Signer Signer::Generate() {
  auto key = makoto::internal::GenerateEcP256Key();
  if (!key) {
    throw std::runtime_error("P-256 key generation failed");
  }

  auto pub = makoto::internal::ExportUncompressedPublicPoint(key.get());
  if (!pub) {
    throw std::runtime_error("Failed to export generated public key");
  }

  Signer signer(TakeKey(std::move(key)), std::move(*pub));
  makoto::common::GetLogger("makoto:signing")->debug("Generated signing key {}", signer.key_id());
  return signer;
}

Signer Signer::FromBytes(std::span<const std::uint8_t> private_key) {
  if (private_key.size() != makoto::internal::kP256ScalarSize) {
    throw makoto::common::KeyError("Invalid private key bytes: expected " +
                                   std::to_string(makoto::internal::kP256ScalarSize) + " bytes, got " +
                                   std::to_string(private_key.size()));
  }

  auto key = makoto::internal::EcP256KeyFromPrivateScalar(private_key);
  if (!key) {
    throw makoto::common::KeyError("Invalid private key bytes: scalar is not in the P-256 range");
  }

  auto pub = makoto::internal::ExportUncompressedPublicPoint(key.get());
  if (!pub) {
    throw makoto::common::KeyError("Invalid private key bytes: cannot derive public key");
  }

  return Signer(TakeKey(std::move(key)), std::move(*pub));
}

Signer Signer::FromPem(std::string_view pem) {
  auto der = makoto::internal::ReadPemArmor(pem, makoto::internal::kPrivateKeyLabel);
  if (!der) {
    throw makoto::common::KeyError("Invalid PEM: expected a " + std::string(makoto::internal::kPrivateKeyLabel) +
                                   " block");
  }
  return FromBytes(*der);
}

std::vector<std::uint8_t> Signer::Sign(std::span<const std::uint8_t> data) const {
  if (!key_) {
    throw std::logic_error("Signer has been moved from");
  }

  auto sig = makoto::internal::SignEs256(key_.get(), data);
  if (!sig) {
    throw std::runtime_error("ECDSA signing failed");
  }
  return std::move(*sig);
}

std::vector<std::uint8_t> Signer::PrivateKeyBytes() const {
  if (!key_) {
    throw std::logic_error("Signer has been moved from");
  }

  auto scalar = makoto::internal::ExportPrivateScalar(key_.get());
  if (!scalar) {
    throw std::runtime_error("Failed to export private key");
  }
  return std::move(*scalar);
}

std::string Signer::ToPem() const {
  return makoto::internal::WritePemArmor(makoto::internal::kPrivateKeyLabel, PrivateKeyBytes());
}

Verifier Signer::GetVerifier() const {
  return Verifier::FromBytes(public_key_);
}

} // namespace makoto::signing
