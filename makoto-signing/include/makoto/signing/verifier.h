// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file verifier.h
 * @brief ECDSA P-256 / SHA-256 signature verification with a public key only.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/evp.h>

namespace makoto::signing {

// Raw r||s, 32 bytes each.
constexpr std::size_t kSignatureSize = 64;

/**
 * @brief Holds a P-256 public key and its key identifier.
 *
 * Copies share the underlying key. Verify() does not mutate state and may be called
 * concurrently.
 */
class Verifier {
 public:
  /**
   * @brief Imports a SEC1 point, compressed (33 bytes) or uncompressed (65 bytes).
   * @throws KeyError if the bytes do not encode a point on P-256.
   */
  static Verifier FromBytes(std::span<const std::uint8_t> sec1);

  /**
   * @brief Imports a "MAKOTO PUBLIC KEY" armored SEC1 point, or a standard
   *        SubjectPublicKeyInfo "PUBLIC KEY" PEM holding a P-256 key.
   * @throws KeyError on any other input.
   */
  static Verifier FromPem(std::string_view pem);

  const std::string& key_id() const noexcept { return key_id_; }

  // 65-byte uncompressed SEC1 encoding, whatever form was imported.
  const std::vector<std::uint8_t>& PublicKeyBytes() const noexcept { return public_key_; }

  // Armored form accepted by FromPem.
  std::string ToPem() const;

  /**
   * @brief Checks a raw r||s signature over @p data.
   * @return false if the signature does not verify.
   * @throws SignatureError if @p signature is not 64 bytes long.
   */
  bool Verify(std::span<const std::uint8_t> data, std::span<const std::uint8_t> signature) const;

  bool Verify(std::string_view data, std::span<const std::uint8_t> signature) const {
    return Verify(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(data.data()), data.size()),
                  signature);
  }

 private:
  Verifier(std::shared_ptr<EVP_PKEY> key, std::vector<std::uint8_t> public_key);

  std::shared_ptr<EVP_PKEY> key_;
  std::vector<std::uint8_t> public_key_;
  std::string key_id_;
};

} // namespace makoto::signing
