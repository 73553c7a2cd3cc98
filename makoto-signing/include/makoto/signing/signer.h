// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file signer.h
 * @brief ECDSA P-256 / SHA-256 key pair used to sign envelopes.
 */

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/evp.h>

#include "makoto/signing/verifier.h"

namespace makoto::signing {

/**
 * @brief Exclusive owner of a P-256 private key.
 *
 * Move-only. Sign() does not mutate the key, so one instance may sign from several threads.
 * The private scalar leaves the object only through PrivateKeyBytes() and ToPem().
 */
class Signer {
 public:
  using KeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;

  // Fresh key from OpenSSL's CSPRNG.
  static Signer Generate();

  /**
   * @brief Imports a 32-byte big-endian private scalar.
   * @throws KeyError if the length is wrong or the scalar is outside [1, n-1].
   */
  static Signer FromBytes(std::span<const std::uint8_t> private_key);

  /**
   * @brief Imports the "MAKOTO PRIVATE KEY" armor produced by ToPem().
   * @throws KeyError on malformed armor or key bytes.
   */
  static Signer FromPem(std::string_view pem);

  Signer(Signer&&) noexcept = default;
  Signer& operator=(Signer&&) noexcept = default;
  Signer(const Signer&) = delete;
  Signer& operator=(const Signer&) = delete;

  const std::string& key_id() const noexcept { return key_id_; }

  /**
   * @brief Signs @p data; returns the raw 64-byte r||s signature.
   *
   * ECDSA is randomized: two signatures over the same data differ.
   */
  std::vector<std::uint8_t> Sign(std::span<const std::uint8_t> data) const;

  std::vector<std::uint8_t> Sign(std::string_view data) const {
    return Sign(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(data.data()), data.size()));
  }

  std::vector<std::uint8_t> PrivateKeyBytes() const;

  // 65-byte uncompressed SEC1 point.
  const std::vector<std::uint8_t>& PublicKeyBytes() const noexcept { return public_key_; }

  std::string ToPem() const;

  Verifier GetVerifier() const;

 private:
  Signer(KeyPtr key, std::vector<std::uint8_t> public_key);

  KeyPtr key_;
  std::vector<std::uint8_t> public_key_;
  std::string key_id_;
};

} // namespace makoto::signing
