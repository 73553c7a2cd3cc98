#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <openssl/evp.h>

namespace makoto::internal {

using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;

constexpr std::size_t kP256ScalarSize = 32;
constexpr std::size_t kP256UncompressedPointSize = 65;
constexpr std::size_t kP256RawSignatureSize = 64;

// Fresh P-256 key pair from OpenSSL's CSPRNG. Null on failure.
EvpPkeyPtr GenerateEcP256Key();

// Rebuilds a P-256 key pair from a big-endian private scalar.
// Null unless the scalar is 32 bytes and lies in [1, n-1].
EvpPkeyPtr EcP256KeyFromPrivateScalar(std::span<const std::uint8_t> scalar);

// Public-only P-256 key from a SEC1 point (compressed or uncompressed). Null if not on the curve.
EvpPkeyPtr EcP256KeyFromPublicPoint(std::span<const std::uint8_t> sec1);

// Loads a SubjectPublicKeyInfo PEM. Null unless it holds a P-256 key.
EvpPkeyPtr LoadEcP256PublicKeyFromPem(const std::string& pem);

std::optional<std::vector<std::uint8_t>> ExportUncompressedPublicPoint(EVP_PKEY* key);
std::optional<std::vector<std::uint8_t>> ExportPrivateScalar(EVP_PKEY* key);

// ECDSA signatures travel as raw r||s; OpenSSL speaks DER.
std::optional<std::vector<std::uint8_t>> EcdsaRawToDer(std::span<const std::uint8_t> raw_sig);
std::optional<std::vector<std::uint8_t>> EcdsaDerToRaw(std::span<const std::uint8_t> der_sig, std::size_t component_size);

// ECDSA P-256 over SHA-256. Returns the raw 64-byte r||s form.
std::optional<std::vector<std::uint8_t>> SignEs256(EVP_PKEY* key, std::span<const std::uint8_t> data);

bool VerifyEs256(EVP_PKEY* key, std::span<const std::uint8_t> data, std::span<const std::uint8_t> raw_sig);

} // namespace makoto::internal
