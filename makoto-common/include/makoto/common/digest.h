// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file digest.h
 * @brief SHA-256 digest primitive shared by the Merkle engine, key identifiers and verifiers.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace makoto::common {

constexpr std::size_t kSha256Size = 32;
constexpr std::size_t kSha256HexLength = kSha256Size * 2;

using Digest = std::array<std::uint8_t, kSha256Size>;

Digest Sha256(std::span<const std::uint8_t> data);

inline Digest Sha256(std::string_view text) {
  return Sha256(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

std::string Sha256Hex(std::span<const std::uint8_t> data);

inline std::string Sha256Hex(std::string_view text) {
  return Sha256Hex(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

std::string ToHex(const Digest& digest);

/**
 * @brief Parses a hex-encoded SHA-256 digest.
 * @throws InvalidAttestationError if @p hex is not valid hex or does not decode to exactly 32 bytes.
 */
Digest DigestFromHex(std::string_view hex);

/**
 * @brief Checks that sha256(@p data) equals @p expected_hex.
 * @return true on match.
 * @throws HashMismatchError carrying both hex values on mismatch.
 */
bool VerifyDigest(std::string_view expected_hex, std::span<const std::uint8_t> data);

// Case-insensitive comparison of two hex digest strings.
bool DigestHexEquals(std::string_view a, std::string_view b) noexcept;

} // namespace makoto::common
