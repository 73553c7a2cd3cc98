// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file encoding.h
 * @brief Hex and base64 codecs used for digests, payloads, signatures and keys.
 */

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace makoto::common {

// Lowercase hex, no prefix.
std::string BytesToHexLower(std::span<const std::uint8_t> bytes);

// Accepts upper or lower case digits. Returns nullopt for odd length or non-hex characters.
std::optional<std::vector<std::uint8_t>> HexToBytes(std::string_view hex);

// True if @p s is non-empty and consists only of hex digits.
bool IsHexString(std::string_view s) noexcept;

// Standard base64 alphabet with '=' padding.
std::string Base64Encode(std::span<const std::uint8_t> bytes);

inline std::string Base64Encode(std::string_view text) {
  return Base64Encode(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

/**
 * @brief Decodes standard padded base64.
 *
 * Rejects characters outside the alphabet, missing padding and padding anywhere but the end.
 */
std::optional<std::vector<std::uint8_t>> Base64Decode(std::string_view b64);

} // namespace makoto::common
