#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace makoto::internal {

constexpr std::string_view kPrivateKeyLabel = "MAKOTO PRIVATE KEY";
constexpr std::string_view kPublicKeyLabel = "MAKOTO PUBLIC KEY";

// "-----BEGIN <label>-----", base64 body in 64-column lines, "-----END <label>-----".
std::string WritePemArmor(std::string_view label, std::span<const std::uint8_t> data);

// Inverse of WritePemArmor. Blank lines and CR line endings are tolerated; header
// fields, a mismatched label or a malformed body are not.
std::optional<std::vector<std::uint8_t>> ReadPemArmor(std::string_view pem, std::string_view label);

} // namespace makoto::internal
