#include "makoto/common/encoding.h"

#include <openssl/evp.h>

namespace makoto::common {

namespace {

int HexValue(char c) noexcept {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

int Base64Value(char c) noexcept {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '+') return 62;
  if (c == '/') return 63;
  return -1;
}

} // namespace

std::string BytesToHexLower(std::span<const std::uint8_t> bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[i * 2] = kHex[(bytes[i] >> 4) & 0x0f];
    out[i * 2 + 1] = kHex[bytes[i] & 0x0f];
  }
  return out;
}

std::optional<std::vector<std::uint8_t>> HexToBytes(std::string_view hex) {
  if (hex.size() % 2 != 0) {
    return std::nullopt;
  }

  std::vector<std::uint8_t> out(hex.size() / 2);
  for (std::size_t i = 0; i < out.size(); ++i) {
    const int hi = HexValue(hex[i * 2]);
    const int lo = HexValue(hex[i * 2 + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return out;
}

bool IsHexString(std::string_view s) noexcept {
  if (s.empty()) {
    return false;
  }
  for (char c : s) {
    if (HexValue(c) < 0) {
      return false;
    }
  }
  return true;
}

std::string Base64Encode(std::span<const std::uint8_t> bytes) {
  if (bytes.empty()) {
    return {};
  }

  // EVP_EncodeBlock writes 4 output bytes per 3 input bytes plus a NUL terminator.
  std::string out(((bytes.size() + 2) / 3) * 4 + 1, '\0');
  const int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), bytes.data(), static_cast<int>(bytes.size()));
  out.resize(static_cast<std::size_t>(len));
  return out;
}

std::optional<std::vector<std::uint8_t>> Base64Decode(std::string_view b64) {
  if (b64.empty()) {
    return std::vector<std::uint8_t>{};
  }
  if (b64.size() % 4 != 0) {
    return std::nullopt;
  }

  std::size_t padding = 0;
  for (std::size_t i = 0; i < b64.size(); ++i) {
    const char c = b64[i];
    if (c == '=') {
      // Padding is only allowed in the final two positions.
      if (i < b64.size() - 2) {
        return std::nullopt;
      }
      ++padding;
      continue;
    }
    if (padding != 0 || Base64Value(c) < 0) {
      return std::nullopt;
    }
  }

  // Unused bits under the padding must be zero.
  if (padding == 2 && (Base64Value(b64[b64.size() - 3]) & 0x0f) != 0) {
    return std::nullopt;
  }
  if (padding == 1 && (Base64Value(b64[b64.size() - 2]) & 0x03) != 0) {
    return std::nullopt;
  }

  std::vector<std::uint8_t> out((b64.size() / 4) * 3);
  const int len = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(b64.data()), static_cast<int>(b64.size()));
  if (len < 0) {
    return std::nullopt;
  }

  // EVP_DecodeBlock does not account for '=' padding in its returned length.
  out.resize(static_cast<std::size_t>(len) - padding);
  return out;
}

} // namespace makoto::common
