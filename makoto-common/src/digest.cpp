#include "makoto/common/digest.h"

#include <algorithm>
#include <stdexcept>
#include <string>

#include <openssl/evp.h>

#include "makoto/common/encoding.h"
#include "makoto/common/errors.h"

namespace makoto::common {

Digest Sha256(std::span<const std::uint8_t> data) {
  Digest out{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) != 1 || len != kSha256Size) {
    throw std::runtime_error("EVP_Digest(sha256) failed");
  }
  return out;
}

std::string Sha256Hex(std::span<const std::uint8_t> data) {
  return ToHex(Sha256(data));
}

std::string ToHex(const Digest& digest) {
  return BytesToHexLower(digest);
}

Digest DigestFromHex(std::string_view hex) {
  const auto bytes = HexToBytes(hex);
  if (!bytes) {
    throw InvalidAttestationError("Invalid hex: '" + std::string(hex) + "'");
  }
  if (bytes->size() != kSha256Size) {
    throw InvalidAttestationError("Expected " + std::to_string(kSha256Size) + " bytes, got " +
                                  std::to_string(bytes->size()));
  }

  Digest out{};
  std::copy(bytes->begin(), bytes->end(), out.begin());
  return out;
}

bool VerifyDigest(std::string_view expected_hex, std::span<const std::uint8_t> data) {
  auto actual = Sha256Hex(data);
  if (!DigestHexEquals(expected_hex, actual)) {
    throw HashMismatchError(std::string(expected_hex), std::move(actual));
  }
  return true;
}

bool DigestHexEquals(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    const char ca = (a[i] >= 'A' && a[i] <= 'Z') ? static_cast<char>(a[i] - 'A' + 'a') : a[i];
    const char cb = (b[i] >= 'A' && b[i] <= 'Z') ? static_cast<char>(b[i] - 'A' + 'a') : b[i];
    if (ca != cb) {
      return false;
    }
  }
  return true;
}

} // namespace makoto::common
