#include "pem_armor.h"

#include <cstddef>

#include "makoto/common/encoding.h"

namespace makoto::internal {

namespace {
constexpr std::size_t kLineWidth = 64;

std::string BeginMarker(std::string_view label) {
  return "-----BEGIN " + std::string(label) + "-----";
}

std::string EndMarker(std::string_view label) {
  return "-----END " + std::string(label) + "-----";
}

std::vector<std::string_view> SplitLines(std::string_view text) {
  std::vector<std::string_view> lines;
  std::size_t start = 0;
  while (start <= text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    std::string_view line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    if (!line.empty()) {
      lines.push_back(line);
    }
    start = end + 1;
  }
  return lines;
}

} // namespace

std::string WritePemArmor(std::string_view label, std::span<const std::uint8_t> data) {
  const std::string encoded = makoto::common::Base64Encode(data);

  std::string out = BeginMarker(label);
  out.push_back('\n');
  for (std::size_t i = 0; i < encoded.size(); i += kLineWidth) {
    out.append(encoded, i, kLineWidth);
    out.push_back('\n');
  }
  out += EndMarker(label);
  out.push_back('\n');
  return out;
}

std::optional<std::vector<std::uint8_t>> ReadPemArmor(std::string_view pem, std::string_view label) {
  const auto lines = SplitLines(pem);
  if (lines.size() < 2) {
    return std::nullopt;
  }
  if (lines.front() != BeginMarker(label) || lines.back() != EndMarker(label)) {
    return std::nullopt;
  }

  std::string body;
  for (std::size_t i = 1; i + 1 < lines.size(); ++i) {
    // No RFC 1421 style "Name: value" headers.
    if (lines[i].find(':') != std::string_view::npos || lines[i].starts_with("-----")) {
      return std::nullopt;
    }
    body.append(lines[i]);
  }

  auto decoded = makoto::common::Base64Decode(body);
  if (!decoded || decoded->empty()) {
    return std::nullopt;
  }
  return decoded;
}

} // namespace makoto::internal
