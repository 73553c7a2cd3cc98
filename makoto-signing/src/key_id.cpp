#include "makoto/signing/key_id.h"

#include "makoto/common/digest.h"

namespace makoto::signing {

std::string ComputeKeyId(std::span<const std::uint8_t> uncompressed_point) {
  return makoto::common::Sha256Hex(uncompressed_point).substr(0, kKeyIdLength);
}

} // namespace makoto::signing
