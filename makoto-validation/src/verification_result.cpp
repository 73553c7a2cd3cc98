#include "makoto/validation/verification_result.h"

namespace makoto::validation {

const char* ToString(MakotoLevel level) noexcept {
  switch (level) {
    case MakotoLevel::L1:
      return "L1";
    case MakotoLevel::L2:
      return "L2";
    case MakotoLevel::L3:
      return "L3";
  }
  return "unknown";
}

} // namespace makoto::validation
