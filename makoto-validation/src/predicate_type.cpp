#include "makoto/validation/predicate_type.h"

namespace makoto::validation {

PredicateType ParsePredicateType(std::string_view uri) noexcept {
  if (uri == kOriginPredicateUri) return PredicateType::Origin;
  if (uri == kTransformPredicateUri) return PredicateType::Transform;
  if (uri == kStreamWindowPredicateUri) return PredicateType::StreamWindow;
  return PredicateType::Unknown;
}

std::optional<std::string_view> ToUri(PredicateType type) noexcept {
  switch (type) {
    case PredicateType::Origin:
      return kOriginPredicateUri;
    case PredicateType::Transform:
      return kTransformPredicateUri;
    case PredicateType::StreamWindow:
      return kStreamWindowPredicateUri;
    case PredicateType::Unknown:
      break;
  }
  return std::nullopt;
}

const char* ToString(PredicateType type) noexcept {
  switch (type) {
    case PredicateType::Origin:
      return "origin";
    case PredicateType::Transform:
      return "transform";
    case PredicateType::StreamWindow:
      return "stream-window";
    case PredicateType::Unknown:
      break;
  }
  return "unknown";
}

} // namespace makoto::validation
