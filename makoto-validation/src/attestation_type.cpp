#include "makoto/validation/attestation_type.h"

#include <string>

#include "makoto/common/errors.h"
#include "makoto/validation/predicate_type.h"

namespace makoto::validation {

const char* ToString(AttestationType type) noexcept {
  switch (type) {
    case AttestationType::Origin:
      return "origin";
    case AttestationType::Transform:
      return "transform";
    case AttestationType::StreamWindow:
      return "stream-window";
    case AttestationType::Dbom:
      return "dbom";
    case AttestationType::Signed:
      return "signed";
  }
  return "unknown";
}

AttestationType DetectAttestationType(const nlohmann::json& doc) {
  if (doc.is_object()) {
    if (doc.contains("payloadType") && doc.contains("signatures")) {
      return AttestationType::Signed;
    }

    const auto it = doc.find("predicateType");
    if (it != doc.end() && it->is_string()) {
      switch (ParsePredicateType(it->get_ref<const std::string&>())) {
        case PredicateType::Origin:
          return AttestationType::Origin;
        case PredicateType::Transform:
          return AttestationType::Transform;
        case PredicateType::StreamWindow:
          return AttestationType::StreamWindow;
        case PredicateType::Unknown:
          break;
      }
    }

    if (doc.contains("dbomVersion") && doc.contains("dbomId")) {
      return AttestationType::Dbom;
    }
  }

  throw makoto::common::InvalidAttestationError("Unknown attestation type");
}

AttestationType DetectAttestationTypeFromJson(std::string_view json_text) {
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(json_text);
  } catch (const nlohmann::json::parse_error& e) {
    throw makoto::common::InvalidAttestationError(std::string("Invalid JSON: ") + e.what());
  }
  return DetectAttestationType(doc);
}

} // namespace makoto::validation
