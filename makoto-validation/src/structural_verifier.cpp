#include "makoto/validation/structural_verifier.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "makoto/common/digest.h"
#include "makoto/common/encoding.h"
#include "makoto/common/errors.h"
#include "makoto/common/logging.h"
#include "makoto/validation/predicate_type.h"

namespace makoto::validation {

namespace {

using Path = std::initializer_list<const char*>;

std::shared_ptr<spdlog::logger> Logger() {
  static const auto logger = makoto::common::GetLogger("makoto:validation");
  return logger;
}

/**
 * Accumulates failures for one document, honouring stop_on_first_failure.
 */
class StructureChecker {
 public:
  explicit StructureChecker(const StructuralVerifyOptions& options) : options_(options) {}

  const StructuralVerifyOptions& options() const noexcept { return options_; }

  bool stopped() const noexcept { return options_.stop_on_first_failure && !failures_.empty(); }

  void Fail(std::string message, std::string error_code) {
    if (stopped()) {
      return;
    }
    failures_.push_back(Failure{std::move(message), std::move(error_code)});
  }

  void Warn(std::string warning) { warnings_.push_back(std::move(warning)); }

  VerificationResult Finish(const char* kind, std::string success_message) const {
    if (failures_.empty()) {
      auto result = VerificationResult::Pass(MakotoLevel::L1);
      result.WithMessage(std::move(success_message));
      result.warnings = warnings_;
      return result;
    }

    Logger()->debug("{} structure check failed with {} issue(s): {}", kind, failures_.size(),
                    failures_.front().message);

    VerificationResult result;
    result.valid = false;
    result.error_code = failures_.front().error_code;
    for (const auto& f : failures_) {
      result.messages.push_back(f.message);
    }
    result.warnings = warnings_;
    return result;
  }

 private:
  struct Failure {
    std::string message;
    std::string error_code;
  };

  StructuralVerifyOptions options_;
  std::vector<Failure> failures_;
  std::vector<std::string> warnings_;
};

std::string JoinPath(Path path) {
  std::string out;
  for (const char* key : path) {
    if (!out.empty()) {
      out.push_back('.');
    }
    out += key;
  }
  return out;
}

// Follows object keys; null counts as absent.
const nlohmann::json* Lookup(const nlohmann::json& root, Path path) {
  const nlohmann::json* cur = &root;
  for (const char* key : path) {
    if (!cur->is_object()) {
      return nullptr;
    }
    const auto it = cur->find(key);
    if (it == cur->end() || it->is_null()) {
      return nullptr;
    }
    cur = &*it;
  }
  return cur;
}

const nlohmann::json* RequireKind(StructureChecker& c,
                                  const nlohmann::json& root,
                                  Path path,
                                  nlohmann::json::value_t kind,
                                  const char* kind_name) {
  const nlohmann::json* v = Lookup(root, path);
  if (!v) {
    c.Fail("Missing required field: " + JoinPath(path), "MISSING_FIELD");
    return nullptr;
  }
  if (v->type() != kind) {
    c.Fail("Field " + JoinPath(path) + " must be " + kind_name, "INVALID_FIELD_TYPE");
    return nullptr;
  }
  return v;
}

const nlohmann::json* RequireObject(StructureChecker& c, const nlohmann::json& root, Path path) {
  return RequireKind(c, root, path, nlohmann::json::value_t::object, "an object");
}

const nlohmann::json* RequireArray(StructureChecker& c, const nlohmann::json& root, Path path) {
  return RequireKind(c, root, path, nlohmann::json::value_t::array, "an array");
}

// Non-empty string, or nullptr after recording a failure.
const std::string* RequireString(StructureChecker& c, const nlohmann::json& root, Path path) {
  const nlohmann::json* v = RequireKind(c, root, path, nlohmann::json::value_t::string, "a string");
  if (!v) {
    return nullptr;
  }
  const auto& s = v->get_ref<const std::string&>();
  if (s.empty()) {
    c.Fail("Field " + JoinPath(path) + " is empty", "EMPTY_FIELD");
    return nullptr;
  }
  return &s;
}

void CheckSha256Hex(StructureChecker& c, const std::string& value, const std::string& what) {
  if (value.size() != makoto::common::kSha256HexLength) {
    c.Fail("Invalid SHA-256 hash length for " + what + ": expected " +
               std::to_string(makoto::common::kSha256HexLength) + ", got " + std::to_string(value.size()),
           "INVALID_DIGEST_LENGTH");
    return;
  }
  if (!makoto::common::IsHexString(value)) {
    c.Fail("Invalid SHA-256 hash for " + what + ": not a hex string", "INVALID_DIGEST_ENCODING");
  }
}

/**
 * Checks an array of {name, digest: {sha256}} entries, e.g. "subject" or "predicate.inputs".
 */
void CheckNamedDigests(StructureChecker& c,
                       const nlohmann::json& doc,
                       Path path,
                       const char* noun,
                       const char* empty_message,
                       const char* empty_code) {
  const nlohmann::json* items = RequireArray(c, doc, path);
  if (!items) {
    return;
  }
  if (items->empty()) {
    c.Fail(empty_message, empty_code);
    return;
  }

  const std::string base = JoinPath(path);
  for (std::size_t i = 0; i < items->size() && !c.stopped(); ++i) {
    const auto& item = (*items)[i];
    const std::string at = base + "[" + std::to_string(i) + "]";

    const nlohmann::json* name = Lookup(item, {"name"});
    if (!name || !name->is_string() || name->get_ref<const std::string&>().empty()) {
      c.Fail("Missing required field: " + at + ".name", "MISSING_FIELD");
      continue;
    }

    const nlohmann::json* sha256 = Lookup(item, {"digest", "sha256"});
    if (!sha256 || !sha256->is_string()) {
      c.Fail("Missing required field: " + at + ".digest.sha256", "MISSING_FIELD");
      continue;
    }

    CheckSha256Hex(c, sha256->get_ref<const std::string&>(),
                   std::string(noun) + " '" + name->get_ref<const std::string&>() + "'");
  }
}

void CheckStatementHeader(StructureChecker& c, const nlohmann::json& doc, PredicateType expected) {
  if (c.options().require_statement_type) {
    if (const std::string* type = RequireString(c, doc, {"_type"})) {
      if (*type != kStatementTypeV1) {
        c.Fail("Invalid statement type: expected " + std::string(kStatementTypeV1) + ", got " + *type,
               "INVALID_STATEMENT_TYPE");
      }
    }
  }

  if (const std::string* predicate_type = RequireString(c, doc, {"predicateType"})) {
    if (ParsePredicateType(*predicate_type) != expected) {
      c.Fail("Invalid predicate type: expected " + std::string(ToUri(expected).value_or("unknown")) + ", got " +
                 *predicate_type,
             "INVALID_PREDICATE_TYPE");
    }
  }

  RequireObject(c, doc, {"predicate"});

  CheckNamedDigests(c, doc, {"subject"}, "subject", "No subjects in attestation", "EMPTY_SUBJECTS");
}

// Calls @p fn(name, sha256) for every entry of the array at @p path that carries both as strings.
template <typename Fn>
void ForEachNamedDigest(const nlohmann::json& doc, Path path, Fn&& fn) {
  const nlohmann::json* items = Lookup(doc, path);
  if (!items || !items->is_array()) {
    return;
  }
  for (const auto& item : *items) {
    const nlohmann::json* name = Lookup(item, {"name"});
    const nlohmann::json* sha256 = Lookup(item, {"digest", "sha256"});
    if (!name || !name->is_string() || !sha256 || !sha256->is_string()) {
      continue;
    }
    const auto& n = name->get_ref<const std::string&>();
    const auto& h = sha256->get_ref<const std::string&>();
    if (!n.empty() && !h.empty()) {
      fn(n, h);
    }
  }
}

} // namespace

VerificationResult VerifyOriginStructure(const nlohmann::json& doc, const StructuralVerifyOptions& options) {
  StructureChecker c(options);
  CheckStatementHeader(c, doc, PredicateType::Origin);

  RequireString(c, doc, {"predicate", "origin", "source"});
  RequireString(c, doc, {"predicate", "origin", "sourceType"});
  RequireString(c, doc, {"predicate", "origin", "collectionMethod"});
  RequireString(c, doc, {"predicate", "origin", "collectionTimestamp"});
  RequireString(c, doc, {"predicate", "collector", "id"});

  return c.Finish("origin", "Origin attestation structure is valid");
}

VerificationResult VerifyTransformStructure(const nlohmann::json& doc, const StructuralVerifyOptions& options) {
  StructureChecker c(options);
  CheckStatementHeader(c, doc, PredicateType::Transform);

  CheckNamedDigests(c, doc, {"predicate", "inputs"}, "input", "No inputs in transform attestation", "EMPTY_INPUTS");
  RequireString(c, doc, {"predicate", "transform", "type"});
  RequireString(c, doc, {"predicate", "transform", "name"});
  RequireString(c, doc, {"predicate", "executor", "id"});

  return c.Finish("transform", "Transform attestation structure is valid");
}

VerificationResult VerifyStreamWindowStructure(const nlohmann::json& doc, const StructuralVerifyOptions& options) {
  StructureChecker c(options);
  CheckStatementHeader(c, doc, PredicateType::StreamWindow);

  RequireString(c, doc, {"predicate", "stream", "id"});
  RequireString(c, doc, {"predicate", "window", "type"});
  RequireString(c, doc, {"predicate", "window", "duration"});

  if (RequireObject(c, doc, {"predicate", "integrity", "merkleTree"})) {
    RequireString(c, doc, {"predicate", "integrity", "merkleTree", "algorithm"});

    if (const std::string* root = RequireString(c, doc, {"predicate", "integrity", "merkleTree", "root"})) {
      CheckSha256Hex(c, *root, "Merkle root");
    }

    const nlohmann::json* leaf_count = Lookup(doc, {"predicate", "integrity", "merkleTree", "leafCount"});
    if (!leaf_count) {
      c.Fail("Missing required field: predicate.integrity.merkleTree.leafCount", "MISSING_FIELD");
    } else if (!leaf_count->is_number_integer() ||
               (!leaf_count->is_number_unsigned() && leaf_count->get<std::int64_t>() < 0)) {
      c.Fail("Field predicate.integrity.merkleTree.leafCount must be a non-negative integer", "INVALID_FIELD_TYPE");
    } else if (leaf_count->get<std::uint64_t>() == 0) {
      c.Fail("Merkle tree has no leaves", "EMPTY_MERKLE_TREE");
    }
  }

  if (const nlohmann::json* chain = Lookup(doc, {"predicate", "integrity", "chain"})) {
    if (!chain->is_object()) {
      c.Fail("Field predicate.integrity.chain must be an object", "INVALID_FIELD_TYPE");
    } else {
      const nlohmann::json* prev_id = Lookup(*chain, {"previousWindowId"});
      const nlohmann::json* prev_root = Lookup(*chain, {"previousMerkleRoot"});

      if (prev_root) {
        if (!prev_root->is_string()) {
          c.Fail("Field predicate.integrity.chain.previousMerkleRoot must be a string", "INVALID_FIELD_TYPE");
        } else {
          CheckSha256Hex(c, prev_root->get_ref<const std::string&>(), "previous Merkle root");
        }
      }

      if (prev_id && (!prev_id->is_string() || prev_id->get_ref<const std::string&>().empty())) {
        c.Fail("Previous window ID is empty", "INVALID_CHAIN");
      }

      if ((prev_id == nullptr) != (prev_root == nullptr)) {
        c.Warn("Chain back-reference is incomplete: previousWindowId and previousMerkleRoot should be set together");
      }
    }
  }

  return c.Finish("stream-window", "Stream window attestation structure is valid");
}

VerificationResult VerifyDbomStructure(const nlohmann::json& doc, const StructuralVerifyOptions& options) {
  StructureChecker c(options);

  RequireString(c, doc, {"dbomVersion"});
  if (const std::string* id = RequireString(c, doc, {"dbomId"})) {
    if (!id->starts_with("urn:dbom:")) {
      c.Fail("DBOM ID must start with 'urn:dbom:'", "INVALID_DBOM_ID");
    }
  }

  if (RequireObject(c, doc, {"dataset"})) {
    RequireString(c, doc, {"dataset", "name"});
  }

  if (const nlohmann::json* sources = RequireArray(c, doc, {"sources"})) {
    if (sources->empty()) {
      c.Fail("DBOM has no sources", "EMPTY_SOURCES");
    }
    for (std::size_t i = 0; i < sources->size() && !c.stopped(); ++i) {
      const nlohmann::json* name = Lookup((*sources)[i], {"name"});
      if (!name || !name->is_string() || name->get_ref<const std::string&>().empty()) {
        c.Fail("Missing required field: sources[" + std::to_string(i) + "].name", "MISSING_FIELD");
      }
    }
  }

  return c.Finish("dbom", "DBOM structure is valid");
}

VerificationResult VerifyStructure(const nlohmann::json& doc, AttestationType type, const StructuralVerifyOptions& options) {
  switch (type) {
    case AttestationType::Origin:
      return VerifyOriginStructure(doc, options);
    case AttestationType::Transform:
      return VerifyTransformStructure(doc, options);
    case AttestationType::StreamWindow:
      return VerifyStreamWindowStructure(doc, options);
    case AttestationType::Dbom:
      return VerifyDbomStructure(doc, options);
    case AttestationType::Signed:
      break;
  }
  return VerificationResult::Fail("Signed attestations require a verifier key", "VERIFIER_REQUIRED");
}

VerificationResult VerifyStatementChain(const std::vector<nlohmann::json>& statements,
                                        const StructuralVerifyOptions& options) {
  StructureChecker c(options);
  std::map<std::string, std::string, std::less<>> known_outputs;

  for (std::size_t i = 0; i < statements.size() && !c.stopped(); ++i) {
    const auto& doc = statements[i];
    const std::string prefix = "Statement " + std::to_string(i) + ": ";

    AttestationType type = AttestationType::Origin;
    try {
      type = DetectAttestationType(doc);
    } catch (const makoto::common::InvalidAttestationError& e) {
      c.Fail(prefix + e.what(), "UNKNOWN_TYPE");
      continue;
    }

    const auto result = VerifyStructure(doc, type, options);
    if (!result.valid) {
      for (const auto& m : result.messages) {
        c.Fail(prefix + m, result.error_code.value_or("INVALID_STRUCTURE"));
      }
    }
    for (const auto& w : result.warnings) {
      c.Warn(prefix + w);
    }

    // Inputs are matched against the outputs of earlier statements only.
    if (type == AttestationType::Transform) {
      ForEachNamedDigest(doc, {"predicate", "inputs"}, [&](const std::string& name, const std::string& sha256) {
        const auto it = known_outputs.find(name);
        if (it == known_outputs.end()) {
          c.Warn(prefix + "Input " + name + " not found in previous outputs");
        } else if (!makoto::common::DigestHexEquals(it->second, sha256)) {
          c.Fail(prefix + "Input " + name + " hash mismatch with known output", "CHAIN_HASH_MISMATCH");
        }
      });
    }

    ForEachNamedDigest(doc, {"subject"}, [&](const std::string& name, const std::string& sha256) {
      known_outputs[name] = sha256;
    });
  }

  return c.Finish("chain", "Attestation chain of " + std::to_string(statements.size()) + " statement(s) is valid");
}

} // namespace makoto::validation
