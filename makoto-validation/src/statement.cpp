#include "makoto/validation/statement.h"

#include <utility>

#include "makoto/common/errors.h"

namespace makoto::validation {

namespace {

const nlohmann::json& RequireKey(const nlohmann::json& j, const char* key, const char* field) {
  if (!j.is_object() || !j.contains(key) || j.at(key).is_null()) {
    throw makoto::common::MissingFieldError(field);
  }
  return j.at(key);
}

} // namespace

Statement MakeStatement(std::vector<Subject> subjects, PredicateType predicate_type, nlohmann::json predicate) {
  if (subjects.empty()) {
    throw makoto::common::MissingFieldError("subject");
  }
  for (const auto& s : subjects) {
    if (s.name.empty()) {
      throw makoto::common::MissingFieldError("subject.name");
    }
    const auto it = s.digest.find("sha256");
    if (it == s.digest.end() || it->second.empty()) {
      throw makoto::common::MissingFieldError("subject.digest.sha256");
    }
  }

  const auto uri = ToUri(predicate_type);
  if (!uri) {
    throw makoto::common::MissingFieldError("predicateType");
  }
  if (!predicate.is_object()) {
    throw makoto::common::MissingFieldError("predicate");
  }

  Statement out;
  out.subject = std::move(subjects);
  out.predicate_type = std::string(*uri);
  out.predicate = std::move(predicate);
  return out;
}

Statement DecodeStatement(const makoto::signing::SignedEnvelope& envelope, PredicateType expected) {
  auto statement = makoto::signing::DecodePayload<Statement>(envelope);
  if (statement.kind() != expected) {
    const auto expected_uri = ToUri(expected);
    throw makoto::common::InvalidPredicateTypeError(expected_uri ? std::string(*expected_uri) : ToString(expected),
                                                    statement.predicate_type);
  }
  return statement;
}

void to_json(nlohmann::json& j, const Subject& subject) {
  j = nlohmann::json{{"name", subject.name}, {"digest", subject.digest}};
}

void from_json(const nlohmann::json& j, Subject& subject) {
  RequireKey(j, "name", "subject.name").get_to(subject.name);
  RequireKey(j, "digest", "subject.digest").get_to(subject.digest);
}

void to_json(nlohmann::json& j, const Statement& statement) {
  j = nlohmann::json{
      {"_type", statement.type},
      {"subject", statement.subject},
      {"predicateType", statement.predicate_type},
      {"predicate", statement.predicate},
  };
}

void from_json(const nlohmann::json& j, Statement& statement) {
  RequireKey(j, "_type", "_type").get_to(statement.type);
  RequireKey(j, "subject", "subject").get_to(statement.subject);
  RequireKey(j, "predicateType", "predicateType").get_to(statement.predicate_type);
  statement.predicate = RequireKey(j, "predicate", "predicate");
}

} // namespace makoto::validation
