#include <makoto/common/errors.h>
#include <makoto/common/logging.h>

#include <makoto/merkle/merkle_proof.h>
#include <makoto/merkle/merkle_tree.h>

#include <makoto/signing/signed_envelope.h>
#include <makoto/signing/signer.h>
#include <makoto/signing/verifier.h>

#include <makoto/validation/attestation_type.h>
#include <makoto/validation/attestation_verifier.h>
#include <makoto/validation/statement.h>
#include <makoto/validation/verification_result.h>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace {

std::string ReadFile(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    throw std::runtime_error("cannot open " + path);
  }
  std::ostringstream contents;
  contents << f.rdbuf();
  if (f.bad()) {
    throw std::runtime_error("cannot read " + path);
  }
  return contents.str();
}

void WriteAllText(const std::string& path, const std::string& text) {
  std::ofstream f(path, std::ios::trunc);
  if (!f) {
    throw std::runtime_error("failed to open file for writing: " + path);
  }
  f << text;
  if (!f) {
    throw std::runtime_error("failed to write file: " + path);
  }
}

void PrintResult(const makoto::validation::VerificationResult& r) {
  std::cout << "valid: " << (r.valid ? "true" : "false") << "\n";
  if (r.level) {
    std::cout << "level: " << makoto::validation::ToString(*r.level) << "\n";
  }
  if (r.error_code) {
    std::cout << "error_code: " << *r.error_code << "\n";
  }

  if (!r.messages.empty()) {
    std::cout << "messages:\n";
    for (const auto& m : r.messages) {
      std::cout << "- " << m << "\n";
    }
  }

  if (!r.warnings.empty()) {
    std::cout << "warnings:\n";
    for (const auto& w : r.warnings) {
      std::cout << "- " << w << "\n";
    }
  }
}

std::string GetArgValue(int argc, char** argv, const std::string& name) {
  for (int i = 0; i < argc; ++i) {
    if (argv[i] == name) {
      if (i + 1 >= argc) {
        throw std::runtime_error("missing value for " + name);
      }
      return argv[i + 1];
    }
  }
  return {};
}

bool HasFlag(int argc, char** argv, const std::string& name) {
  for (int i = 0; i < argc; ++i) {
    if (argv[i] == name) {
      return true;
    }
  }
  return false;
}

[[noreturn]] void PrintUsageAndExit(const char* exe) {
  std::cerr << "Usage:\n"
            << "  " << exe << " demo [--verbose]\n"
            << "  " << exe << " keygen --key <private pem out> --public-key <public pem out>\n"
            << "  " << exe << " sign --key <private pem> --statement <json> --out <envelope json>\n"
            << "  " << exe << " verify --attestation <json> [--public-key <pem>]\n";
  std::exit(2);
}

// Builds a window of sensor readings, attests to its Merkle root, signs it and verifies it.
int RunDemo() {
  std::vector<std::string> records;
  for (int i = 0; i < 10; ++i) {
    records.push_back(nlohmann::json{{"sensor", "temp-" + std::to_string(i % 3)}, {"reading", 20 + i}}.dump());
  }

  const auto tree = makoto::merkle::MerkleTree::FromLeaves(records);
  std::cout << "merkle root: " << *tree.root_hex() << " (" << tree.leaf_count() << " leaves, height "
            << tree.height() << ")\n";

  const auto proof = tree.Proof(7);
  std::cout << "inclusion proof for record 7:\n"
            << nlohmann::json::parse(makoto::merkle::SerializeMerkleProofJson(proof.ToHex())).dump(2) << "\n";
  std::cout << "proof verifies: " << (tree.VerifyProof(proof) ? "true" : "false") << "\n";

  const nlohmann::json predicate = {
      {"stream", {{"id", "iot_sensors"}}},
      {"window", {{"type", "tumbling"}, {"duration", "PT1M"}}},
      {"integrity",
       {{"merkleTree", {{"algorithm", "sha256"}, {"root", *tree.root_hex()}, {"leafCount", tree.leaf_count()}}}}},
  };

  const auto statement = makoto::validation::MakeStatement(
      {makoto::validation::Subject{.name = "stream:iot_sensors:window_0001", .digest = {{"sha256", *tree.root_hex()}}}},
      makoto::validation::PredicateType::StreamWindow, predicate);

  const auto signer = makoto::signing::Signer::Generate();
  const auto envelope = makoto::signing::Sign(statement, signer);
  std::cout << "signed with key " << signer.key_id() << "\n";

  const auto result = makoto::validation::VerifySignedAttestation(envelope, signer.GetVerifier());
  PrintResult(result);
  return result.valid ? 0 : 1;
}

int RunKeygen(int argc, char** argv) {
  const std::string key_path = GetArgValue(argc, argv, "--key");
  const std::string public_path = GetArgValue(argc, argv, "--public-key");
  if (key_path.empty() || public_path.empty()) {
    PrintUsageAndExit(argv[0]);
  }

  const auto signer = makoto::signing::Signer::Generate();
  WriteAllText(key_path, signer.ToPem());
  WriteAllText(public_path, signer.GetVerifier().ToPem());
  std::cout << "key id: " << signer.key_id() << "\n";
  return 0;
}

int RunSign(int argc, char** argv) {
  const std::string key_path = GetArgValue(argc, argv, "--key");
  const std::string statement_path = GetArgValue(argc, argv, "--statement");
  const std::string out_path = GetArgValue(argc, argv, "--out");
  if (key_path.empty() || statement_path.empty() || out_path.empty()) {
    PrintUsageAndExit(argv[0]);
  }

  const auto signer = makoto::signing::Signer::FromPem(ReadFile(key_path));
  const auto envelope = makoto::signing::SignPayload(ReadFile(statement_path), signer);
  WriteAllText(out_path, makoto::signing::SerializeSignedEnvelope(envelope));
  std::cout << "signed with key " << signer.key_id() << "\n";
  return 0;
}

int RunVerify(int argc, char** argv) {
  const std::string attestation_path = GetArgValue(argc, argv, "--attestation");
  if (attestation_path.empty()) {
    PrintUsageAndExit(argv[0]);
  }
  const std::string text = ReadFile(attestation_path);
  const std::string public_key_path = GetArgValue(argc, argv, "--public-key");

  makoto::validation::VerificationResult result;
  if (public_key_path.empty()) {
    result = makoto::validation::VerifyAttestationJson(text);
  } else {
    const auto verifier = makoto::signing::Verifier::FromPem(ReadFile(public_key_path));
    result = makoto::validation::VerifySignedAttestation(makoto::signing::ParseSignedEnvelope(text), verifier);
  }

  PrintResult(result);
  return result.valid ? 0 : 1;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    PrintUsageAndExit(argv[0]);
  }

  makoto::common::LoggingOptions logging;
  if (HasFlag(argc, argv, "--verbose")) {
    logging.level = spdlog::level::debug;
  }
  makoto::common::ConfigureLogging(logging);

  const std::string mode = argv[1];
  try {
    if (mode == "demo") {
      return RunDemo();
    }
    if (mode == "keygen") {
      return RunKeygen(argc, argv);
    }
    if (mode == "sign") {
      return RunSign(argc, argv);
    }
    if (mode == "verify") {
      return RunVerify(argc, argv);
    }
  } catch (const makoto::common::MakotoError& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  PrintUsageAndExit(argv[0]);
}
