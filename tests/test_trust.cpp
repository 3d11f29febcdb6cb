#include <algorithm>
#include <array>
#include <cassert>
#include <iostream>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "warden/analysis/analyzer.h"
#include "warden/crypto/provider.h"
#include "warden/error.h"
#include "warden/orchestrator/event_bus.h"
#include "warden/trust/security_analyzer.h"
#include "warden/trust/signing.h"
#include "warden/trust/trust_store.h"
#include "warden/trust/verification.h"

namespace {

using namespace warden::trust;

std::span<const uint8_t> Bytes(const std::string& text) {
  return std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

bool Has(const std::vector<std::string>& values, const std::string& needle) {
  return std::find(values.begin(), values.end(), needle) != values.end();
}

const std::string kCode = "def validate(values):\n    return {'passed': True}\n";

TrustedSigner HmacSigner(std::string id, std::vector<uint8_t> secret, TrustLevel level = TrustLevel::kVerified) {
  TrustedSigner signer;
  signer.signer_id = std::move(id);
  signer.algorithm = SignatureAlgorithm::kHmacSha256;
  signer.public_key = std::move(secret);
  signer.trust_level = level;
  return signer;
}

void TestHmacChain(const std::shared_ptr<warden::crypto::CryptoProvider>& crypto) {
  std::vector<uint8_t> secret(32, 0x5a);
  TrustStore store;
  store.AddSigner(HmacSigner("s1", secret));

  auto signature = Sign(*crypto, SignatureAlgorithm::kHmacSha256, Bytes(kCode), secret, "s1");
  assert(signature.signer_id == "s1");
  assert(signature.signature.size() == 64);

  auto chain = CreateVerificationChain(store, crypto);
  assert(chain.size() == 3);
  auto result = chain.Verify(Bytes(kCode), {signature});
  assert(result.is_valid);
  assert(result.signer_id == "s1");
  assert(result.trust_level == TrustLevel::kVerified);
  assert(result.metadata["valid_signatures"] == 1);

  // Anonymous signatures are tried against every usable signer.
  auto anonymous = signature;
  anonymous.signer_id.clear();
  auto resolved = chain.Verify(Bytes(kCode), {anonymous});
  assert(resolved.is_valid);
  assert(resolved.signer_id == "s1");

  std::vector<uint8_t> other(32, 0x01);
  auto forged = Sign(*crypto, SignatureAlgorithm::kHmacSha256, Bytes(kCode), other, "s1");
  auto rejected = chain.Verify(Bytes(kCode), {forged});
  assert(!rejected.is_valid);
  assert(Has(rejected.errors, "No matching trusted signer"));

  auto tampered = chain.Verify(Bytes(kCode + "# changed\n"), {signature});
  assert(!tampered.is_valid);

  auto none = chain.Verify(Bytes(kCode), {});
  assert(!none.is_valid);
  assert(Has(none.errors, "No signatures provided"));

  store.RevokeSigner("s1");
  auto revoked = chain.Verify(Bytes(kCode), {signature});
  assert(!revoked.is_valid);
  assert(store.GetTrustLevel("s1") == TrustLevel::kUnverified);
  assert(!store.GetPublicKey("s1"));
}

void TestEd25519(const std::shared_ptr<warden::crypto::CryptoProvider>& crypto) {
  std::array<uint8_t, warden::crypto::kEd25519KeySize> seed{};
  crypto->RandomBytes(seed);
  auto public_key = crypto->Ed25519PublicKey(seed);

  TrustStore store;
  TrustedSigner signer;
  signer.signer_id = "release";
  signer.algorithm = SignatureAlgorithm::kEd25519;
  signer.public_key.assign(public_key.begin(), public_key.end());
  signer.trust_level = TrustLevel::kTrusted;
  store.AddSigner(signer);

  auto signature = Sign(*crypto, SignatureAlgorithm::kEd25519, Bytes(kCode), seed, "release");
  assert(signature.signature.size() == 128);

  auto direct = VerifySignature(*crypto, Bytes(kCode), signature, std::span<const uint8_t>(signer.public_key));
  assert(direct.is_valid);

  warden::analysis::AnalysisCache cache(8, crypto);
  auto chain = CreateVerificationChain(store, crypto, 1, &cache);
  assert(chain.size() == 4);
  auto result = chain.Verify(Bytes(kCode), {signature});
  assert(result.is_valid);
  assert(result.trust_level == TrustLevel::kTrusted);

  // Valid signature over unsafe code stops at the code safety stage.
  const std::string unsafe = "import os\nos.system('true')\n";
  auto unsafe_signature = Sign(*crypto, SignatureAlgorithm::kEd25519, Bytes(unsafe), seed, "release");
  auto unsafe_result = chain.Verify(Bytes(unsafe), {unsafe_signature});
  assert(!unsafe_result.is_valid);
  assert(!unsafe_result.errors.empty());
  assert(unsafe_result.errors.back().rfind("Code analysis found", 0) == 0);

  // Two signatures by the same signer count once.
  auto two_required = CreateVerificationChain(store, crypto, 2);
  auto duplicate = two_required.Verify(Bytes(kCode), {signature, signature});
  assert(!duplicate.is_valid);
  assert(duplicate.metadata["valid_signatures"] == 1);
  assert(Has(duplicate.errors, "Insufficient signatures: 1 < 2"));

  auto short_chain = two_required.Verify(Bytes(kCode), {signature});
  assert(!short_chain.is_valid);
  assert(Has(short_chain.errors, "Insufficient signatures: 1 < 2"));

  // A signature that fails verification does not count toward the minimum.
  auto garbage = signature;
  garbage.signature = std::string(signature.signature.size(), '0');
  auto with_garbage = two_required.Verify(Bytes(kCode), {signature, garbage});
  assert(!with_garbage.is_valid);
  assert(Has(with_garbage.errors, "Insufficient signatures: 1 < 2"));

  std::array<uint8_t, warden::crypto::kEd25519KeySize> second_seed{};
  crypto->RandomBytes(second_seed);
  auto second_key = crypto->Ed25519PublicKey(second_seed);
  TrustedSigner backup = signer;
  backup.signer_id = "backup";
  backup.public_key.assign(second_key.begin(), second_key.end());
  backup.trust_level = TrustLevel::kVerified;
  store.AddSigner(backup);
  auto second = Sign(*crypto, SignatureAlgorithm::kEd25519, Bytes(kCode), second_seed, "backup");
  auto both = two_required.Verify(Bytes(kCode), {signature, second});
  assert(both.is_valid);
  assert(both.metadata["valid_signatures"] == 2);
  assert(both.trust_level == TrustLevel::kTrusted);

  // The count stage has nothing to count without a cryptographic stage before it.
  auto misordered = VerificationChainBuilder().WithSignatureCount(1).Build();
  auto unchecked = misordered.Verify(Bytes(kCode), {signature});
  assert(!unchecked.is_valid);
  assert(Has(unchecked.errors, "Signature count requires a preceding cryptographic stage"));
}

void TestIntegrityOnlyAndUnsupported(const std::shared_ptr<warden::crypto::CryptoProvider>& crypto) {
  auto digest = Sign(*crypto, SignatureAlgorithm::kSha256, Bytes(kCode), {}, "anyone");
  assert(IsIntegrityOnly(digest.algorithm));
  auto direct = VerifySignature(*crypto, Bytes(kCode), digest, std::nullopt);
  assert(direct.is_valid);
  assert(direct.trust_level == TrustLevel::kUnverified);

  TrustStore store;
  auto chain = CreateVerificationChain(store, crypto);
  auto result = chain.Verify(Bytes(kCode), {digest});
  assert(!result.is_valid);
  assert(Has(result.errors, "No matching trusted signer"));
  assert(!result.warnings.empty());

  bool threw = false;
  try {
    (void)Sign(*crypto, SignatureAlgorithm::kRsaSha256, Bytes(kCode), {}, "rsa");
  } catch (const warden::Error& err) {
    threw = err.domain == warden::ErrorDomain::Config;
  }
  assert(threw);

  SignatureInfo rsa;
  rsa.algorithm = SignatureAlgorithm::kRsaSha256;
  rsa.signature = "00";
  assert(!VerifySignature(*crypto, Bytes(kCode), rsa, std::nullopt).is_valid);

  bool hmac_threw = false;
  try {
    (void)Sign(*crypto, SignatureAlgorithm::kHmacSha256, Bytes(kCode), {}, "s1");
  } catch (const warden::Error& err) {
    hmac_threw = err.domain == warden::ErrorDomain::Validation;
  }
  assert(hmac_threw);
}

void TestSignatureJson() {
  SignatureInfo info;
  info.algorithm = SignatureAlgorithm::kHmacSha512;
  info.signature = "abcd";
  info.signer_id = "s2";
  info.timestamp = 1700000000;
  auto parsed = SignatureInfo::FromJson(info.ToJson());
  assert(parsed.algorithm == SignatureAlgorithm::kHmacSha512);
  assert(parsed.signer_id == "s2");
  assert(parsed.timestamp == 1700000000);

  bool threw = false;
  try {
    (void)SignatureInfo::FromJson(nlohmann::json{{"algorithm", "md5"}, {"signature", "00"}});
  } catch (const warden::Error& err) {
    threw = err.domain == warden::ErrorDomain::Validation;
  }
  assert(threw);
}

void TestTrustFile() {
  const std::string key(64, 'a');
  const std::string text =
      "# release signers\n"
      "signer:release=ed25519:" + key + ":trusted\n"
      "name:release=Release Bot\n"
      "org:release=Example Org\n"
      "\n"
      "signer:ci=hmac_sha256:00112233\n"
      "expires:ci=1\n"
      "signer:old=hmac_sha256:ffff:verified\n"
      "revoke:old\n";
  auto signers = ParseTrustFile(text);
  assert(signers.size() == 3);
  assert(signers[0].signer_id == "release");
  assert(signers[0].trust_level == TrustLevel::kTrusted);
  assert(signers[0].name == "Release Bot");
  assert(signers[0].organization == "Example Org");
  assert(signers[0].public_key.size() == 32);
  assert(signers[1].trust_level == TrustLevel::kVerified);
  assert(signers[1].expires_at && *signers[1].expires_at == 1);
  assert(signers[2].revoked);

  warden::orchestrator::EventBus bus;
  std::vector<std::string> events;
  bus.Subscribe([&events](const warden::orchestrator::Event& e) { events.push_back(e.event_id); });
  TrustStore store(&bus);
  for (auto& signer : signers) {
    store.AddSigner(signer);
  }
  assert(store.IsTrusted("release"));
  assert(!store.IsTrusted("ci"));
  assert(store.GetTrustLevel("old") == TrustLevel::kUnverified);
  assert(store.UsableSigners().size() == 1);
  assert(events.size() == 3);
  assert(events[0] == "signer_added");

  auto expect_line_error = [](const std::string& bad, const std::string& fragment) {
    bool threw = false;
    try {
      (void)ParseTrustFile(bad);
    } catch (const warden::Error& err) {
      threw = err.domain == warden::ErrorDomain::Config &&
              std::string(err.what()).find(fragment) != std::string::npos;
    }
    assert(threw);
  };
  expect_line_error("# ok\nsigner:x=md5:00\n", "trust file line 2");
  expect_line_error("name:ghost=Nobody\n", "unknown signer 'ghost'");
  expect_line_error("signer:x=ed25519:0011\n", "32 bytes");
  expect_line_error("signer:x=hmac_sha256:zz\n", "not hex");
}

void TestStoreManagement() {
  TrustStore store;
  store.AddSigner(HmacSigner("a", std::vector<uint8_t>(16, 0x01), TrustLevel::kUnverified));
  store.AddSigner(HmacSigner("b", std::vector<uint8_t>(16, 0x02)));
  assert(!store.IsTrusted("a"));
  assert(store.SetSignerTrust("a", TrustLevel::kTrusted));
  assert(store.GetTrustLevel("a") == TrustLevel::kTrusted);
  assert(!store.SetSignerTrust("ghost", TrustLevel::kTrusted));

  // Re-adding replaces in place and keeps registration order.
  store.AddSigner(HmacSigner("a", std::vector<uint8_t>(16, 0x03), TrustLevel::kVerified));
  auto listed = store.ListSigners();
  assert(listed.size() == 2);
  assert(listed[0].signer_id == "a");
  assert(listed[0].public_key[0] == 0x03);

  assert(store.RemoveSigner("a"));
  assert(!store.RemoveSigner("a"));
  assert(!store.HasSigner("a"));
  assert(store.size() == 1);
  assert(store.ListSigners()[0].signer_id == "b");
}

void TestDeriveTrustLevel() {
  warden::analysis::AnalysisResult clean;
  clean.is_safe = true;
  assert(DeriveTrustLevel(clean, true, 1, 1) == TrustLevel::kTrusted);
  assert(DeriveTrustLevel(std::nullopt, true, 1, 1) == TrustLevel::kVerified);
  assert(DeriveTrustLevel(clean, true, 1, 2) == TrustLevel::kUnverified);
  assert(DeriveTrustLevel(clean, false, 0, 0) == TrustLevel::kUnverified);

  auto warned = clean;
  warned.warnings.push_back("Bare except clause found");
  assert(DeriveTrustLevel(warned, true, 1, 1) == TrustLevel::kVerified);

  auto unsafe = clean;
  unsafe.is_safe = false;
  unsafe.issues.push_back("Blocked function call: eval");
  assert(DeriveTrustLevel(unsafe, true, 3, 1) == TrustLevel::kSandboxed);
}

void TestSecurityAnalyzer(const std::shared_ptr<warden::crypto::CryptoProvider>& crypto) {
  warden::analysis::AnalysisCache cache(8, crypto);
  SecurityAnalyzer analyzer(std::nullopt, cache, crypto);
  auto report = analyzer.AnalyzePlugin("null_check", kCode, true, 1);
  assert(report.plugin_id == "null_check");
  assert(report.is_safe);
  assert(report.code_hash.size() == 64);
  assert(report.trust_level == TrustLevel::kTrusted);
  assert(analyzer.Validate(report).empty());

  auto risky = analyzer.AnalyzePlugin("risky", std::string_view("import socket\n"), false, 0);
  assert(!risky.is_safe);
  assert(!risky.can_run_in_sandbox);
  assert(risky.trust_level == TrustLevel::kSandboxed);
}

}  // namespace

int main() {
  auto crypto = warden::crypto::MakeOpenSSLCryptoProvider();

  TestHmacChain(crypto);
  TestEd25519(crypto);
  TestIntegrityOnlyAndUnsupported(crypto);
  TestSignatureJson();
  TestTrustFile();
  TestStoreManagement();
  TestDeriveTrustLevel();
  TestSecurityAnalyzer(crypto);

  std::cout << "trust tests ok\n";
  return 0;
}
