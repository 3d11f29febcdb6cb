#include "warden/trust/verification.h"

#include <algorithm>

#include "warden/analysis/analyzer.h"
#include "warden/common.h"
#include "warden/errors.h"
#include "warden/orchestrator/event_bus.h"

namespace warden::trust {

namespace {

int Strength(TrustLevel level) {
  switch (level) {
  case TrustLevel::kTrusted:
    return 2;
  case TrustLevel::kVerified:
    return 1;
  default:
    return 0;
  }
}

}  // namespace

bool SignatureCountHandler::Handle(std::span<const uint8_t>, const std::vector<SignatureInfo>&,
                                   VerificationResult& result) {
  if (!result.metadata.contains("valid_signatures")) {
    result.errors.emplace_back("Signature count requires a preceding cryptographic stage");
    return false;
  }
  const auto valid = result.metadata["valid_signatures"].get<size_t>();
  if (valid < min_signatures_) {
    result.errors.push_back("Insufficient signatures: " + std::to_string(valid) + " < " +
                            std::to_string(min_signatures_));
    return false;
  }
  return true;
}

bool SignerTrustHandler::Handle(std::span<const uint8_t>, const std::vector<SignatureInfo>& signatures,
                                VerificationResult& result) {
  for (const auto& signature : signatures) {
    if (signature.signer_id.empty()) {
      continue;
    }
    if (!store_.HasSigner(signature.signer_id)) {
      result.warnings.push_back("Unknown signer: " + signature.signer_id);
    } else if (store_.GetTrustLevel(signature.signer_id) == TrustLevel::kUnverified) {
      result.warnings.push_back("Untrusted signer: " + signature.signer_id);
    }
  }
  return true;
}

bool CryptographicVerificationHandler::Handle(std::span<const uint8_t> data,
                                              const std::vector<SignatureInfo>& signatures,
                                              VerificationResult& result) {
  const auto now = UnixSeconds();
  std::vector<std::string> verified;
  TrustLevel strongest = TrustLevel::kUnverified;

  for (const auto& signature : signatures) {
    if (IsIntegrityOnly(signature.algorithm)) {
      auto integrity = VerifySignature(*crypto_, data, signature, std::nullopt);
      if (integrity.is_valid) {
        result.warnings.push_back("Integrity-only signature does not authenticate a signer: " +
                                  (signature.signer_id.empty() ? std::string("<anonymous>") : signature.signer_id));
      }
      continue;
    }

    std::vector<TrustedSigner> candidates;
    if (!signature.signer_id.empty()) {
      if (auto signer = store_.GetSigner(signature.signer_id); signer && signer->IsUsable(now)) {
        candidates.push_back(std::move(*signer));
      }
    } else {
      candidates = store_.UsableSigners();
    }

    for (const auto& candidate : candidates) {
      if (!KeyCompatible(candidate.algorithm, signature.algorithm)) {
        continue;
      }
      auto attempt = VerifySignature(*crypto_, data, signature, std::span<const uint8_t>(candidate.public_key));
      if (!attempt.is_valid) {
        continue;
      }
      if (std::find(verified.begin(), verified.end(), candidate.signer_id) == verified.end()) {
        verified.push_back(candidate.signer_id);
        if (Strength(candidate.trust_level) > Strength(strongest)) {
          strongest = candidate.trust_level;
        }
      }
      break;
    }
  }

  if (verified.empty()) {
    result.trust_level = TrustLevel::kUnverified;
    result.errors.emplace_back(errors::msg::kNoMatchingSigner);
    if (bus_) {
      orchestrator::Event event;
      event.category = orchestrator::EventCategory::kSecurity;
      event.severity = orchestrator::EventSeverity::kWarning;
      event.event_id = "verification_failed";
      event.message = std::string(errors::msg::kNoMatchingSigner);
      event.fields.emplace_back("signature_count", std::to_string(signatures.size()),
                                orchestrator::FieldPrivacy::kPublic, true);
      orchestrator::PublishSafely(*bus_, event);
    }
    return false;
  }

  result.signer_id = verified.front();
  result.trust_level = strongest;
  result.metadata["valid_signatures"] = verified.size();
  result.metadata["verified_signers"] = verified;
  return true;
}

bool CodeSafetyHandler::Handle(std::span<const uint8_t> data, const std::vector<SignatureInfo>&,
                               VerificationResult& result) {
  std::string_view code(reinterpret_cast<const char*>(data.data()), data.size());
  auto analysis = cache_.Analyze(code);
  result.metadata["complexity_score"] = analysis.complexity_score;
  if (!analysis.issues.empty()) {
    result.errors.push_back("Code analysis found " + std::to_string(analysis.issues.size()) + " critical issues");
    return false;
  }
  for (const auto& warning : analysis.warnings) {
    result.warnings.push_back(warning);
  }
  return true;
}

VerificationResult VerificationChain::Verify(std::span<const uint8_t> data,
                                             const std::vector<SignatureInfo>& signatures) const {
  VerificationResult result;
  if (signatures.empty()) {
    result.errors.emplace_back(errors::msg::kNoSignatures);
    return result;
  }
  if (handlers_.empty()) {
    result.errors.emplace_back("Verification chain has no stages");
    return result;
  }
  for (const auto& handler : handlers_) {
    if (!handler->Handle(data, signatures, result)) {
      return result;
    }
  }
  result.is_valid = true;
  return result;
}

VerificationChainBuilder& VerificationChainBuilder::WithSignatureCount(uint32_t min_signatures) {
  handlers_.push_back(std::make_unique<SignatureCountHandler>(min_signatures));
  return *this;
}

VerificationChainBuilder& VerificationChainBuilder::WithSignerTrust(const TrustStore& store) {
  handlers_.push_back(std::make_unique<SignerTrustHandler>(store));
  return *this;
}

VerificationChainBuilder& VerificationChainBuilder::WithCryptographicVerification(
    const TrustStore& store, std::shared_ptr<crypto::CryptoProvider> crypto, orchestrator::EventBus* bus) {
  handlers_.push_back(std::make_unique<CryptographicVerificationHandler>(store, std::move(crypto), bus));
  return *this;
}

VerificationChainBuilder& VerificationChainBuilder::WithCodeSafety(analysis::AnalysisCache& cache) {
  handlers_.push_back(std::make_unique<CodeSafetyHandler>(cache));
  return *this;
}

VerificationChain VerificationChainBuilder::Build() {
  return VerificationChain(std::move(handlers_));
}

VerificationChain CreateVerificationChain(const TrustStore& store, std::shared_ptr<crypto::CryptoProvider> crypto,
                                          uint32_t min_signatures, analysis::AnalysisCache* analyzer,
                                          orchestrator::EventBus* bus) {
  VerificationChainBuilder builder;
  builder.WithSignerTrust(store)
      .WithCryptographicVerification(store, std::move(crypto), bus)
      .WithSignatureCount(min_signatures);
  if (analyzer) {
    builder.WithCodeSafety(*analyzer);
  }
  return builder.Build();
}

}  // namespace warden::trust
