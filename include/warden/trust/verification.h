#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

#include "warden/crypto/provider.h"
#include "warden/trust/signing.h"
#include "warden/trust/trust_store.h"

namespace warden::analysis {
class AnalysisCache;
}

namespace warden::orchestrator {
class EventBus;
}

namespace warden::trust {

// One stage of a VerificationChain. Stages append to the shared result and
// return false to stop the chain.
class VerificationHandler {
public:
  virtual ~VerificationHandler() = default;

  virtual std::string_view name() const noexcept = 0;
  virtual bool Handle(std::span<const uint8_t> data, const std::vector<SignatureInfo>& signatures,
                      VerificationResult& result) = 0;
};

// Enforces the minimum against the distinct signers the cryptographic stage
// verified, so it must follow that stage.
class SignatureCountHandler : public VerificationHandler {
public:
  explicit SignatureCountHandler(uint32_t min_signatures) : min_signatures_(min_signatures) {}

  std::string_view name() const noexcept override { return "signature_count"; }
  bool Handle(std::span<const uint8_t> data, const std::vector<SignatureInfo>& signatures,
              VerificationResult& result) override;

private:
  uint32_t min_signatures_;
};

// Warns about unknown or untrusted signers; never stops the chain.
class SignerTrustHandler : public VerificationHandler {
public:
  explicit SignerTrustHandler(const TrustStore& store) : store_(store) {}

  std::string_view name() const noexcept override { return "signer_trust"; }
  bool Handle(std::span<const uint8_t> data, const std::vector<SignatureInfo>& signatures,
              VerificationResult& result) override;

private:
  const TrustStore& store_;
};

// Recomputes each signature with the named signer's key, or with every usable
// key when the signature names nobody. Distinct verified signers are counted
// in metadata.valid_signatures.
class CryptographicVerificationHandler : public VerificationHandler {
public:
  CryptographicVerificationHandler(const TrustStore& store, std::shared_ptr<crypto::CryptoProvider> crypto,
                                   orchestrator::EventBus* bus = nullptr)
      : store_(store), crypto_(std::move(crypto)), bus_(bus) {}

  std::string_view name() const noexcept override { return "cryptographic"; }
  bool Handle(std::span<const uint8_t> data, const std::vector<SignatureInfo>& signatures,
              VerificationResult& result) override;

private:
  const TrustStore& store_;
  std::shared_ptr<crypto::CryptoProvider> crypto_;
  orchestrator::EventBus* bus_;
};

// Analyzes the signed bytes as source and fails on blocking issues.
class CodeSafetyHandler : public VerificationHandler {
public:
  explicit CodeSafetyHandler(analysis::AnalysisCache& cache) : cache_(cache) {}

  std::string_view name() const noexcept override { return "code_safety"; }
  bool Handle(std::span<const uint8_t> data, const std::vector<SignatureInfo>& signatures,
              VerificationResult& result) override;

private:
  analysis::AnalysisCache& cache_;
};

class VerificationChain {
public:
  VerificationChain() = default;
  explicit VerificationChain(std::vector<std::unique_ptr<VerificationHandler>> handlers)
      : handlers_(std::move(handlers)) {}

  VerificationChain(VerificationChain&&) noexcept = default;
  VerificationChain& operator=(VerificationChain&&) noexcept = default;

  VerificationResult Verify(std::span<const uint8_t> data, const std::vector<SignatureInfo>& signatures) const;

  size_t size() const noexcept { return handlers_.size(); }

private:
  std::vector<std::unique_ptr<VerificationHandler>> handlers_;
};

class VerificationChainBuilder {
public:
  VerificationChainBuilder& WithSignatureCount(uint32_t min_signatures);
  VerificationChainBuilder& WithSignerTrust(const TrustStore& store);
  VerificationChainBuilder& WithCryptographicVerification(const TrustStore& store,
                                                          std::shared_ptr<crypto::CryptoProvider> crypto,
                                                          orchestrator::EventBus* bus = nullptr);
  VerificationChainBuilder& WithCodeSafety(analysis::AnalysisCache& cache);

  VerificationChain Build();

private:
  std::vector<std::unique_ptr<VerificationHandler>> handlers_;
};

// signer trust -> cryptographic -> count -> code safety (when a cache is given).
VerificationChain CreateVerificationChain(const TrustStore& store, std::shared_ptr<crypto::CryptoProvider> crypto,
                                          uint32_t min_signatures = 1, analysis::AnalysisCache* analyzer = nullptr,
                                          orchestrator::EventBus* bus = nullptr);

}  // namespace warden::trust
