#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "warden/crypto/provider.h"

namespace warden::trust {

enum class TrustLevel : uint8_t { kTrusted, kVerified, kUnverified, kSandboxed };

const char* TrustLevelToString(TrustLevel level);
std::optional<TrustLevel> ParseTrustLevel(std::string_view text);

enum class SignatureAlgorithm : uint8_t {
  kSha256,
  kSha512,
  kHmacSha256,
  kHmacSha512,
  kRsaSha256,
  kEd25519
};

const char* AlgorithmToString(SignatureAlgorithm algorithm);
std::optional<SignatureAlgorithm> ParseAlgorithm(std::string_view text);

// Plain digests carry no key and authenticate nobody.
bool IsIntegrityOnly(SignatureAlgorithm algorithm) noexcept;
// True when a key registered for `registered` may check a signature made with `used`.
bool KeyCompatible(SignatureAlgorithm registered, SignatureAlgorithm used) noexcept;

struct SignatureInfo {
  SignatureAlgorithm algorithm{SignatureAlgorithm::kEd25519};
  // Lowercase hex.
  std::string signature;
  std::string signer_id;
  // Unix seconds.
  int64_t timestamp{0};
  std::optional<std::string> certificate_chain;

  nlohmann::json ToJson() const;
  // Throws Error(Validation) on missing fields or an unknown algorithm.
  static SignatureInfo FromJson(const nlohmann::json& value);
};

struct VerificationResult {
  bool is_valid{false};
  std::string signer_id;
  TrustLevel trust_level{TrustLevel::kUnverified};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
  nlohmann::json metadata = nlohmann::json::object();

  nlohmann::json ToJson() const;
};

// Produces a signature over data. Digest algorithms ignore the key, HMAC uses
// it as the shared secret and Ed25519 expects the 32-byte private seed.
// rsa_sha256 and HMAC without a key throw.
SignatureInfo Sign(crypto::CryptoProvider& crypto, SignatureAlgorithm algorithm,
                   std::span<const uint8_t> data, std::span<const uint8_t> key,
                   std::string signer_id);

// Recomputes and compares in constant time. Never throws on a bad signature.
VerificationResult VerifySignature(crypto::CryptoProvider& crypto, std::span<const uint8_t> data,
                                   const SignatureInfo& signature,
                                   std::optional<std::span<const uint8_t>> key);

}  // namespace warden::trust
