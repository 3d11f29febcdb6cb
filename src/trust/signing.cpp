#include "warden/trust/signing.h"

#include <array>

#include "warden/common.h"
#include "warden/crypto/ct.h"
#include "warden/error.h"
#include "warden/errors.h"

namespace warden::trust {

namespace {

struct AlgorithmName {
  SignatureAlgorithm algorithm;
  const char* name;
};

constexpr AlgorithmName kAlgorithmNames[] = {
    {SignatureAlgorithm::kSha256, "sha256"},
    {SignatureAlgorithm::kSha512, "sha512"},
    {SignatureAlgorithm::kHmacSha256, "hmac_sha256"},
    {SignatureAlgorithm::kHmacSha512, "hmac_sha512"},
    {SignatureAlgorithm::kRsaSha256, "rsa_sha256"},
    {SignatureAlgorithm::kEd25519, "ed25519"},
};

crypto::DigestAlgorithm DigestFor(SignatureAlgorithm algorithm) {
  switch (algorithm) {
  case SignatureAlgorithm::kSha512:
  case SignatureAlgorithm::kHmacSha512:
    return crypto::DigestAlgorithm::kSha512;
  default:
    return crypto::DigestAlgorithm::kSha256;
  }
}

bool IsHmac(SignatureAlgorithm algorithm) {
  return algorithm == SignatureAlgorithm::kHmacSha256 || algorithm == SignatureAlgorithm::kHmacSha512;
}

std::string NotImplemented(SignatureAlgorithm algorithm) {
  return std::string("Algorithm not implemented: ") + AlgorithmToString(algorithm);
}

VerificationResult Rejected(const SignatureInfo& signature, std::string error) {
  VerificationResult out;
  out.signer_id = signature.signer_id;
  out.errors.push_back(std::move(error));
  return out;
}

}  // namespace

const char* TrustLevelToString(TrustLevel level) {
  switch (level) {
  case TrustLevel::kTrusted:
    return "trusted";
  case TrustLevel::kVerified:
    return "verified";
  case TrustLevel::kUnverified:
    return "unverified";
  case TrustLevel::kSandboxed:
    return "sandboxed";
  }
  return "unverified";
}

std::optional<TrustLevel> ParseTrustLevel(std::string_view text) {
  text = Trim(text);
  if (text == "trusted") {
    return TrustLevel::kTrusted;
  }
  if (text == "verified") {
    return TrustLevel::kVerified;
  }
  if (text == "unverified") {
    return TrustLevel::kUnverified;
  }
  if (text == "sandboxed") {
    return TrustLevel::kSandboxed;
  }
  return std::nullopt;
}

const char* AlgorithmToString(SignatureAlgorithm algorithm) {
  for (const auto& entry : kAlgorithmNames) {
    if (entry.algorithm == algorithm) {
      return entry.name;
    }
  }
  return "unknown";
}

std::optional<SignatureAlgorithm> ParseAlgorithm(std::string_view text) {
  text = Trim(text);
  for (const auto& entry : kAlgorithmNames) {
    if (text == entry.name) {
      return entry.algorithm;
    }
  }
  return std::nullopt;
}

bool IsIntegrityOnly(SignatureAlgorithm algorithm) noexcept {
  return algorithm == SignatureAlgorithm::kSha256 || algorithm == SignatureAlgorithm::kSha512;
}

bool KeyCompatible(SignatureAlgorithm registered, SignatureAlgorithm used) noexcept {
  if (IsHmac(registered) && IsHmac(used)) {
    return true;
  }
  return registered == used;
}

nlohmann::json SignatureInfo::ToJson() const {
  nlohmann::json out = {
      {"algorithm", AlgorithmToString(algorithm)},
      {"signature", signature},
      {"signer_id", signer_id},
      {"timestamp", timestamp},
  };
  out["certificate_chain"] = certificate_chain ? nlohmann::json(*certificate_chain) : nlohmann::json();
  return out;
}

SignatureInfo SignatureInfo::FromJson(const nlohmann::json& value) {
  auto fail = [](const std::string& what) -> SignatureInfo {
    throw Error(ErrorDomain::Validation, errors::validation::kInvalidArgument, "Invalid signature: " + what);
  };
  if (!value.is_object()) {
    return fail("expected an object");
  }
  if (!value.contains("algorithm") || !value["algorithm"].is_string()) {
    return fail("missing algorithm");
  }
  auto algorithm = ParseAlgorithm(value["algorithm"].get<std::string>());
  if (!algorithm) {
    return fail("unknown algorithm " + value["algorithm"].get<std::string>());
  }
  if (!value.contains("signature") || !value["signature"].is_string()) {
    return fail("missing signature");
  }
  SignatureInfo out;
  out.algorithm = *algorithm;
  out.signature = value["signature"].get<std::string>();
  out.signer_id = value.value("signer_id", std::string());
  if (value.contains("timestamp") && value["timestamp"].is_number_integer()) {
    out.timestamp = value["timestamp"].get<int64_t>();
  }
  if (value.contains("certificate_chain") && value["certificate_chain"].is_string()) {
    out.certificate_chain = value["certificate_chain"].get<std::string>();
  }
  return out;
}

nlohmann::json VerificationResult::ToJson() const {
  return {
      {"is_valid", is_valid},
      {"signer_id", signer_id},
      {"trust_level", TrustLevelToString(trust_level)},
      {"errors", errors},
      {"warnings", warnings},
      {"metadata", metadata},
  };
}

SignatureInfo Sign(crypto::CryptoProvider& crypto, SignatureAlgorithm algorithm,
                   std::span<const uint8_t> data, std::span<const uint8_t> key,
                   std::string signer_id) {
  SignatureInfo out;
  out.algorithm = algorithm;
  out.signer_id = std::move(signer_id);
  out.timestamp = UnixSeconds();

  switch (algorithm) {
  case SignatureAlgorithm::kSha256:
  case SignatureAlgorithm::kSha512:
    out.signature = crypto::HexEncode(crypto.Digest(DigestFor(algorithm), data));
    break;
  case SignatureAlgorithm::kHmacSha256:
  case SignatureAlgorithm::kHmacSha512:
    if (key.empty()) {
      throw Error(ErrorDomain::Validation, errors::validation::kInvalidArgument,
                  std::string(errors::msg::kHmacRequiresKey));
    }
    out.signature = crypto::HexEncode(crypto.Hmac(DigestFor(algorithm), key, data));
    break;
  case SignatureAlgorithm::kEd25519: {
    if (key.size() != crypto::kEd25519KeySize) {
      throw Error(ErrorDomain::Crypto, errors::crypto::kSignFailed,
                  "Ed25519 signing requires a 32-byte private seed");
    }
    std::span<const uint8_t, crypto::kEd25519KeySize> seed(key.data(), crypto::kEd25519KeySize);
    auto signature = crypto.Ed25519Sign(seed, data);
    out.signature = crypto::HexEncode(signature);
    break;
  }
  case SignatureAlgorithm::kRsaSha256:
    throw Error(ErrorDomain::Config, errors::config::kUnknownAlgorithm, NotImplemented(algorithm));
  }
  return out;
}

VerificationResult VerifySignature(crypto::CryptoProvider& crypto, std::span<const uint8_t> data,
                                   const SignatureInfo& signature,
                                   std::optional<std::span<const uint8_t>> key) {
  if (signature.algorithm == SignatureAlgorithm::kRsaSha256) {
    return Rejected(signature, NotImplemented(signature.algorithm));
  }
  if (IsHmac(signature.algorithm) && (!key || key->empty())) {
    return Rejected(signature, std::string(errors::msg::kHmacRequiresKey));
  }

  auto provided = crypto::HexDecode(signature.signature);
  if (!provided) {
    return Rejected(signature, std::string(errors::msg::kSignatureMismatch));
  }

  bool valid = false;
  switch (signature.algorithm) {
  case SignatureAlgorithm::kSha256:
  case SignatureAlgorithm::kSha512:
    valid = crypto::ct::BytesEqual(crypto.Digest(DigestFor(signature.algorithm), data), *provided);
    break;
  case SignatureAlgorithm::kHmacSha256:
  case SignatureAlgorithm::kHmacSha512:
    valid = crypto::ct::BytesEqual(crypto.Hmac(DigestFor(signature.algorithm), *key, data), *provided);
    break;
  case SignatureAlgorithm::kEd25519:
    if (!key || key->size() != crypto::kEd25519KeySize) {
      return Rejected(signature, "Ed25519 verification requires a public key");
    }
    valid = crypto.Ed25519Verify(*key, data, *provided);
    break;
  case SignatureAlgorithm::kRsaSha256:
    break;
  }

  if (!valid) {
    return Rejected(signature, std::string(errors::msg::kSignatureMismatch));
  }
  VerificationResult out;
  out.is_valid = true;
  out.signer_id = signature.signer_id;
  out.trust_level = IsIntegrityOnly(signature.algorithm) ? TrustLevel::kUnverified : TrustLevel::kVerified;
  out.metadata["algorithm"] = AlgorithmToString(signature.algorithm);
  return out;
}

}  // namespace warden::trust
