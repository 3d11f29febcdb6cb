#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "warden/trust/signing.h"

namespace warden::orchestrator {
class EventBus;
}

namespace warden::trust {

struct TrustedSigner {
  std::string signer_id;
  SignatureAlgorithm algorithm{SignatureAlgorithm::kEd25519};
  // Ed25519 public key, or the shared secret for HMAC signers.
  std::vector<uint8_t> public_key;
  TrustLevel trust_level{TrustLevel::kVerified};
  std::string name;
  std::string email;
  std::string organization;
  int64_t added_at{0};
  std::optional<int64_t> expires_at;
  bool revoked{false};
  std::map<std::string, std::string> metadata;

  bool IsExpired(int64_t now) const noexcept { return expires_at && *expires_at < now; }
  bool IsUsable(int64_t now) const noexcept { return !revoked && !IsExpired(now); }
};

// Registry of signers in registration order. Readers share the lock; writers
// are serialized.
class TrustStore {
public:
  explicit TrustStore(orchestrator::EventBus* bus = nullptr) : bus_(bus) {}

  TrustStore(const TrustStore&) = delete;
  TrustStore& operator=(const TrustStore&) = delete;

  // Replaces an existing signer in place; added_at defaults to now.
  void AddSigner(TrustedSigner signer);
  bool RemoveSigner(std::string_view signer_id);
  bool RevokeSigner(std::string_view signer_id);
  bool SetSignerTrust(std::string_view signer_id, TrustLevel level);

  bool HasSigner(std::string_view signer_id) const;
  std::optional<TrustedSigner> GetSigner(std::string_view signer_id) const;
  // Absent for unknown or revoked signers.
  std::optional<std::vector<uint8_t>> GetPublicKey(std::string_view signer_id) const;
  // Unverified for unknown, revoked or expired signers.
  TrustLevel GetTrustLevel(std::string_view signer_id) const;
  bool IsTrusted(std::string_view signer_id) const;
  std::vector<TrustedSigner> ListSigners() const;
  // Non-revoked, unexpired signers in registration order.
  std::vector<TrustedSigner> UsableSigners() const;
  size_t size() const;

private:
  std::vector<TrustedSigner>::iterator FindLocked(std::string_view signer_id);
  std::vector<TrustedSigner>::const_iterator FindLocked(std::string_view signer_id) const;

  orchestrator::EventBus* bus_;
  mutable std::shared_mutex mutex_;
  std::vector<TrustedSigner> signers_;
};

// Parses the line-based trust file:
//   signer:<id>=<algorithm>:<hex key>[:<trust level>]
//   name:<id>=...  email:<id>=...  org:<id>=...
//   expires:<id>=<unix seconds>
//   revoke:<id>
// Throws Error(IO) when unreadable and Error(Config) naming the line otherwise.
std::vector<TrustedSigner> ParseTrustFile(std::string_view text);
void LoadTrustFile(const std::filesystem::path& path, TrustStore& store);

}  // namespace warden::trust
