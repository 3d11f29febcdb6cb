#include "warden/trust/trust_store.h"

#include <algorithm>
#include <mutex>

#include "warden/common.h"
#include "warden/error.h"
#include "warden/orchestrator/event_bus.h"
#include "warden/orchestrator/io_util.h"

namespace warden::trust {

namespace {

void PublishSignerEvent(orchestrator::EventBus* bus, const char* event_id, std::string message,
                        const std::string& signer_id, orchestrator::EventSeverity severity) {
  if (!bus) {
    return;
  }
  orchestrator::Event event;
  event.category = orchestrator::EventCategory::kSecurity;
  event.severity = severity;
  event.event_id = event_id;
  event.message = std::move(message);
  event.fields.emplace_back("signer_id", signer_id);
  orchestrator::PublishSafely(*bus, event);
}

[[noreturn]] void ThrowLineError(int code, size_t line_number, const std::string& detail) {
  throw Error(ErrorDomain::Config, code, "trust file line " + std::to_string(line_number) + ": " + detail);
}

}  // namespace

std::vector<TrustedSigner>::iterator TrustStore::FindLocked(std::string_view signer_id) {
  return std::find_if(signers_.begin(), signers_.end(),
                      [&](const TrustedSigner& s) { return s.signer_id == signer_id; });
}

std::vector<TrustedSigner>::const_iterator TrustStore::FindLocked(std::string_view signer_id) const {
  return std::find_if(signers_.begin(), signers_.end(),
                      [&](const TrustedSigner& s) { return s.signer_id == signer_id; });
}

void TrustStore::AddSigner(TrustedSigner signer) {
  if (signer.added_at == 0) {
    signer.added_at = UnixSeconds();
  }
  const std::string id = signer.signer_id;
  const std::string level = TrustLevelToString(signer.trust_level);
  {
    std::unique_lock lock(mutex_);
    auto it = FindLocked(id);
    if (it != signers_.end()) {
      *it = std::move(signer);
    } else {
      signers_.push_back(std::move(signer));
    }
  }
  PublishSignerEvent(bus_, "signer_added", "Added trusted signer: " + id + " (level: " + level + ")", id,
                     orchestrator::EventSeverity::kInfo);
}

bool TrustStore::RemoveSigner(std::string_view signer_id) {
  std::unique_lock lock(mutex_);
  auto it = FindLocked(signer_id);
  if (it == signers_.end()) {
    return false;
  }
  signers_.erase(it);
  return true;
}

bool TrustStore::RevokeSigner(std::string_view signer_id) {
  {
    std::unique_lock lock(mutex_);
    auto it = FindLocked(signer_id);
    if (it == signers_.end()) {
      return false;
    }
    it->revoked = true;
  }
  PublishSignerEvent(bus_, "signer_revoked", "Revoked signer: " + std::string(signer_id), std::string(signer_id),
                     orchestrator::EventSeverity::kWarning);
  return true;
}

bool TrustStore::SetSignerTrust(std::string_view signer_id, TrustLevel level) {
  std::unique_lock lock(mutex_);
  auto it = FindLocked(signer_id);
  if (it == signers_.end()) {
    return false;
  }
  it->trust_level = level;
  return true;
}

bool TrustStore::HasSigner(std::string_view signer_id) const {
  std::shared_lock lock(mutex_);
  return FindLocked(signer_id) != signers_.end();
}

std::optional<TrustedSigner> TrustStore::GetSigner(std::string_view signer_id) const {
  std::shared_lock lock(mutex_);
  auto it = FindLocked(signer_id);
  if (it == signers_.end()) {
    return std::nullopt;
  }
  return *it;
}

std::optional<std::vector<uint8_t>> TrustStore::GetPublicKey(std::string_view signer_id) const {
  std::shared_lock lock(mutex_);
  auto it = FindLocked(signer_id);
  if (it == signers_.end() || it->revoked) {
    return std::nullopt;
  }
  return it->public_key;
}

TrustLevel TrustStore::GetTrustLevel(std::string_view signer_id) const {
  std::shared_lock lock(mutex_);
  auto it = FindLocked(signer_id);
  if (it == signers_.end() || !it->IsUsable(UnixSeconds())) {
    return TrustLevel::kUnverified;
  }
  return it->trust_level;
}

bool TrustStore::IsTrusted(std::string_view signer_id) const {
  auto level = GetTrustLevel(signer_id);
  return level == TrustLevel::kTrusted || level == TrustLevel::kVerified;
}

std::vector<TrustedSigner> TrustStore::ListSigners() const {
  std::shared_lock lock(mutex_);
  return signers_;
}

std::vector<TrustedSigner> TrustStore::UsableSigners() const {
  const auto now = UnixSeconds();
  std::shared_lock lock(mutex_);
  std::vector<TrustedSigner> out;
  for (const auto& signer : signers_) {
    if (signer.IsUsable(now)) {
      out.push_back(signer);
    }
  }
  return out;
}

size_t TrustStore::size() const {
  std::shared_lock lock(mutex_);
  return signers_.size();
}

std::vector<TrustedSigner> ParseTrustFile(std::string_view text) {
  std::vector<TrustedSigner> signers;
  auto find = [&](std::string_view id) {
    return std::find_if(signers.begin(), signers.end(), [&](const TrustedSigner& s) { return s.signer_id == id; });
  };

  size_t line_number = 0;
  while (!text.empty()) {
    auto newline = text.find('\n');
    auto raw = text.substr(0, newline);
    text.remove_prefix(newline == std::string_view::npos ? text.size() : newline + 1);
    ++line_number;

    auto view = Trim(raw);
    if (view.empty() || view.front() == '#') {
      continue;
    }
    auto colon = view.find(':');
    if (colon == std::string_view::npos) {
      ThrowLineError(errors::config::kMalformedLine, line_number, "expected <directive>:<signer id>");
    }
    auto directive = view.substr(0, colon);
    auto rest = view.substr(colon + 1);

    if (directive == "revoke") {
      auto id = Trim(rest);
      auto it = find(id);
      if (it == signers.end()) {
        ThrowLineError(errors::config::kUnknownKey, line_number, "unknown signer '" + std::string(id) + "'");
      }
      it->revoked = true;
      continue;
    }

    auto equals = rest.find('=');
    if (equals == std::string_view::npos) {
      ThrowLineError(errors::config::kMalformedLine, line_number, "expected '='");
    }
    auto id = Trim(rest.substr(0, equals));
    auto value = Trim(rest.substr(equals + 1));
    if (id.empty()) {
      ThrowLineError(errors::config::kMalformedLine, line_number, "empty signer id");
    }

    if (directive == "signer") {
      auto fields = SplitList(value, ':');
      if (fields.size() < 2 || fields.size() > 3) {
        ThrowLineError(errors::config::kMalformedLine, line_number, "expected <algorithm>:<hex key>[:<trust level>]");
      }
      auto algorithm = ParseAlgorithm(fields[0]);
      if (!algorithm) {
        ThrowLineError(errors::config::kUnknownAlgorithm, line_number, "unknown algorithm '" + fields[0] + "'");
      }
      auto key = crypto::HexDecode(fields[1]);
      if (!key || key->empty()) {
        ThrowLineError(errors::config::kInvalidValue, line_number, "key is not hex");
      }
      if (*algorithm == SignatureAlgorithm::kEd25519 && key->size() != crypto::kEd25519KeySize) {
        ThrowLineError(errors::config::kInvalidValue, line_number, "ed25519 public key must be 32 bytes");
      }
      TrustedSigner signer;
      signer.signer_id = std::string(id);
      signer.algorithm = *algorithm;
      signer.public_key = std::move(*key);
      if (fields.size() == 3) {
        auto level = ParseTrustLevel(fields[2]);
        if (!level) {
          ThrowLineError(errors::config::kInvalidValue, line_number, "unknown trust level '" + fields[2] + "'");
        }
        signer.trust_level = *level;
      }
      auto it = find(id);
      if (it != signers.end()) {
        *it = std::move(signer);
      } else {
        signers.push_back(std::move(signer));
      }
      continue;
    }

    auto it = find(id);
    if (it == signers.end()) {
      ThrowLineError(errors::config::kUnknownKey, line_number, "unknown signer '" + std::string(id) + "'");
    }
    if (directive == "name") {
      it->name = std::string(value);
    } else if (directive == "email") {
      it->email = std::string(value);
    } else if (directive == "org") {
      it->organization = std::string(value);
    } else if (directive == "expires") {
      auto seconds = ParseUint64(value);
      if (!seconds) {
        ThrowLineError(errors::config::kInvalidValue, line_number, "expires must be unix seconds");
      }
      it->expires_at = static_cast<int64_t>(*seconds);
    } else {
      ThrowLineError(errors::config::kUnknownKey, line_number, "unknown directive '" + std::string(directive) + "'");
    }
  }
  return signers;
}

void LoadTrustFile(const std::filesystem::path& path, TrustStore& store) {
  auto signers = ParseTrustFile(orchestrator::ReadTextFile(path));
  for (auto& signer : signers) {
    const bool revoked = signer.revoked;
    const std::string id = signer.signer_id;
    signer.revoked = false;
    store.AddSigner(std::move(signer));
    if (revoked) {
      store.RevokeSigner(id);
    }
  }
}

}  // namespace warden::trust
