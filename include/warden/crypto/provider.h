#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace warden::crypto {

enum class DigestAlgorithm { kSha256, kSha512 };

inline constexpr size_t kEd25519KeySize = 32;
inline constexpr size_t kEd25519SignatureSize = 64;

class CryptoProvider {
public:
  virtual ~CryptoProvider() = default;

  virtual std::vector<uint8_t> Digest(DigestAlgorithm algorithm,
                                      std::span<const uint8_t> data) = 0;

  virtual std::vector<uint8_t> Hmac(DigestAlgorithm algorithm,
                                    std::span<const uint8_t> key,
                                    std::span<const uint8_t> message) = 0;

  // Returns false for malformed keys or signatures; never throws on a bad signature.
  virtual bool Ed25519Verify(std::span<const uint8_t> public_key,
                             std::span<const uint8_t> message,
                             std::span<const uint8_t> signature) = 0;

  virtual std::array<uint8_t, kEd25519SignatureSize> Ed25519Sign(
      std::span<const uint8_t, kEd25519KeySize> private_seed,
      std::span<const uint8_t> message) = 0;

  virtual std::array<uint8_t, kEd25519KeySize> Ed25519PublicKey(
      std::span<const uint8_t, kEd25519KeySize> private_seed) = 0;

  virtual void RandomBytes(std::span<uint8_t> out) = 0;
};

class OpenSSLCryptoProvider : public CryptoProvider {
public:
  std::vector<uint8_t> Digest(DigestAlgorithm algorithm,
                              std::span<const uint8_t> data) override;

  std::vector<uint8_t> Hmac(DigestAlgorithm algorithm,
                            std::span<const uint8_t> key,
                            std::span<const uint8_t> message) override;

  bool Ed25519Verify(std::span<const uint8_t> public_key,
                     std::span<const uint8_t> message,
                     std::span<const uint8_t> signature) override;

  std::array<uint8_t, kEd25519SignatureSize> Ed25519Sign(
      std::span<const uint8_t, kEd25519KeySize> private_seed,
      std::span<const uint8_t> message) override;

  std::array<uint8_t, kEd25519KeySize> Ed25519PublicKey(
      std::span<const uint8_t, kEd25519KeySize> private_seed) override;

  void RandomBytes(std::span<uint8_t> out) override;
};

std::shared_ptr<CryptoProvider> MakeOpenSSLCryptoProvider();

// Encoding helpers shared by the trust store, audit logger and CLI.
std::string HexEncode(std::span<const uint8_t> bytes);
std::optional<std::vector<uint8_t>> HexDecode(std::string_view text);

inline std::span<const uint8_t> AsBytes(std::string_view text) noexcept {
  return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

std::string Sha256Hex(CryptoProvider& provider, std::string_view text);
std::string RandomHex(CryptoProvider& provider, size_t byte_count);

}  // namespace warden::crypto
