#include "warden/crypto/provider.h"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <iomanip>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

#include "warden/error.h"

namespace warden::crypto {

namespace {

std::string BuildOpenSSLErrorMessage(const char* context) {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return std::string(context) + ": unknown OpenSSL error";
  }

  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  std::string message(context);
  message.append(": ");
  message.append(buf);
  return message;
}

[[noreturn]] void ThrowCryptoError(int code, const std::string& message) {
  throw warden::Error(warden::ErrorDomain::Crypto, code, message);
}

class EVPDeleter {
public:
  void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
  void operator()(EVP_PKEY* key) const noexcept { EVP_PKEY_free(key); }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, EVPDeleter>;
using PKeyPtr = std::unique_ptr<EVP_PKEY, EVPDeleter>;

const EVP_MD* ResolveDigest(DigestAlgorithm algorithm) {
  switch (algorithm) {
  case DigestAlgorithm::kSha256:
    return EVP_sha256();
  case DigestAlgorithm::kSha512:
    return EVP_sha512();
  }
  return EVP_sha256();
}

PKeyPtr LoadEd25519Private(std::span<const uint8_t, kEd25519KeySize> seed) {
  PKeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(), seed.size()));
  if (!key) {
    ThrowCryptoError(errors::crypto::kKeyGenerationFailed,
                     BuildOpenSSLErrorMessage("EVP_PKEY_new_raw_private_key(ED25519)"));
  }
  return key;
}

} // namespace

std::vector<uint8_t> OpenSSLCryptoProvider::Digest(DigestAlgorithm algorithm,
                                                   std::span<const uint8_t> data) {
  std::vector<uint8_t> out(EVP_MAX_MD_SIZE);
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, ResolveDigest(algorithm), nullptr) != 1) {
    ThrowCryptoError(errors::crypto::kDigestFailed, BuildOpenSSLErrorMessage("EVP_Digest"));
  }
  out.resize(len);
  return out;
}

std::vector<uint8_t> OpenSSLCryptoProvider::Hmac(DigestAlgorithm algorithm,
                                                 std::span<const uint8_t> key,
                                                 std::span<const uint8_t> message) {
  std::vector<uint8_t> out(EVP_MAX_MD_SIZE);
  unsigned int len = 0;
  // HMAC() rejects a null key pointer even for zero-length keys.
  static const uint8_t kEmptyKey = 0;
  const uint8_t* key_data = key.empty() ? &kEmptyKey : key.data();
  if (HMAC(ResolveDigest(algorithm), key_data, static_cast<int>(key.size()), message.data(),
           message.size(), out.data(), &len) == nullptr) {
    ThrowCryptoError(errors::crypto::kHmacFailed, BuildOpenSSLErrorMessage("HMAC"));
  }
  out.resize(len);
  return out;
}

bool OpenSSLCryptoProvider::Ed25519Verify(std::span<const uint8_t> public_key,
                                          std::span<const uint8_t> message,
                                          std::span<const uint8_t> signature) {
  if (public_key.size() != kEd25519KeySize || signature.size() != kEd25519SignatureSize) {
    return false;
  }
  PKeyPtr key(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(),
                                          public_key.size()));
  if (!key) {
    ERR_clear_error();
    return false;
  }
  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    return false;
  }
  const bool ok = EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) == 1 &&
                  EVP_DigestVerify(ctx.get(), signature.data(), signature.size(), message.data(),
                                   message.size()) == 1;
  ERR_clear_error();
  return ok;
}

std::array<uint8_t, kEd25519SignatureSize> OpenSSLCryptoProvider::Ed25519Sign(
    std::span<const uint8_t, kEd25519KeySize> private_seed, std::span<const uint8_t> message) {
  auto key = LoadEd25519Private(private_seed);
  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    ThrowCryptoError(errors::crypto::kSignFailed, "EVP_MD_CTX_new failed");
  }
  std::array<uint8_t, kEd25519SignatureSize> signature{};
  size_t signature_len = signature.size();
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1 ||
      EVP_DigestSign(ctx.get(), signature.data(), &signature_len, message.data(), message.size()) != 1) {
    ThrowCryptoError(errors::crypto::kSignFailed, BuildOpenSSLErrorMessage("EVP_DigestSign(ED25519)"));
  }
  if (signature_len != signature.size()) {
    ThrowCryptoError(errors::crypto::kSignFailed, "Unexpected Ed25519 signature length");
  }
  return signature;
}

std::array<uint8_t, kEd25519KeySize> OpenSSLCryptoProvider::Ed25519PublicKey(
    std::span<const uint8_t, kEd25519KeySize> private_seed) {
  auto key = LoadEd25519Private(private_seed);
  std::array<uint8_t, kEd25519KeySize> public_key{};
  size_t len = public_key.size();
  if (EVP_PKEY_get_raw_public_key(key.get(), public_key.data(), &len) != 1 || len != public_key.size()) {
    ThrowCryptoError(errors::crypto::kKeyGenerationFailed,
                     BuildOpenSSLErrorMessage("EVP_PKEY_get_raw_public_key"));
  }
  return public_key;
}

void OpenSSLCryptoProvider::RandomBytes(std::span<uint8_t> out) {
  if (out.empty()) {
    return;
  }
  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    ThrowCryptoError(errors::crypto::kRandomFailed, BuildOpenSSLErrorMessage("RAND_bytes"));
  }
}

std::shared_ptr<CryptoProvider> MakeOpenSSLCryptoProvider() {
  return std::make_shared<OpenSSLCryptoProvider>();
}

std::string HexEncode(std::span<const uint8_t> bytes) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (uint8_t byte : bytes) {
    oss << std::setw(2) << static_cast<int>(byte);
  }
  return oss.str();
}

std::optional<std::vector<uint8_t>> HexDecode(std::string_view text) {
  if (text.size() % 2 != 0) {
    return std::nullopt;
  }
  auto nibble = [](char ch) -> int {
    if (ch >= '0' && ch <= '9') {
      return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
      return 10 + (ch - 'a');
    }
    if (ch >= 'A' && ch <= 'F') {
      return 10 + (ch - 'A');
    }
    return -1;
  };
  std::vector<uint8_t> out(text.size() / 2);
  for (size_t i = 0; i < out.size(); ++i) {
    const int high = nibble(text[i * 2]);
    const int low = nibble(text[i * 2 + 1]);
    if (high < 0 || low < 0) {
      return std::nullopt;
    }
    out[i] = static_cast<uint8_t>((high << 4) | low);
  }
  return out;
}

std::string Sha256Hex(CryptoProvider& provider, std::string_view text) {
  auto digest = provider.Digest(DigestAlgorithm::kSha256, AsBytes(text));
  return HexEncode(digest);
}

std::string RandomHex(CryptoProvider& provider, size_t byte_count) {
  std::vector<uint8_t> bytes(byte_count);
  provider.RandomBytes(bytes);
  return HexEncode(bytes);
}

}  // namespace warden::crypto
