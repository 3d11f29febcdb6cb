#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace warden {
  enum class ErrorDomain : std::uint16_t {
    Security = 0x01,
    IO = 0x02,
    Crypto = 0x03,
    Validation = 0x04,
    Config = 0x05,
    Dependency = 0x06,
    State = 0x07,
    Sandbox = 0x08,
    Internal = 0x7F
  };

  // Each domain reserves a 0x100 span of codes so propagated errno values
  // never collide with framework codes.
  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Security:
      return 0x0100;
    case ErrorDomain::IO:
      return 0x0200;
    case ErrorDomain::Crypto:
      return 0x0300;
    case ErrorDomain::Validation:
      return 0x0400;
    case ErrorDomain::Config:
      return 0x0500;
    case ErrorDomain::Dependency:
      return 0x0600;
    case ErrorDomain::State:
      return 0x0700;
    case ErrorDomain::Sandbox:
      return 0x0800;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0;
  }

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace io {
      inline constexpr int kFileUnreadable = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kFileUnwritable = Make(ErrorDomain::IO, 0x02);
      inline constexpr int kPipeFailed = Make(ErrorDomain::IO, 0x03);
      inline constexpr int kForkFailed = Make(ErrorDomain::IO, 0x04);
      inline constexpr int kTempDirFailed = Make(ErrorDomain::IO, 0x05);
      inline constexpr int kAuditLogDirFailed = Make(ErrorDomain::IO, 0x06);
    } // namespace io

    namespace validation {
      inline constexpr int kSyntaxError = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kInvalidArgument = Make(ErrorDomain::Validation, 0x02);
      inline constexpr int kMalformedManifest = Make(ErrorDomain::Validation, 0x03);
    } // namespace validation

    namespace config {
      inline constexpr int kUnknownPreset = Make(ErrorDomain::Config, 0x01);
      inline constexpr int kMalformedLine = Make(ErrorDomain::Config, 0x02);
      inline constexpr int kUnknownKey = Make(ErrorDomain::Config, 0x03);
      inline constexpr int kInvalidValue = Make(ErrorDomain::Config, 0x04);
      inline constexpr int kUnknownAlgorithm = Make(ErrorDomain::Config, 0x05);
    } // namespace config

    namespace crypto {
      inline constexpr int kDigestFailed = Make(ErrorDomain::Crypto, 0x01);
      inline constexpr int kHmacFailed = Make(ErrorDomain::Crypto, 0x02);
      inline constexpr int kSignFailed = Make(ErrorDomain::Crypto, 0x03);
      inline constexpr int kRandomFailed = Make(ErrorDomain::Crypto, 0x04);
      inline constexpr int kKeyGenerationFailed = Make(ErrorDomain::Crypto, 0x05);
    } // namespace crypto

    namespace state {
      inline constexpr int kLogAlreadyFinalized = Make(ErrorDomain::State, 0x01);
      inline constexpr int kLogMissing = Make(ErrorDomain::State, 0x02);
    } // namespace state

    namespace sandbox {
      inline constexpr int kEmbeddedRuntimeFailed = Make(ErrorDomain::Sandbox, 0x01);
    } // namespace sandbox

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}
  };
} // namespace warden
