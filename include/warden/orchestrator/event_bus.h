#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "warden/crypto/provider.h"

namespace warden::orchestrator {

  // Structured logging primitives
  enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

  enum class EventCategory { kTelemetry, kLifecycle, kSecurity, kDiagnostics };

  enum class FieldPrivacy { kPublic, kRedact, kHash };

  struct EventField {
    std::string key;
    std::string value;
    FieldPrivacy privacy{FieldPrivacy::kPublic};
    bool numeric{false};

    EventField(std::string k, std::string v, FieldPrivacy p = FieldPrivacy::kPublic,
               bool is_numeric = false)
        : key(std::move(k)), value(std::move(v)), privacy(p), numeric(is_numeric) {}
  };

  struct Event {
    EventCategory category{EventCategory::kDiagnostics};
    EventSeverity severity{EventSeverity::kInfo};
    std::string event_id;
    std::string message;
    std::vector<EventField> fields;
  };

  std::string HashForTelemetry(std::string_view input);

  const char* SeverityToString(EventSeverity severity);
  const char* CategoryToString(EventCategory category);

  inline constexpr size_t kAuditMacSize = 32;
  inline constexpr size_t kDefaultAuditLogMaxBytes = 10 * 1024 * 1024;

  struct AuditLogOptions {
    std::filesystem::path path;
    // Empty key means a random per-process key; the chain is then only
    // verifiable while the process is alive.
    std::vector<uint8_t> key;
    size_t max_bytes{kDefaultAuditLogMaxBytes};
    size_t max_files{3};
  };

  // Appends one JSON object per line, each carrying an HMAC chained over the
  // previous line. Rotation starts a fresh chain in the new file.
  class JsonLineLogger {
  public:
    JsonLineLogger(AuditLogOptions options, std::shared_ptr<crypto::CryptoProvider> crypto);

    JsonLineLogger(const JsonLineLogger&) = delete;
    JsonLineLogger& operator=(const JsonLineLogger&) = delete;

    void Log(const Event& event);

    const std::filesystem::path& path() const noexcept { return options_.path; }
    std::vector<uint8_t> key() const;
    uint64_t EntryCount() const;

  private:
    std::string FormatTimestamp(std::chrono::system_clock::time_point tp);
    void EnsureOpen();
    void RotateLocked();
    void RotateIfNeeded(size_t incoming_bytes);
    std::array<uint8_t, kAuditMacSize> ComputeChainedMac(uint64_t previous_count, uint64_t sequence,
                                                         std::string_view canonical);

    AuditLogOptions options_;
    std::shared_ptr<crypto::CryptoProvider> crypto_;
    mutable std::mutex mutex_;
    std::ofstream stream_;
    std::array<uint8_t, kAuditMacSize> last_mac_{};
    uint64_t entry_counter_{0};
    uint64_t dropped_streak_{0};
  };

  struct AuditVerification {
    bool ok{false};
    uint64_t entries{0};
    uint64_t failed_line{0};
    std::string error;
  };

  // Re-walks the chain of a single log file with the given key.
  AuditVerification VerifyAuditLog(const std::filesystem::path& path, std::span<const uint8_t> key,
                                   crypto::CryptoProvider& crypto);

  // Publish/subscribe hub. One instance per Context; subscribers are invoked
  // synchronously on the publishing thread.
  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;

    EventBus() = default;
    explicit EventBus(std::shared_ptr<JsonLineLogger> logger);

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    void Publish(const Event& event);
    void Subscribe(Subscriber fn);

    const std::shared_ptr<JsonLineLogger>& logger() const noexcept { return logger_; }

  private:
    using SubscriberList = std::vector<Subscriber>;

    std::shared_ptr<JsonLineLogger> logger_;
    std::shared_ptr<const SubscriberList> subscribers_snapshot_;
    std::mutex subscribers_mutex_;
  };

  // Publishes and reports bus failures on std::clog instead of throwing.
  void PublishSafely(EventBus& bus, const Event& event) noexcept;

} // namespace warden::orchestrator
