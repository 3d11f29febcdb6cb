#include "warden/orchestrator/event_bus.h"

#include <algorithm>
#include <atomic>
#include <charconv>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "warden/common.h"
#include "warden/crypto/ct.h"
#include "warden/error.h"

namespace warden::orchestrator {
namespace {

struct PublishReentrancyGuard {
  explicit PublishReentrancyGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~PublishReentrancyGuard() { flag_ = false; }
  PublishReentrancyGuard(const PublishReentrancyGuard&) = delete;
  PublishReentrancyGuard& operator=(const PublishReentrancyGuard&) = delete;

 private:
  bool& flag_;
};

constexpr size_t kMaxEventBytes = 16 * 1024;
constexpr std::string_view kMacMarker = ",\"audit_mac\":\"";
constexpr std::string_view kSeqMarker = "\"audit_seq\":";
constexpr std::string_view kPrevMarker = "\"audit_prev_count\":";

std::string EscapeJson(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 8);
  for (unsigned char c : text) {
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (c < 0x20) {
        std::ostringstream hex;
        hex << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
        out += hex.str();
      } else {
        out.push_back(static_cast<char>(c));
      }
      break;
    }
  }
  return out;
}

bool FieldKeyImpliesSensitive(std::string_view key) {
  return key == "plugin_path" || key == "audit_key" || key == "secret" || key == "key";
}

std::string BuildEventJson(const Event& event, const std::string& timestamp) {
  std::string payload;
  payload.reserve(256);
  payload.append("{\"ts\":\"").append(EscapeJson(timestamp)).append("\"");
  payload.append(",\"severity\":\"").append(SeverityToString(event.severity)).append("\"");
  payload.append(",\"category\":\"").append(CategoryToString(event.category)).append("\"");
  if (!event.event_id.empty()) {
    payload.append(",\"event_id\":\"").append(EscapeJson(event.event_id)).append("\"");
  }
  if (!event.message.empty()) {
    payload.append(",\"message\":\"").append(EscapeJson(event.message)).append("\"");
  }
  for (const auto& field : event.fields) {
    auto privacy = field.privacy;
    if (privacy == FieldPrivacy::kPublic && FieldKeyImpliesSensitive(field.key)) {
      privacy = FieldPrivacy::kHash;
    }
    payload.append(",\"").append(EscapeJson(field.key)).append("\":");
    std::string sanitized = field.value;
    if (privacy == FieldPrivacy::kRedact) {
      sanitized = "[REDACTED]";
    } else if (privacy == FieldPrivacy::kHash) {
      sanitized = HashForTelemetry(field.value);
    }
    if (field.numeric && privacy == FieldPrivacy::kPublic) {
      payload.append(sanitized);
    } else {
      payload.append("\"").append(EscapeJson(sanitized)).append("\"");
    }
  }
  payload.push_back('}');
  return payload;
}

Event BuildOversizeEvent(const Event& original) {
  Event replacement;
  replacement.category = original.category;
  replacement.severity = original.severity;
  replacement.event_id = "event_oversize";
  replacement.message = "Event payload exceeded size limit";
  if (!original.event_id.empty()) {
    replacement.fields.emplace_back("original_event", original.event_id);
  }
  replacement.fields.emplace_back("limit_bytes", std::to_string(kMaxEventBytes), FieldPrivacy::kPublic, true);
  return replacement;
}

void AppendBigEndian(std::vector<uint8_t>& buffer, uint64_t value) {
  for (int shift = 56; shift >= 0; shift -= 8) {
    buffer.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
  }
}

std::array<uint8_t, kAuditMacSize> ChainedMac(crypto::CryptoProvider& crypto,
                                              std::span<const uint8_t> key,
                                              const std::array<uint8_t, kAuditMacSize>& previous,
                                              uint64_t previous_count, uint64_t sequence,
                                              std::string_view canonical) {
  std::vector<uint8_t> buffer;
  buffer.reserve(previous.size() + 16 + canonical.size());
  buffer.insert(buffer.end(), previous.begin(), previous.end());
  AppendBigEndian(buffer, previous_count);
  AppendBigEndian(buffer, sequence);
  auto canonical_bytes = crypto::AsBytes(canonical);
  buffer.insert(buffer.end(), canonical_bytes.begin(), canonical_bytes.end());
  auto mac = crypto.Hmac(crypto::DigestAlgorithm::kSha256, key, buffer);
  std::array<uint8_t, kAuditMacSize> out{};
  std::copy_n(mac.begin(), std::min(mac.size(), out.size()), out.begin());
  return out;
}

std::optional<uint64_t> ParseNumberAfter(std::string_view line, std::string_view marker, size_t from,
                                         size_t* end_out) {
  auto pos = line.find(marker, from);
  if (pos == std::string_view::npos) {
    return std::nullopt;
  }
  pos += marker.size();
  size_t end = pos;
  while (end < line.size() && line[end] >= '0' && line[end] <= '9') {
    ++end;
  }
  if (end == pos) {
    return std::nullopt;
  }
  uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(line.data() + pos, line.data() + end, value);
  if (ec != std::errc() || ptr != line.data() + end) {
    return std::nullopt;
  }
  if (end_out) {
    *end_out = end;
  }
  return value;
}

struct ChainState {
  AuditVerification verification;
  std::array<uint8_t, kAuditMacSize> last_mac{};
};

ChainState WalkChain(const std::filesystem::path& path, std::span<const uint8_t> key,
                     crypto::CryptoProvider& crypto) {
  ChainState state;
  std::ifstream in(path);
  if (!in) {
    state.verification.error = "audit log unreadable";
    return state;
  }
  std::array<uint8_t, kAuditMacSize> previous{};
  uint64_t seq = 0;
  uint64_t line_no = 0;
  std::string line;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) {
      continue;
    }
    auto fail = [&](std::string message) {
      state.verification.ok = false;
      state.verification.failed_line = line_no;
      state.verification.entries = seq;
      state.verification.error = std::move(message);
      return state;
    };
    if (line.size() > kMaxEventBytes + 256) {
      return fail("line exceeds size limit");
    }
    std::string_view view(line);
    auto mac_pos = view.find(kMacMarker);
    if (mac_pos == std::string_view::npos) {
      return fail("missing audit_mac");
    }
    auto mac_start = mac_pos + kMacMarker.size();
    auto mac_end = view.find('"', mac_start);
    if (mac_end == std::string_view::npos) {
      return fail("unterminated audit_mac");
    }
    auto parsed = crypto::HexDecode(view.substr(mac_start, mac_end - mac_start));
    if (!parsed || parsed->size() != kAuditMacSize) {
      return fail("malformed audit_mac");
    }
    size_t prev_end = 0;
    auto parsed_prev = ParseNumberAfter(view, kPrevMarker, 0, &prev_end);
    if (!parsed_prev) {
      return fail("missing audit_prev_count");
    }
    auto parsed_seq = ParseNumberAfter(view, kSeqMarker, prev_end, nullptr);
    if (!parsed_seq) {
      return fail("missing audit_seq");
    }
    if (*parsed_prev != seq || *parsed_seq != seq + 1) {
      return fail("sequence discontinuity");
    }
    std::string canonical(view.substr(0, mac_pos));
    canonical.push_back('}');
    auto expected = ChainedMac(crypto, key, previous, seq, seq + 1, canonical);
    if (!crypto::ct::BytesEqual(expected, *parsed)) {
      return fail("audit_mac mismatch");
    }
    previous = expected;
    seq += 1;
  }
  if (in.bad()) {
    state.verification.error = "audit log read failed";
    state.verification.entries = seq;
    return state;
  }
  state.verification.ok = true;
  state.verification.entries = seq;
  state.last_mac = previous;
  return state;
}

} // namespace

std::string HashForTelemetry(std::string_view input) {
  if (input.empty()) {
    return "";
  }
  crypto::OpenSSLCryptoProvider provider;
  return crypto::Sha256Hex(provider, input);
}

const char* SeverityToString(EventSeverity severity) {
  switch (severity) {
  case EventSeverity::kDebug:
    return "debug";
  case EventSeverity::kInfo:
    return "info";
  case EventSeverity::kWarning:
    return "warning";
  case EventSeverity::kError:
    return "error";
  case EventSeverity::kCritical:
    return "critical";
  }
  return "info";
}

const char* CategoryToString(EventCategory category) {
  switch (category) {
  case EventCategory::kTelemetry:
    return "telemetry";
  case EventCategory::kLifecycle:
    return "lifecycle";
  case EventCategory::kSecurity:
    return "security";
  case EventCategory::kDiagnostics:
    return "diagnostics";
  }
  return "diagnostics";
}

JsonLineLogger::JsonLineLogger(AuditLogOptions options,
                               std::shared_ptr<crypto::CryptoProvider> crypto)
    : options_(std::move(options)), crypto_(std::move(crypto)) {
  if (!crypto_) {
    crypto_ = crypto::MakeOpenSSLCryptoProvider();
  }
  if (options_.key.empty()) {
    options_.key.resize(kAuditMacSize);
    crypto_->RandomBytes(options_.key);
  }
  if (options_.max_files == 0) {
    options_.max_files = 1;
  }
  last_mac_.fill(0);

  auto parent = options_.path.parent_path();
  std::error_code ec;
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw Error{ErrorDomain::IO, errors::io::kAuditLogDirFailed,
                  "Failed to create audit log directory " + parent.string() + ": " + ec.message(),
                  ec.value(), Retryability::kRetryable};
    }
  }

  const bool exists = std::filesystem::exists(options_.path, ec);
  if (exists && !ec) {
    auto state = WalkChain(options_.path, options_.key, *crypto_);
    if (state.verification.ok) {
      entry_counter_ = state.verification.entries;
      last_mac_ = state.last_mac;
    } else {
      std::clog << "{\"event\":\"logger_integrity_failure\",\"message\":\"existing audit log does not "
                   "verify with the configured key; rotating\"}"
                << std::endl;
      std::lock_guard<std::mutex> guard(mutex_);
      RotateLocked();
    }
  }
}

std::vector<uint8_t> JsonLineLogger::key() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return options_.key;
}

uint64_t JsonLineLogger::EntryCount() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return entry_counter_;
}

std::string JsonLineLogger::FormatTimestamp(std::chrono::system_clock::time_point tp) {
  return FormatUtcTimestamp(tp);
}

void JsonLineLogger::EnsureOpen() {
  if (stream_.is_open()) {
    return;
  }
  stream_.open(options_.path, std::ios::out | std::ios::app);
}

std::array<uint8_t, kAuditMacSize> JsonLineLogger::ComputeChainedMac(uint64_t previous_count,
                                                                     uint64_t sequence,
                                                                     std::string_view canonical) {
  return ChainedMac(*crypto_, options_.key, last_mac_, previous_count, sequence, canonical);
}

void JsonLineLogger::RotateLocked() {
  if (stream_.is_open()) {
    stream_.close();
  }
  const auto& log_path = options_.path;
  for (size_t idx = options_.max_files; idx > 0; --idx) {
    std::filesystem::path src =
        idx == 1 ? log_path : std::filesystem::path(log_path.string() + "." + std::to_string(idx - 1));
    std::filesystem::path dst = std::filesystem::path(log_path.string() + "." + std::to_string(idx));
    std::error_code rotate_ec;
    const bool source_exists = std::filesystem::exists(src, rotate_ec);
    if (rotate_ec) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"audit log rotation stat failed\",\"error_code\":"
                << rotate_ec.value() << "}" << std::endl;
      continue;
    }
    if (!source_exists) {
      continue;
    }
    std::filesystem::remove(dst, rotate_ec);
    if (rotate_ec) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"audit log rotation cleanup failed\",\"error_code\":"
                << rotate_ec.value() << "}" << std::endl;
      rotate_ec.clear();
    }
    std::filesystem::rename(src, dst, rotate_ec);
    if (rotate_ec) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"audit log rotate rename failed\",\"error_code\":"
                << rotate_ec.value() << "}" << std::endl;
    }
  }
  // Each file carries its own chain so it verifies on its own.
  entry_counter_ = 0;
  last_mac_.fill(0);
}

void JsonLineLogger::RotateIfNeeded(size_t incoming_bytes) {
  std::error_code ec;
  auto current_size = std::filesystem::file_size(options_.path, ec);
  if (ec) {
    current_size = 0;
  }
  if (current_size == 0 || current_size + incoming_bytes <= options_.max_bytes) {
    return;
  }
  RotateLocked();
}

void JsonLineLogger::Log(const Event& event) {
  std::lock_guard<std::mutex> guard(mutex_);
  auto timestamp = FormatTimestamp(std::chrono::system_clock::now());
  auto base = BuildEventJson(event, timestamp);
  if (base.size() > kMaxEventBytes) {
    base = BuildEventJson(BuildOversizeEvent(event), timestamp);
  }

  // A rotation triggered by this line resets the chain, so build the chained
  // suffix afterwards.
  RotateIfNeeded(base.size() + 128);

  const uint64_t previous_count = entry_counter_;
  const uint64_t next_sequence = previous_count + 1;
  std::string prefix = base.substr(0, base.size() - 1);
  prefix.append(",\"audit_prev_count\":");
  prefix.append(std::to_string(previous_count));
  prefix.append(",\"audit_seq\":");
  prefix.append(std::to_string(next_sequence));
  std::string canonical = prefix;
  canonical.push_back('}');
  auto mac = ComputeChainedMac(previous_count, next_sequence, canonical);
  std::string line = prefix;
  line.append(kMacMarker);
  line.append(crypto::HexEncode(mac));
  line.append("\"}");

  EnsureOpen();
  if (!stream_.is_open()) {
    ++dropped_streak_;
    if (dropped_streak_ == 1) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"failed to open log file\"}" << std::endl;
    }
    return;
  }
  stream_ << line << '\n';
  stream_.flush();
  if (!stream_) {
    std::clog << "{\"event\":\"logger_error\",\"message\":\"audit log write failed\"}" << std::endl;
    stream_.close();
    return;
  }
  last_mac_ = mac;
  entry_counter_ = next_sequence;
  dropped_streak_ = 0;
}

AuditVerification VerifyAuditLog(const std::filesystem::path& path, std::span<const uint8_t> key,
                                 crypto::CryptoProvider& crypto) {
  return WalkChain(path, key, crypto).verification;
}

EventBus::EventBus(std::shared_ptr<JsonLineLogger> logger) : logger_(std::move(logger)) {
  if (logger_) {
    auto initial = std::make_shared<SubscriberList>();
    auto sink = logger_;
    initial->push_back([sink](const Event& e) { sink->Log(e); });
    std::lock_guard<std::mutex> guard(subscribers_mutex_);
    std::atomic_store_explicit(&subscribers_snapshot_, std::const_pointer_cast<const SubscriberList>(initial),
                               std::memory_order_release);
  }
}

void EventBus::Publish(const Event& event) {
  static thread_local bool in_publish = false;
  if (in_publish) {
    std::clog << "{\"event\":\"event_bus_reentrancy\",\"message\":\"recursive publish suppressed\"}"
              << std::endl;
    return;
  }
  PublishReentrancyGuard guard(in_publish);
  auto targets = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  if (!targets) {
    return;
  }
  for (const auto& subscriber : *targets) {
    if (subscriber) {
      subscriber(event);
    }
  }
}

void EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  auto current = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  auto updated = current ? std::make_shared<SubscriberList>(*current) : std::make_shared<SubscriberList>();
  updated->push_back(std::move(fn));
  std::atomic_store_explicit(&subscribers_snapshot_, std::const_pointer_cast<const SubscriberList>(updated),
                             std::memory_order_release);
}

void PublishSafely(EventBus& bus, const Event& event) noexcept {
  try {
    bus.Publish(event);
  } catch (const std::exception& ex) {
    try {
      std::clog << "{\"event\":\"event_publish_failed\",\"event_id\":\"" << EscapeJson(event.event_id)
                << "\",\"message\":\"" << EscapeJson(ex.what()) << "\"}" << std::endl;
    } catch (const std::exception&) {
      // clog is the last resort; nothing further to report to.
    }
  }
}

} // namespace warden::orchestrator
