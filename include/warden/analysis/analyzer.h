#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "warden/crypto/provider.h"

namespace warden::analysis {

inline constexpr int kMaxComplexityScore = 100;
inline constexpr int kMaxLoopDepth = 3;
inline constexpr size_t kDefaultAnalysisCacheEntries = 256;

struct AnalysisResult {
  bool is_safe{false};
  std::vector<std::string> issues;
  std::vector<std::string> warnings;
  std::vector<std::string> blocked_constructs;
  std::vector<std::string> detected_imports;
  // Sorted and unique.
  std::vector<std::string> detected_permissions;
  int complexity_score{0};

  nlohmann::json ToJson() const;
  bool operator==(const AnalysisResult&) const = default;
};

// Deny lists applied to call and attribute nodes.
const std::vector<std::string>& BlockedCalls();
const std::vector<std::string>& BlockedAttributes();
// Single-underscore names and mangled privates; dunders are judged by the
// deny list instead.
bool IsPrivateAttribute(std::string_view name);
// Permission required by a base module name, if any.
std::optional<std::string> PermissionForModule(std::string_view module);

// Walks the syntax tree of plugin source. Stateless; safe to share.
class CodeAnalyzer {
public:
  // Extra modules are merged with the default block list.
  explicit CodeAnalyzer(std::vector<std::string> extra_blocked_modules = {});

  AnalysisResult Analyze(std::string_view code) const;

  const std::vector<std::string>& blocked_modules() const noexcept { return blocked_modules_; }

private:
  std::vector<std::string> blocked_modules_;
};

// LRU-bounded memo of analysis results keyed by SHA-256 of code plus block
// list. Lookups take a shared lock; recency is tracked with an atomic tick.
class AnalysisCache {
public:
  explicit AnalysisCache(size_t capacity = kDefaultAnalysisCacheEntries,
                         std::shared_ptr<crypto::CryptoProvider> crypto = nullptr);

  AnalysisCache(const AnalysisCache&) = delete;
  AnalysisCache& operator=(const AnalysisCache&) = delete;

  AnalysisResult Analyze(std::string_view code, const std::vector<std::string>& extra_blocked_modules = {});

  size_t size() const;
  size_t capacity() const noexcept { return capacity_; }
  uint64_t hits() const noexcept { return hits_.load(); }
  uint64_t misses() const noexcept { return misses_.load(); }

private:
  struct Entry {
    AnalysisResult result;
    std::atomic<uint64_t> last_used{0};
  };

  std::string KeyFor(std::string_view code, const std::vector<std::string>& blocked) const;
  void EvictOldestLocked();

  size_t capacity_;
  std::shared_ptr<crypto::CryptoProvider> crypto_;
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;
  std::atomic<uint64_t> tick_{0};
  std::atomic<uint64_t> hits_{0};
  std::atomic<uint64_t> misses_{0};
};

}  // namespace warden::analysis
