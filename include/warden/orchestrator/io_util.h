#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <span>
#include <string>
#include <string_view>

#include "warden/error.h"

namespace warden::orchestrator {

struct AtomicReplaceHooks {
  std::function<void(const std::filesystem::path&, const std::filesystem::path&)> before_rename;
};

// Performs an atomic replace of the target file by writing the payload to a
// temporary file on the same filesystem, syncing it to disk, then renaming it
// into place. The file is created with mode 0600.
void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks = {});

inline void AtomicReplace(const std::filesystem::path& target, std::string_view text) {
  AtomicReplace(target, std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

// Throws an IO error naming the path when the file cannot be read.
std::string ReadTextFile(const std::filesystem::path& path);

// Owns a mode 0700 directory created with mkdtemp; removed recursively on destruction.
class PrivateTempDir {
public:
  explicit PrivateTempDir(std::string_view prefix);
  ~PrivateTempDir();

  PrivateTempDir(const PrivateTempDir&) = delete;
  PrivateTempDir& operator=(const PrivateTempDir&) = delete;

  const std::filesystem::path& path() const noexcept { return path_; }

private:
  std::filesystem::path path_;
};

}  // namespace warden::orchestrator
