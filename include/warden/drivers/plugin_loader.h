#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "warden/trust/signing.h"

namespace warden::drivers {

enum class PluginKind : uint8_t { kValidator, kReporter, kPlugin };

const char* PluginKindToString(PluginKind kind);
std::optional<PluginKind> ParsePluginKind(std::string_view text);

// Fields already extracted from a plugin package.
struct PluginManifest {
  std::string id;
  std::string name;
  std::string version;
  PluginKind kind{PluginKind::kPlugin};
  std::string code;
  std::string template_text;
  std::vector<std::string> permissions;
  std::vector<trust::SignatureInfo> signatures;

  // Bytes covered by the signatures: the code, or the template for
  // template-only reporters.
  std::string_view SignedPayload() const noexcept;
  nlohmann::json ToJson() const;
};

class PluginLoader {
public:
  virtual ~PluginLoader() = default;

  // Throws Error(Validation) when the plugin is unknown or malformed.
  virtual PluginManifest Load(std::string_view plugin_id) = 0;
  virtual std::vector<std::string> List() = 0;
};

class InMemoryPluginLoader : public PluginLoader {
public:
  void Add(PluginManifest manifest);

  PluginManifest Load(std::string_view plugin_id) override;
  std::vector<std::string> List() override;

private:
  std::mutex mutex_;
  std::map<std::string, PluginManifest, std::less<>> plugins_;
};

// Reads <root>/<id>/manifest.conf:
//
//   id=<id>
//   name=<display name>
//   version=<version>
//   kind=validator|reporter|plugin
//   code_file=<relative path>
//   template_file=<relative path>
//   permission=<name>                       (repeatable)
//   signature=<alg>:<signer>:<hex>[:<unix>] (repeatable)
class DirectoryPluginLoader : public PluginLoader {
public:
  explicit DirectoryPluginLoader(std::filesystem::path root);

  PluginManifest Load(std::string_view plugin_id) override;
  std::vector<std::string> List() override;

private:
  std::filesystem::path root_;
};

inline constexpr const char* kManifestFileName = "manifest.conf";

// Loads a single plugin directory (the one containing manifest.conf).
PluginManifest LoadPluginDirectory(const std::filesystem::path& directory);

}  // namespace warden::drivers
